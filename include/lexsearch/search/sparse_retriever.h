#pragma once

#include <lexsearch/core/types.h>
#include <lexsearch/search/bm25_index.h>
#include <lexsearch/search/search_types.h>

#include <memory>
#include <string>
#include <vector>

namespace lexsearch::search {

struct SparseHit {
    std::string id;
    std::string text;
    SourceMetadata metadata;
    double score = 0.0;
};

/**
 * @brief Keyword retrieval stage
 *
 * Implementations must be safe to call concurrently; the pipeline shares one
 * instance across requests.
 */
class ISparseRetriever {
public:
    virtual ~ISparseRetriever() = default;

    /**
     * @brief Score documents against a tokenized query
     *
     * @param queryTokens Output of Bm25Index::tokenize for the query
     * @param densePool Candidates already returned by dense retrieval
     * @param topN Maximum number of hits
     * @return Hits with a positive keyword score, best first
     */
    virtual Result<std::vector<SparseHit>> search(const std::vector<std::string>& queryTokens,
                                                  const std::vector<Candidate>& densePool,
                                                  size_t topN) = 0;
};

/**
 * Builds a BM25 index over the dense candidate pool for every request.
 */
class CandidatePoolBm25Retriever : public ISparseRetriever {
public:
    CandidatePoolBm25Retriever() = default;
    explicit CandidatePoolBm25Retriever(Bm25Index::Params params) : params_(params) {}

    Result<std::vector<SparseHit>> search(const std::vector<std::string>& queryTokens,
                                          const std::vector<Candidate>& densePool,
                                          size_t topN) override;

private:
    Bm25Index::Params params_;
};

/**
 * Queries a precomputed index shared read-only by all requests. Hits may name
 * documents the dense stage did not return.
 */
class StaticBm25Retriever : public ISparseRetriever {
public:
    explicit StaticBm25Retriever(std::shared_ptr<const Bm25Index> index)
        : index_(std::move(index)) {}

    Result<std::vector<SparseHit>> search(const std::vector<std::string>& queryTokens,
                                          const std::vector<Candidate>& densePool,
                                          size_t topN) override;

private:
    std::shared_ptr<const Bm25Index> index_;
};

} // namespace lexsearch::search
