#pragma once

#include <lexsearch/citation/citation_extractor.h>
#include <lexsearch/config/pipeline_config.h>
#include <lexsearch/core/types.h>
#include <lexsearch/query/query_preprocessor.h>
#include <lexsearch/search/reranker.h>
#include <lexsearch/search/search_types.h>
#include <lexsearch/search/sparse_retriever.h>
#include <lexsearch/vector/embedding_provider.h>
#include <lexsearch/vector/vector_index.h>

#include <atomic>
#include <cstdint>
#include <memory>

namespace boost::asio {
class thread_pool;
}

namespace lexsearch::search {

/**
 * @brief Collaborators of the pipeline
 *
 * `embedder` and `vectorIndex` are required. A null `sparseRetriever` or
 * `reranker` makes the corresponding stage degrade whenever a request asks for
 * it. Null `citationExtractor`, `preprocessor` and `executor` are replaced by
 * defaults built from the pipeline configuration.
 */
struct PipelineDependencies {
    std::shared_ptr<vector::IEmbeddingProvider> embedder;
    std::shared_ptr<vector::IVectorIndex> vectorIndex;
    std::shared_ptr<ISparseRetriever> sparseRetriever;
    std::shared_ptr<RerankerService> reranker;
    std::shared_ptr<const citation::CitationExtractor> citationExtractor;
    std::shared_ptr<const query::QueryPreprocessor> preprocessor;
    std::shared_ptr<boost::asio::thread_pool> executor;
};

/**
 * @brief Retrieval and ranking orchestrator
 *
 * Runs, per request:
 *   dense retrieval -> [sparse retrieval + fusion] -> [rerank]
 *   -> [citation extraction] -> truncation
 *
 * Only invalid requests (InvalidArgument) and an unreachable embedding
 * provider or vector index (UpstreamUnavailable) fail a request. Sparse,
 * rerank and citation failures are logged, the stage is skipped, and the
 * envelope carries the matching degraded flag.
 *
 * search() is const and may be called concurrently; requests share only the
 * read-only collaborators.
 */
class RetrievalPipeline {
public:
    struct Statistics {
        std::atomic<uint64_t> totalQueries{0};
        std::atomic<uint64_t> successfulQueries{0};
        std::atomic<uint64_t> rejectedQueries{0};
        std::atomic<uint64_t> failedQueries{0};
        std::atomic<uint64_t> degradedQueries{0};

        std::atomic<uint64_t> sparseFailures{0};
        std::atomic<uint64_t> rerankFailures{0};
        std::atomic<uint64_t> citationFailures{0};

        std::atomic<uint64_t> totalQueryTimeMicros{0};
    };

    RetrievalPipeline(PipelineDependencies deps, config::PipelineConfig config = {});
    ~RetrievalPipeline();

    RetrievalPipeline(const RetrievalPipeline&) = delete;
    RetrievalPipeline& operator=(const RetrievalPipeline&) = delete;

    /**
     * @brief Validate the configuration and collaborators, then build a pipeline
     */
    static Result<std::unique_ptr<RetrievalPipeline>> create(PipelineDependencies deps,
                                                             config::PipelineConfig config);

    /**
     * @brief Execute a query
     *
     * @return The ranked envelope, or InvalidArgument / UpstreamUnavailable /
     *         NotInitialized
     */
    Result<ResultEnvelope> search(const QueryRequest& request) const;

    // Checks a request against the configured limits without running it.
    Result<void> validateRequest(const QueryRequest& request) const;

    // Request with the configured default result limit.
    QueryRequest makeRequest(std::string queryText) const;

    const config::PipelineConfig& config() const;
    const Statistics& getStatistics() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace lexsearch::search
