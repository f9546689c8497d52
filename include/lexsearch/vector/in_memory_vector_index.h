#pragma once

#include <lexsearch/vector/vector_index.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lexsearch::vector {

struct VectorRecord {
    std::string id;
    std::string text;
    std::vector<float> embedding;
    search::SourceMetadata metadata;
    search::CollectionScope collection = search::CollectionScope::Cases;
};

/**
 * @brief Brute-force cosine index over a fixed set of records
 *
 * Used for offline corpora and tests. Immutable after construction.
 */
class InMemoryVectorIndex : public IVectorIndex {
public:
    explicit InMemoryVectorIndex(std::vector<VectorRecord> records);

    /**
     * @brief Load records from a JSON-lines file
     *
     * Each line is an object with `id`, `text`, `embedding` (array of numbers)
     * and `collection`, plus optional `title`, `case_name`, `filename`, `court`,
     * `date` or `date_filed`. `collection` is "contracts"/"cases" or one of the
     * two configured collection names. All embeddings must share one dimension.
     */
    static Result<std::shared_ptr<InMemoryVectorIndex>>
    loadJsonLines(const std::filesystem::path& path,
                  const std::string& contractsCollection = "legal_contracts",
                  const std::string& casesCollection = "legal_cases");

    Result<VectorSearchResult> search(const std::vector<float>& embedding, size_t topN,
                                      search::CollectionScope scope,
                                      const search::SearchFilters& filters) override;

    size_t size() const { return records_.size(); }
    size_t dimension() const { return dimension_; }

private:
    std::vector<VectorRecord> records_;
    size_t dimension_ = 0;
};

// True when metadata satisfies every filter that is set.
bool matchesFilters(const search::SourceMetadata& metadata, const search::SearchFilters& filters);

} // namespace lexsearch::vector
