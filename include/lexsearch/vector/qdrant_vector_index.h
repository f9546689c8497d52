#pragma once

#include <lexsearch/net/http_client.h>
#include <lexsearch/vector/vector_index.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace lexsearch::vector {

struct QdrantConfig {
    std::string url = "http://localhost:6333";
    std::string apiKey;
    std::string contractsCollection = "legal_contracts";
    std::string casesCollection = "legal_cases";
    std::chrono::milliseconds timeout{5000};
};

/**
 * @brief Qdrant REST adapter
 *
 * Issues `POST /collections/{name}/points/search` with payloads enabled.
 * Passage text is read from the `text` payload field and the chunk id from
 * `chunk_id` (falling back to "<collection>:<point id>"); the remaining scalar
 * payload fields become metadata.
 */
class QdrantVectorIndex : public IVectorIndex {
public:
    QdrantVectorIndex(std::shared_ptr<net::IHttpClient> http, QdrantConfig config);

    Result<VectorSearchResult> search(const std::vector<float>& embedding, size_t topN,
                                      search::CollectionScope scope,
                                      const search::SearchFilters& filters) override;

    // Request body for one collection search.
    static nlohmann::json buildSearchRequest(const std::vector<float>& embedding, size_t topN,
                                             const search::SearchFilters& filters);

    // Parse a search response into hits tagged with the collection name.
    static Result<std::vector<VectorHit>> parseSearchResponse(const nlohmann::json& body,
                                                              const std::string& collection);

private:
    Result<std::vector<VectorHit>> searchCollection(const std::string& collection,
                                                    const nlohmann::json& request);

    std::shared_ptr<net::IHttpClient> http_;
    QdrantConfig config_;
};

} // namespace lexsearch::vector
