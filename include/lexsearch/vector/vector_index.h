#pragma once

#include <lexsearch/core/types.h>
#include <lexsearch/search/search_types.h>

#include <string>
#include <vector>

namespace lexsearch::vector {

struct VectorHit {
    std::string id;
    std::string text;
    search::SourceMetadata metadata;
    double similarity = 0.0;
};

struct VectorSearchResult {
    std::vector<VectorHit> hits;               // best first
    std::vector<std::string> failedCollections; // collections skipped after an error
};

/**
 * @brief Dense retrieval over one or more document collections
 *
 * `Both` (and `Auto`, which callers should resolve first) searches every
 * collection and merges hits by similarity. A collection failure is reported
 * in `failedCollections` as long as at least one collection answered; when
 * none did the call returns UpstreamUnavailable.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    virtual Result<VectorSearchResult> search(const std::vector<float>& embedding, size_t topN,
                                              search::CollectionScope scope,
                                              const search::SearchFilters& filters) = 0;
};

// Cosine similarity; 0 when either vector is zero or the sizes differ.
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace lexsearch::vector
