#pragma once

#include <lexsearch/search/search_types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lexsearch::search {

struct SparseDocument {
    std::string id;
    std::string text;
    SourceMetadata metadata;
};

/**
 * @brief Okapi BM25 keyword index over a fixed document set
 *
 * Immutable after construction; scoring is const and safe to call from many
 * threads. Terms whose idf would be negative (present in more than half of the
 * documents) are floored to `epsilon * average idf`, and final scores are
 * clamped at 0 so callers always see non-negative keyword scores.
 */
class Bm25Index {
public:
    struct Params {
        double k1 = 1.5;
        double b = 0.75;
        double epsilon = 0.25;
    };

    struct Hit {
        size_t document; // index into documents()
        double score;
    };

    explicit Bm25Index(std::vector<SparseDocument> documents);
    Bm25Index(std::vector<SparseDocument> documents, Params params);

    // Lowercased maximal [a-z0-9] runs; everything else separates tokens.
    static std::vector<std::string> tokenize(std::string_view text);

    // Score every document, keep those with a positive score, best first
    // (ties by document id), at most topN of them.
    std::vector<Hit> search(const std::vector<std::string>& queryTokens, size_t topN) const;

    double score(const std::vector<std::string>& queryTokens, size_t document) const;

    const std::vector<SparseDocument>& documents() const { return documents_; }
    size_t size() const { return documents_.size(); }
    double averageDocumentLength() const { return avgDocLength_; }
    double idf(const std::string& term) const;

private:
    void build();

    Params params_;
    std::vector<SparseDocument> documents_;
    std::vector<std::unordered_map<std::string, size_t>> termFrequencies_;
    std::vector<size_t> docLengths_;
    std::unordered_map<std::string, double> idf_;
    double avgDocLength_ = 0.0;
};

} // namespace lexsearch::search
