#pragma once

#include <lexsearch/citation/citation_match.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lexsearch::search {

// id -> raw score for one retrieval signal
using ScoreMap = std::unordered_map<std::string, double>;

inline constexpr double kDefaultAlpha = 0.7;

/**
 * @brief Descriptive metadata attached to a passage by the index
 */
struct SourceMetadata {
    std::string title;
    std::string court;
    std::string date;
    std::string collection;
    std::map<std::string, std::string> extra;
};

/**
 * @brief One document chunk flowing through the pipeline
 *
 * Scores are appended stage by stage. `rerankScore` is only present for
 * candidates inside the reranked window.
 */
struct Candidate {
    std::string id;
    std::string text;
    SourceMetadata metadata;

    double denseScore = 0.0;  // raw similarity from the vector index
    double sparseScore = 0.0; // raw BM25 score
    double fusedScore = 0.0;  // normalized combination, always in [0, 1]
    std::optional<double> rerankScore;

    double authoritativeScore() const { return rerankScore.value_or(fusedScore); }
};

enum class CollectionScope { Contracts, Cases, Both, Auto };

inline constexpr const char* collectionScopeToString(CollectionScope scope) noexcept {
    switch (scope) {
        case CollectionScope::Contracts:
            return "contracts";
        case CollectionScope::Cases:
            return "cases";
        case CollectionScope::Both:
            return "both";
        case CollectionScope::Auto:
            return "auto";
    }
    return "both";
}

std::optional<CollectionScope> parseCollectionScope(std::string_view value);

/**
 * @brief Per-request stage toggles
 */
struct FeatureFlags {
    bool useHybrid = true;
    bool useReranking = true;
    bool extractCitations = true;
    bool expandQuery = false; // abbreviation/synonym expansion before retrieval
};

/**
 * @brief Optional structured filters forwarded to the vector index
 *
 * Dates are ISO-8601 strings compared lexicographically.
 */
struct SearchFilters {
    std::optional<std::string> court;
    std::optional<std::string> dateFrom;
    std::optional<std::string> dateTo;

    bool empty() const { return !court && !dateFrom && !dateTo; }
};

struct QueryRequest {
    std::string queryText;
    CollectionScope collectionScope = CollectionScope::Both;
    int resultLimit = 5;
    FeatureFlags flags;
    SearchFilters filters;
    std::optional<double> alpha; // overrides the configured dense weight
};

/**
 * @brief Stages that were skipped or fell back during a request
 */
struct DegradedFlags {
    bool retrieval = false; // one of several collections failed
    bool sparse = false;
    bool reranking = false;
    bool citations = false;
    std::vector<std::string> reasons;

    bool any() const { return retrieval || sparse || reranking || citations; }
};

struct QueryInfo {
    std::string processedQuery;
    CollectionScope resolvedScope = CollectionScope::Both;
    std::string queryType = "general";
    std::optional<std::string> jurisdiction;
};

/**
 * @brief Response of RetrievalPipeline::search
 *
 * When citation extraction ran, `citations[i]` belongs to `rankedCandidates[i]`;
 * when it was disabled `citations` is empty.
 */
struct ResultEnvelope {
    std::vector<Candidate> rankedCandidates;
    std::vector<std::vector<citation::CitationMatch>> citations;
    std::map<std::string, int64_t> stageTimingMicros;
    int64_t totalTimeMicros = 0;
    size_t totalCandidates = 0; // before truncation
    DegradedFlags degraded;
    QueryInfo query;

    bool hasResults() const { return !rankedCandidates.empty(); }
};

} // namespace lexsearch::search
