#pragma once

#include <lexsearch/search/search_types.h>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lexsearch::query {

enum class QueryType { StatuteLimitations, Contract, Tort, Property, Employment, General };

inline constexpr const char* queryTypeToString(QueryType type) noexcept {
    switch (type) {
        case QueryType::StatuteLimitations:
            return "statute_limitations";
        case QueryType::Contract:
            return "contract";
        case QueryType::Tort:
            return "tort";
        case QueryType::Property:
            return "property";
        case QueryType::Employment:
            return "employment";
        case QueryType::General:
            return "general";
    }
    return "general";
}

struct ProcessedQuery {
    std::string text;     // text used for embedding and keyword retrieval
    QueryType type = QueryType::General;
    std::optional<std::string> jurisdiction;
};

/**
 * @brief Normalizes, expands and classifies legal research queries
 *
 * Expansion rewrites uppercase legal abbreviations ("MSJ", "SOL", "K") into
 * their long forms and appends related doctrine terms for a few well-known
 * phrases. Classification and jurisdiction detection are keyword based and
 * return the first matching category in a fixed order.
 *
 * All patterns are compiled once at construction; the object is immutable and
 * may be shared across threads.
 */
class QueryPreprocessor {
public:
    QueryPreprocessor();

    // Collapse runs of whitespace into single spaces and trim.
    static std::string normalizeWhitespace(std::string_view text);

    std::string expand(std::string_view text) const;

    QueryType classify(std::string_view text) const;

    std::optional<std::string> detectJurisdiction(std::string_view text) const;

    // Contract queries go to the contracts collection, everything else to cases.
    static search::CollectionScope route(QueryType type);

    /**
     * @brief Prepare a query for retrieval
     *
     * @param text Raw user query
     * @param expandTerms Apply abbreviation and synonym expansion
     * @return Retrieval text plus the detected type and jurisdiction. The type
     *         is computed on the retrieval text so an expanded "K" counts as a
     *         contract query.
     */
    ProcessedQuery process(std::string_view text, bool expandTerms) const;

private:
    struct Abbreviation {
        std::regex pattern;
        std::string expansion;
    };
    struct Synonym {
        std::regex trigger;
        std::vector<std::string> terms;
    };

    std::vector<Abbreviation> abbreviations_;
    std::vector<Synonym> synonyms_;
    std::vector<std::pair<QueryType, std::regex>> typePatterns_;
    std::vector<std::pair<std::string, std::regex>> jurisdictionPatterns_;
};

} // namespace lexsearch::query
