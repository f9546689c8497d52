#include <lexsearch/query/query_preprocessor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lexsearch::query {

namespace {

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

} // namespace

QueryPreprocessor::QueryPreprocessor() {
    // Abbreviations are matched in upper case only; "sol" or "pi" written in
    // lower case are ordinary words.
    const std::vector<std::pair<const char*, const char*>> abbreviations = {
        {"K", "contract"},
        {"P", "plaintiff"},
        {"D", "defendant"},
        {"SOL", "statute of limitations"},
        {"MSJ", "motion for summary judgment"},
        {"MTD", "motion to dismiss"},
        {"MTS", "motion to suppress"},
        {"MTC", "motion to compel"},
        {"SJ", "summary judgment"},
        {"DJ", "declaratory judgment"},
        {"PI", "preliminary injunction"},
        {"TRO", "temporary restraining order"},
        {"FRCP", "federal rules of civil procedure"},
        {"FRE", "federal rules of evidence"},
    };
    for (const auto& [abbr, full] : abbreviations) {
        abbreviations_.push_back(
            Abbreviation{std::regex(std::string("\\b") + abbr + "\\b"), full});
    }

    const std::vector<std::pair<const char*, const char*>> synonyms = {
        {"\\bmotion to suppress\\b", "exclusionary rule fourth amendment"},
        {"\\bconsent search\\b", "warrantless search fourth amendment"},
        {"\\bbreach of contract\\b", "contract violation"},
        {"\\bqualified immunity\\b", "government immunity"},
        {"\\bsummary judgment\\b", "no genuine issue material fact"},
        {"\\bnegligence\\b", "duty breach causation damages"},
        {"\\bveil piercing\\b", "alter ego corporate veil"},
    };
    for (const auto& [trigger, extra] : synonyms) {
        Synonym syn{std::regex(trigger, kIcase), {}};
        std::istringstream words(extra);
        for (std::string w; words >> w;) {
            syn.terms.push_back(w);
        }
        synonyms_.push_back(std::move(syn));
    }

    typePatterns_.emplace_back(QueryType::StatuteLimitations, std::regex("statute of limitations"));
    typePatterns_.emplace_back(QueryType::Contract,
                               std::regex("contract|agreement|indemnification|warranty"));
    typePatterns_.emplace_back(QueryType::Tort, std::regex("negligence|liability|damages|injury"));
    typePatterns_.emplace_back(QueryType::Property,
                               std::regex("property|landlord|tenant|lease|eviction"));
    typePatterns_.emplace_back(QueryType::Employment,
                               std::regex("employment|discrimination|wrongful termination"));

    jurisdictionPatterns_.emplace_back("california", std::regex("california|\\bca\\b"));
    jurisdictionPatterns_.emplace_back("new york", std::regex("new york|\\bny\\b"));
    jurisdictionPatterns_.emplace_back("texas", std::regex("texas|\\btx\\b"));
    jurisdictionPatterns_.emplace_back("florida", std::regex("florida|\\bfl\\b"));
    jurisdictionPatterns_.emplace_back("federal", std::regex("federal|\\bcircuit\\b"));
}

std::string QueryPreprocessor::normalizeWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string QueryPreprocessor::expand(std::string_view text) const {
    std::string query = normalizeWhitespace(text);

    for (const auto& abbr : abbreviations_) {
        query = std::regex_replace(query, abbr.pattern, abbr.expansion);
    }

    // Append related terms the query does not already mention.
    for (const auto& syn : synonyms_) {
        if (!std::regex_search(query, syn.trigger)) {
            continue;
        }
        for (const auto& term : syn.terms) {
            if (toLower(query).find(term) == std::string::npos) {
                query += ' ';
                query += term;
            }
        }
    }
    return query;
}

QueryType QueryPreprocessor::classify(std::string_view text) const {
    const std::string lower = toLower(text);
    for (const auto& [type, pattern] : typePatterns_) {
        if (std::regex_search(lower, pattern)) {
            return type;
        }
    }
    return QueryType::General;
}

std::optional<std::string> QueryPreprocessor::detectJurisdiction(std::string_view text) const {
    const std::string lower = toLower(text);
    for (const auto& [name, pattern] : jurisdictionPatterns_) {
        if (std::regex_search(lower, pattern)) {
            return name;
        }
    }
    return std::nullopt;
}

search::CollectionScope QueryPreprocessor::route(QueryType type) {
    return type == QueryType::Contract ? search::CollectionScope::Contracts
                                       : search::CollectionScope::Cases;
}

ProcessedQuery QueryPreprocessor::process(std::string_view text, bool expandTerms) const {
    ProcessedQuery out;
    out.text = expandTerms ? expand(text) : normalizeWhitespace(text);
    out.type = classify(out.text);
    out.jurisdiction = detectJurisdiction(text);
    if (expandTerms) {
        spdlog::debug("Expanded query '{}' -> '{}' ({})", text, out.text, queryTypeToString(out.type));
    }
    return out;
}

} // namespace lexsearch::query
