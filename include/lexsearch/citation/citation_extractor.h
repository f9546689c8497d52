#pragma once

#include <lexsearch/citation/citation_match.h>

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace lexsearch::citation {

/**
 * @brief A reporter known to the extractor
 *
 * `canonical` is the abbreviation reported on matches, `slug` the path segment
 * expected by the citation lookup service.
 */
struct ReporterInfo {
    std::string_view canonical;
    std::string_view slug;
    std::string_view family;
};

// All known reporters, grouped by family in matching order.
const std::vector<ReporterInfo>& knownReporters();

// Resolve a reporter abbreviation as written in text ("S.Ct.", "F. 3d", ...).
std::optional<ReporterInfo> lookupReporter(std::string_view abbreviation);

struct CitationExtractorConfig {
    size_t maxPerPassage = 3;
    std::string lookupBaseUrl = "https://www.courtlistener.com/c/";
};

enum class HighlightFormat { Markdown, Html, Plain };

struct CaseName {
    std::string plaintiff;
    std::string defendant;
    std::string fullName;
};

/**
 * @brief Finds volume-reporter-page citations in passage text
 *
 * Reporter families are tried in a fixed order (Supreme Court, Federal
 * Supplement, Federal Reporter, regional, state). Overlapping matches are
 * resolved in favour of the earliest, then longest, span. Matches are
 * deduplicated on the canonical (reporter, volume, page) triple in
 * first-occurrence order and capped at `maxPerPassage`.
 *
 * The extractor never contacts the lookup service: URLs are built from the
 * canonical triple only, and a URL existing says nothing about whether the
 * cited opinion does.
 *
 * Instances are immutable after construction and may be shared across threads.
 */
class CitationExtractor {
public:
    CitationExtractor();
    explicit CitationExtractor(CitationExtractorConfig config);

    std::vector<CitationMatch> extract(std::string_view text) const;

    // Every match in text order, before deduplication and capping.
    std::vector<CitationMatch> extractAll(std::string_view text) const;

    std::string buildUrl(std::string_view slug, std::uint32_t volume, std::uint32_t page) const;

    // Rewrite every recognised citation as a link in the requested format.
    std::string highlight(std::string_view text, HighlightFormat format) const;

    // "Plaintiff v. Defendant" captions, at most five, in text order.
    std::vector<CaseName> extractCaseNames(std::string_view text) const;

    const CitationExtractorConfig& config() const { return config_; }

private:
    struct FamilyMatcher {
        std::string family;
        std::regex pattern;
    };

    CitationExtractorConfig config_;
    std::vector<FamilyMatcher> matchers_;
    std::regex caseNamePattern_;
};

std::optional<HighlightFormat> parseHighlightFormat(std::string_view value);

} // namespace lexsearch::citation
