#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lexsearch::citation {

/**
 * @brief A volume-reporter-page citation found in passage text
 *
 * `reporter` is the canonical abbreviation (e.g. "U.S.", "F.3d"), independent
 * of the spacing used in the source text. `normalizedUrl` depends only on the
 * canonical triple and the configured lookup base URL.
 */
struct CitationMatch {
    std::string rawText;
    std::string reporter;
    std::uint32_t volume = 0;
    std::uint32_t page = 0;
    std::string normalizedUrl;
    std::string family;   // reporter family that matched ("supreme_court", ...)
    size_t position = 0;  // byte offset of rawText in the passage

    bool sameCitation(const CitationMatch& other) const {
        return reporter == other.reporter && volume == other.volume && page == other.page;
    }
};

} // namespace lexsearch::citation
