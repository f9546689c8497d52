#include <lexsearch/citation/citation_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <unordered_map>
#include <unordered_set>

namespace lexsearch::citation {

namespace {

// Longer abbreviations precede their prefixes so alternation picks the full form.
const std::vector<ReporterInfo> kReporters = {
    {"U.S.", "us", "supreme_court"},
    {"S. Ct.", "sct", "supreme_court"},
    {"L. Ed. 2d", "l-ed-2d", "supreme_court"},
    {"L. Ed.", "l-ed", "supreme_court"},

    {"F. Supp. 3d", "f-supp-3d", "federal_supplement"},
    {"F. Supp. 2d", "f-supp-2d", "federal_supplement"},
    {"F. Supp.", "f-supp", "federal_supplement"},

    {"F.4th", "f4th", "federal_reporter"},
    {"F.3d", "f3d", "federal_reporter"},
    {"F.2d", "f2d", "federal_reporter"},
    {"F.", "f", "federal_reporter"},

    {"A.3d", "a3d", "regional"},
    {"A.2d", "a2d", "regional"},
    {"A.", "a", "regional"},
    {"P.3d", "p3d", "regional"},
    {"P.2d", "p2d", "regional"},
    {"P.", "p", "regional"},
    {"N.E.3d", "ne3d", "regional"},
    {"N.E.2d", "ne2d", "regional"},
    {"N.E.", "ne", "regional"},
    {"N.W.2d", "nw2d", "regional"},
    {"N.W.", "nw", "regional"},
    {"S.E.2d", "se2d", "regional"},
    {"S.E.", "se", "regional"},
    {"S.W.3d", "sw3d", "regional"},
    {"S.W.2d", "sw2d", "regional"},
    {"S.W.", "sw", "regional"},
    {"So. 3d", "so3d", "regional"},
    {"So. 2d", "so2d", "regional"},
    {"So.", "so", "regional"},

    {"Cal. Rptr. 3d", "cal-rptr-3d", "state"},
    {"Cal. Rptr. 2d", "cal-rptr-2d", "state"},
    {"Cal. Rptr.", "cal-rptr", "state"},
    {"N.Y.S.3d", "nys3d", "state"},
    {"N.Y.S.2d", "nys2d", "state"},
};

constexpr std::array<std::string_view, 5> kFamilyOrder = {
    "supreme_court", "federal_supplement", "federal_reporter", "regional", "state"};

constexpr std::array<std::string_view, 10> kSignalWords = {
    "In", "See", "Also", "Cf", "But", "Accord", "Compare", "Under", "Citing", "Following"};

std::string stripSpaces(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

// "F. Supp. 2d" -> F\.\s?Supp\.\s?2d ; a period directly followed by text
// also tolerates one space ("F.3d" matches "F. 3d").
std::string reporterPattern(std::string_view canonical) {
    std::string out;
    for (size_t i = 0; i < canonical.size(); ++i) {
        const char c = canonical[i];
        if (c == '.') {
            out += "\\.";
            if (i + 1 < canonical.size() && canonical[i + 1] != ' ') {
                out += "\\s?";
            }
        } else if (c == ' ') {
            out += "\\s?";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string familyPattern(std::string_view family) {
    std::string alternatives;
    for (const auto& r : kReporters) {
        if (r.family != family) {
            continue;
        }
        if (!alternatives.empty()) {
            alternatives += '|';
        }
        alternatives += reporterPattern(r.canonical);
    }
    // Bounded separators: std::regex recurses per repetition, so an unbounded
    // \s+ overflows the stack on long whitespace runs.
    return "\\b(\\d{1,4})\\s{1,3}(" + alternatives + ")\\s{1,3}(\\d{1,6})\\b";
}

std::uint32_t parseNumber(const std::string& digits) {
    std::uint32_t value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

std::string escapeHtml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string dropSignalWords(const std::string& party) {
    size_t pos = 0;
    while (pos < party.size()) {
        size_t end = party.find(' ', pos);
        std::string_view word(party.data() + pos,
                              (end == std::string::npos ? party.size() : end) - pos);
        if (std::find(kSignalWords.begin(), kSignalWords.end(), word) == kSignalWords.end()) {
            break;
        }
        if (end == std::string::npos) {
            return {};
        }
        pos = party.find_first_not_of(' ', end);
        if (pos == std::string::npos) {
            return {};
        }
    }
    return party.substr(pos);
}

} // namespace

const std::vector<ReporterInfo>& knownReporters() {
    return kReporters;
}

std::optional<ReporterInfo> lookupReporter(std::string_view abbreviation) {
    static const std::unordered_map<std::string, size_t> byKey = [] {
        std::unordered_map<std::string, size_t> m;
        for (size_t i = 0; i < kReporters.size(); ++i) {
            m.emplace(stripSpaces(kReporters[i].canonical), i);
        }
        return m;
    }();

    auto it = byKey.find(stripSpaces(abbreviation));
    if (it == byKey.end()) {
        return std::nullopt;
    }
    return kReporters[it->second];
}

std::optional<HighlightFormat> parseHighlightFormat(std::string_view value) {
    if (value == "markdown" || value == "md") {
        return HighlightFormat::Markdown;
    }
    if (value == "html") {
        return HighlightFormat::Html;
    }
    if (value == "plain" || value == "text") {
        return HighlightFormat::Plain;
    }
    return std::nullopt;
}

CitationExtractor::CitationExtractor() : CitationExtractor(CitationExtractorConfig{}) {}

CitationExtractor::CitationExtractor(CitationExtractorConfig config)
    : config_(std::move(config)),
      caseNamePattern_(R"(\b([A-Z][a-z]{1,40}(?:\s{1,3}[A-Z][a-z]{1,40}){0,5})\s{1,3}v\.?\s{1,3}([A-Z][a-z]{1,40}(?:\s{1,3}[A-Z][a-z]{1,40}){0,5})\b)") {
    if (!config_.lookupBaseUrl.empty() && config_.lookupBaseUrl.back() != '/') {
        config_.lookupBaseUrl.push_back('/');
    }
    matchers_.reserve(kFamilyOrder.size());
    for (auto family : kFamilyOrder) {
        matchers_.push_back(FamilyMatcher{std::string(family), std::regex(familyPattern(family))});
    }
}

std::string CitationExtractor::buildUrl(std::string_view slug, std::uint32_t volume,
                                        std::uint32_t page) const {
    std::string url = config_.lookupBaseUrl;
    url.append(slug);
    url += '/';
    url += std::to_string(volume);
    url += '/';
    url += std::to_string(page);
    url += '/';
    return url;
}

std::vector<CitationMatch> CitationExtractor::extractAll(std::string_view text) const {
    const std::string input(text);

    struct Span {
        CitationMatch match;
        size_t length;
        size_t familyIndex;
    };
    std::vector<Span> spans;

    for (size_t f = 0; f < matchers_.size(); ++f) {
        const auto& matcher = matchers_[f];
        for (auto it = std::sregex_iterator(input.begin(), input.end(), matcher.pattern);
             it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            auto reporter = lookupReporter(m.str(2));
            if (!reporter) {
                continue;
            }
            CitationMatch match;
            match.rawText = m.str(0);
            match.reporter = std::string(reporter->canonical);
            match.volume = parseNumber(m.str(1));
            match.page = parseNumber(m.str(3));
            match.family = matcher.family;
            match.position = static_cast<size_t>(m.position(0));
            match.normalizedUrl = buildUrl(reporter->slug, match.volume, match.page);
            spans.push_back(Span{std::move(match), static_cast<size_t>(m.length(0)), f});
        }
    }

    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        if (a.match.position != b.match.position) {
            return a.match.position < b.match.position;
        }
        if (a.length != b.length) {
            return a.length > b.length;
        }
        return a.familyIndex < b.familyIndex;
    });

    std::vector<CitationMatch> out;
    size_t coveredUntil = 0;
    for (auto& span : spans) {
        if (!out.empty() && span.match.position < coveredUntil) {
            continue;
        }
        coveredUntil = span.match.position + span.length;
        out.push_back(std::move(span.match));
    }
    return out;
}

std::vector<CitationMatch> CitationExtractor::extract(std::string_view text) const {
    auto all = extractAll(text);

    std::vector<CitationMatch> out;
    std::unordered_set<std::string> seen;
    for (auto& match : all) {
        if (out.size() >= config_.maxPerPassage) {
            break;
        }
        auto key = match.reporter + '|' + std::to_string(match.volume) + '|' +
                   std::to_string(match.page);
        if (!seen.insert(std::move(key)).second) {
            continue;
        }
        out.push_back(std::move(match));
    }

    if (all.size() > out.size()) {
        spdlog::debug("Citation extraction kept {} of {} matches", out.size(), all.size());
    }
    return out;
}

std::string CitationExtractor::highlight(std::string_view text, HighlightFormat format) const {
    if (format == HighlightFormat::Plain) {
        return std::string(text);
    }

    auto matches = extractAll(text);
    std::string out;
    out.reserve(text.size() + matches.size() * 64);

    auto appendText = [&](std::string_view segment) {
        if (format == HighlightFormat::Html) {
            out += escapeHtml(segment);
        } else {
            out.append(segment);
        }
    };

    size_t cursor = 0;
    for (const auto& m : matches) {
        appendText(text.substr(cursor, m.position - cursor));
        if (format == HighlightFormat::Markdown) {
            out += '[' + m.rawText + "](" + m.normalizedUrl + ')';
        } else {
            out += "<a href=\"" + escapeHtml(m.normalizedUrl) + "\" target=\"_blank\">" +
                   escapeHtml(m.rawText) + "</a>";
        }
        cursor = m.position + m.rawText.size();
    }
    appendText(text.substr(cursor));
    return out;
}

std::vector<CaseName> CitationExtractor::extractCaseNames(std::string_view text) const {
    constexpr size_t kMaxCaseNames = 5;
    const std::string input(text);

    std::vector<CaseName> names;
    for (auto it = std::sregex_iterator(input.begin(), input.end(), caseNamePattern_);
         it != std::sregex_iterator() && names.size() < kMaxCaseNames; ++it) {
        auto plaintiff = dropSignalWords((*it).str(1));
        if (plaintiff.empty()) {
            continue;
        }
        CaseName name;
        name.plaintiff = std::move(plaintiff);
        name.defendant = (*it).str(2);
        name.fullName = name.plaintiff + " v. " + name.defendant;
        names.push_back(std::move(name));
    }
    return names;
}

} // namespace lexsearch::citation
