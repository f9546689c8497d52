#include <lexsearch/search/search_types.h>

namespace lexsearch::search {

std::optional<CollectionScope> parseCollectionScope(std::string_view value) {
    if (value == "contracts" || value == "legal_contracts") {
        return CollectionScope::Contracts;
    }
    if (value == "cases" || value == "legal_cases") {
        return CollectionScope::Cases;
    }
    if (value == "both" || value == "all") {
        return CollectionScope::Both;
    }
    if (value == "auto") {
        return CollectionScope::Auto;
    }
    return std::nullopt;
}

} // namespace lexsearch::search
