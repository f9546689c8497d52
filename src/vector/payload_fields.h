#pragma once

#include <lexsearch/search/search_types.h>

#include <nlohmann/json.hpp>

#include <string>

namespace lexsearch::vector::detail {

// String form of a scalar JSON value; empty for null, arrays and objects.
std::string scalarToString(const nlohmann::json& value);

// Map document payload fields onto SourceMetadata. Fields not mapped to a
// named member are kept in `extra`, except bulky ones (text, embeddings).
search::SourceMetadata metadataFromPayload(const nlohmann::json& payload,
                                           const std::string& collection);

} // namespace lexsearch::vector::detail
