#include "payload_fields.h"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <string_view>

namespace lexsearch::vector::detail {

namespace {

constexpr std::array<std::string_view, 11> kReservedFields = {
    "text",  "chunk_id", "id",         "embedding", "sentences", "collection",
    "title", "case_name", "court",     "date",      "date_filed"};

std::string firstOf(const nlohmann::json& payload, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = payload.find(key);
        if (it != payload.end()) {
            auto value = scalarToString(*it);
            if (!value.empty()) {
                return value;
            }
        }
    }
    return {};
}

} // namespace

std::string scalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return {};
}

search::SourceMetadata metadataFromPayload(const nlohmann::json& payload,
                                           const std::string& collection) {
    search::SourceMetadata meta;
    meta.collection = collection;
    if (!payload.is_object()) {
        return meta;
    }

    meta.title = firstOf(payload, {"case_name", "title", "filename"});
    meta.court = firstOf(payload, {"court"});
    meta.date = firstOf(payload, {"date_filed", "date"});

    for (const auto& [key, value] : payload.items()) {
        if (std::find(kReservedFields.begin(), kReservedFields.end(), key) != kReservedFields.end()) {
            continue;
        }
        auto text = scalarToString(value);
        if (!text.empty()) {
            meta.extra.emplace(key, std::move(text));
        }
    }
    return meta;
}

} // namespace lexsearch::vector::detail
