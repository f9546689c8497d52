#include <lexsearch/vector/qdrant_vector_index.h>

#include "payload_fields.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace lexsearch::vector {

QdrantVectorIndex::QdrantVectorIndex(std::shared_ptr<net::IHttpClient> http, QdrantConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

nlohmann::json QdrantVectorIndex::buildSearchRequest(const std::vector<float>& embedding,
                                                     size_t topN,
                                                     const search::SearchFilters& filters) {
    nlohmann::json request = {
        {"vector", embedding},
        {"limit", topN},
        {"with_payload", true},
    };

    if (!filters.empty()) {
        auto must = nlohmann::json::array();
        if (filters.court) {
            must.push_back({{"key", "court"}, {"match", {{"value", *filters.court}}}});
        }
        if (filters.dateFrom || filters.dateTo) {
            nlohmann::json range = nlohmann::json::object();
            if (filters.dateFrom) {
                range["gte"] = *filters.dateFrom;
            }
            if (filters.dateTo) {
                range["lte"] = *filters.dateTo;
            }
            must.push_back({{"key", "date_filed"}, {"range", range}});
        }
        request["filter"] = {{"must", must}};
    }
    return request;
}

Result<std::vector<VectorHit>> QdrantVectorIndex::parseSearchResponse(const nlohmann::json& body,
                                                                      const std::string& collection) {
    auto result = body.find("result");
    if (result == body.end() || !result->is_array()) {
        return Error{ErrorCode::InvalidData, "Qdrant response from '" + collection + "' has no result array"};
    }

    std::vector<VectorHit> hits;
    hits.reserve(result->size());
    for (const auto& point : *result) {
        auto score = point.find("score");
        if (score == point.end() || !score->is_number()) {
            return Error{ErrorCode::InvalidData, "Qdrant point without a numeric score"};
        }
        static const nlohmann::json kEmpty = nlohmann::json::object();
        auto payloadIt = point.find("payload");
        const auto& payload =
            (payloadIt != point.end() && payloadIt->is_object()) ? *payloadIt : kEmpty;

        VectorHit hit;
        hit.similarity = score->get<double>();
        hit.text = payload.value("text", std::string{});
        if (auto chunk = payload.find("chunk_id"); chunk != payload.end()) {
            hit.id = detail::scalarToString(*chunk);
        }
        if (hit.id.empty()) {
            auto pointId = point.find("id");
            hit.id = collection + ":" +
                     (pointId != point.end() ? detail::scalarToString(*pointId) : std::string{});
        }
        hit.metadata = detail::metadataFromPayload(payload, collection);
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<std::vector<VectorHit>> QdrantVectorIndex::searchCollection(const std::string& collection,
                                                                   const nlohmann::json& request) {
    std::vector<net::Header> headers;
    if (!config_.apiKey.empty()) {
        headers.push_back({"api-key", config_.apiKey});
    }

    auto url = net::joinUrl(config_.url, "collections/" + collection + "/points/search");
    auto response = http_->postJson(url, request.dump(), headers, config_.timeout);
    if (!response) {
        return response.error();
    }
    auto body = net::parseJsonResponse(response.value(), "Qdrant search in '" + collection + "'");
    if (!body) {
        return body.error();
    }
    return parseSearchResponse(body.value(), collection);
}

Result<VectorSearchResult> QdrantVectorIndex::search(const std::vector<float>& embedding,
                                                     size_t topN, search::CollectionScope scope,
                                                     const search::SearchFilters& filters) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "Qdrant adapter has no HTTP client"};
    }
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty query embedding"};
    }

    std::vector<std::string> collections;
    switch (scope) {
        case search::CollectionScope::Contracts:
            collections = {config_.contractsCollection};
            break;
        case search::CollectionScope::Cases:
            collections = {config_.casesCollection};
            break;
        case search::CollectionScope::Both:
        case search::CollectionScope::Auto:
            collections = {config_.contractsCollection, config_.casesCollection};
            break;
    }

    const auto request = buildSearchRequest(embedding, topN, filters);

    VectorSearchResult out;
    Error lastError{ErrorCode::UpstreamUnavailable, "no collection searched"};
    for (const auto& collection : collections) {
        auto hits = searchCollection(collection, request);
        if (!hits) {
            spdlog::warn("Vector search in '{}' failed: {}", collection, hits.error().message);
            lastError = hits.error();
            out.failedCollections.push_back(collection);
            continue;
        }
        spdlog::debug("Vector search in '{}': {} hits", collection, hits.value().size());
        auto& found = hits.value();
        out.hits.insert(out.hits.end(), std::make_move_iterator(found.begin()),
                        std::make_move_iterator(found.end()));
    }

    if (out.failedCollections.size() == collections.size()) {
        return Error{ErrorCode::UpstreamUnavailable, "Vector index unavailable: " + lastError.message};
    }

    std::stable_sort(out.hits.begin(), out.hits.end(), [](const VectorHit& a, const VectorHit& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.id < b.id;
    });

    std::unordered_set<std::string> seen;
    out.hits.erase(std::remove_if(out.hits.begin(), out.hits.end(),
                                  [&seen](const VectorHit& h) { return !seen.insert(h.id).second; }),
                   out.hits.end());
    if (out.hits.size() > topN) {
        out.hits.resize(topN);
    }
    return out;
}

} // namespace lexsearch::vector
