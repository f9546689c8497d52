#include <lexsearch/search/http_cross_encoder.h>

#include <spdlog/spdlog.h>

namespace lexsearch::search {

HttpCrossEncoder::HttpCrossEncoder(std::shared_ptr<net::IHttpClient> http,
                                   CrossEncoderConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

Result<std::vector<double>> HttpCrossEncoder::parseScores(const nlohmann::json& body,
                                                          size_t expected) {
    if (!body.is_array()) {
        return Error{ErrorCode::InvalidData, "Rerank response is not an array"};
    }

    std::vector<double> scores(expected, 0.0);
    std::vector<bool> seen(expected, false);
    for (const auto& item : body) {
        auto index = item.find("index");
        auto score = item.find("score");
        if (index == item.end() || score == item.end() || !index->is_number_unsigned() ||
            !score->is_number()) {
            return Error{ErrorCode::InvalidData, "Rerank entry without index/score"};
        }
        const auto i = index->get<size_t>();
        if (i >= expected || seen[i]) {
            return Error{ErrorCode::InvalidData,
                         "Rerank response has unexpected index " + std::to_string(i)};
        }
        seen[i] = true;
        scores[i] = score->get<double>();
    }
    for (size_t i = 0; i < expected; ++i) {
        if (!seen[i]) {
            return Error{ErrorCode::InvalidData,
                         "Rerank response is missing index " + std::to_string(i)};
        }
    }
    return scores;
}

Result<std::vector<double>>
HttpCrossEncoder::scoreDocuments(const std::string& query,
                                 const std::vector<std::string>& documents) {
    if (documents.empty()) {
        return std::vector<double>{};
    }
    if (!isReady()) {
        return Error{ErrorCode::NotInitialized, "Cross-encoder endpoint not configured"};
    }

    nlohmann::json request = {{"query", query}, {"texts", documents}, {"truncate", true}};
    if (!config_.model.empty()) {
        request["model"] = config_.model;
    }

    auto response =
        http_->postJson(net::joinUrl(config_.endpoint, "rerank"), request.dump(), {}, config_.timeout);
    if (!response) {
        return response.error();
    }
    auto body = net::parseJsonResponse(response.value(), "Cross-encoder");
    if (!body) {
        return body.error();
    }
    auto scores = parseScores(body.value(), documents.size());
    if (scores) {
        spdlog::debug("Cross-encoder scored {} passages", documents.size());
    }
    return scores;
}

} // namespace lexsearch::search
