#include <lexsearch/vector/embedding_provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lexsearch::vector {

HttpEmbeddingProvider::HttpEmbeddingProvider(std::shared_ptr<net::IHttpClient> http,
                                             EmbeddingConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

Result<std::vector<float>> HttpEmbeddingProvider::embed(const std::string& text) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "Embedding provider has no HTTP client"};
    }

    const nlohmann::json request = {{"model", config_.model}, {"prompt", text}};
    auto response = http_->postJson(net::joinUrl(config_.url, "api/embeddings"), request.dump(), {},
                                    config_.timeout);
    if (!response) {
        return response.error();
    }
    auto body = net::parseJsonResponse(response.value(), "Embedding service");
    if (!body) {
        return body.error();
    }

    auto it = body.value().find("embedding");
    if (it == body.value().end() || !it->is_array() || it->empty()) {
        return Error{ErrorCode::InvalidData, "Embedding response has no embedding"};
    }
    std::vector<float> embedding;
    embedding.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "Embedding contains a non-number"};
        }
        embedding.push_back(v.get<float>());
    }
    spdlog::debug("Embedded query with {} ({} dimensions)", config_.model, embedding.size());
    return embedding;
}

} // namespace lexsearch::vector
