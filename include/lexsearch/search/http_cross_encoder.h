#pragma once

#include <lexsearch/net/http_client.h>
#include <lexsearch/search/reranker.h>

#include <chrono>
#include <memory>
#include <string>

namespace lexsearch::search {

struct CrossEncoderConfig {
    std::string endpoint = "http://localhost:8080";
    std::string model = "cross-encoder/ms-marco-MiniLM-L-6-v2";
    std::chrono::milliseconds timeout{2000};
};

/**
 * @brief Cross-encoder served by a text-embeddings-inference style `/rerank` API
 *
 * Request `{"query", "texts", "truncate": true}`, response
 * `[{"index": i, "score": s}, ...]` in any order. Every input index must be
 * scored exactly once.
 */
class HttpCrossEncoder : public IReranker {
public:
    HttpCrossEncoder(std::shared_ptr<net::IHttpClient> http, CrossEncoderConfig config);

    Result<std::vector<double>> scoreDocuments(const std::string& query,
                                               const std::vector<std::string>& documents) override;

    bool isReady() const override { return http_ != nullptr && !config_.endpoint.empty(); }

    static Result<std::vector<double>> parseScores(const nlohmann::json& body, size_t expected);

private:
    std::shared_ptr<net::IHttpClient> http_;
    CrossEncoderConfig config_;
};

} // namespace lexsearch::search
