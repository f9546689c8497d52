#pragma once

#include <lexsearch/core/types.h>
#include <lexsearch/net/http_client.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace lexsearch::vector {

class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) = 0;
};

struct EmbeddingConfig {
    std::string url = "http://localhost:11434";
    std::string model = "all-minilm";
    std::chrono::milliseconds timeout{3000};
};

/**
 * @brief Embeddings from an Ollama-compatible `/api/embeddings` endpoint
 *
 * Request `{"model", "prompt"}`, response `{"embedding": [...]}`.
 */
class HttpEmbeddingProvider : public IEmbeddingProvider {
public:
    HttpEmbeddingProvider(std::shared_ptr<net::IHttpClient> http, EmbeddingConfig config);

    Result<std::vector<float>> embed(const std::string& text) override;

private:
    std::shared_ptr<net::IHttpClient> http_;
    EmbeddingConfig config_;
};

} // namespace lexsearch::vector
