#pragma once

#include <lexsearch/config/pipeline_config.h>
#include <lexsearch/core/types.h>
#include <lexsearch/net/http_client.h>
#include <lexsearch/search/reranker.h>
#include <lexsearch/search/retrieval_pipeline.h>

#include <memory>

namespace lexsearch::search {

/**
 * @brief Wires a RetrievalPipeline from configuration
 *
 * HTTP-backed embedding and rerank services, a Qdrant or in-memory vector
 * index depending on `vector.backend`, and BM25 over the dense candidate pool.
 */
class PipelineFactory {
public:
    /**
     * @param config Validated before anything is built
     * @param http Transport shared by all adapters; libcurl when null
     */
    static Result<std::unique_ptr<RetrievalPipeline>>
    create(const config::PipelineConfig& config, std::shared_ptr<net::IHttpClient> http = nullptr);

    // Lazily connecting reranker service, or null when reranking is disabled.
    static std::shared_ptr<RerankerService>
    createRerankerService(const config::PipelineConfig& config,
                          std::shared_ptr<net::IHttpClient> http);
};

} // namespace lexsearch::search
