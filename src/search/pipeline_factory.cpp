#include <lexsearch/search/pipeline_factory.h>

#include <lexsearch/search/http_cross_encoder.h>
#include <lexsearch/search/sparse_retriever.h>
#include <lexsearch/vector/embedding_provider.h>
#include <lexsearch/vector/in_memory_vector_index.h>
#include <lexsearch/vector/qdrant_vector_index.h>

#include <spdlog/spdlog.h>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <thread>

namespace lexsearch::search {

std::shared_ptr<RerankerService>
PipelineFactory::createRerankerService(const config::PipelineConfig& config,
                                       std::shared_ptr<net::IHttpClient> http) {
    if (!config.rerank.enabled) {
        return nullptr;
    }
    CrossEncoderConfig encoderConfig{config.rerank.endpoint, config.rerank.model,
                                     config.rerank.timeout};
    return std::make_shared<RerankerService>(
        [http = std::move(http), encoderConfig]() -> Result<std::shared_ptr<IReranker>> {
            auto encoder = std::make_shared<HttpCrossEncoder>(http, encoderConfig);
            if (!encoder->isReady()) {
                return Error{ErrorCode::NotInitialized, "rerank.endpoint is not configured"};
            }
            spdlog::debug("Cross-encoder '{}' at {}", encoderConfig.model, encoderConfig.endpoint);
            return std::shared_ptr<IReranker>(std::move(encoder));
        });
}

Result<std::unique_ptr<RetrievalPipeline>>
PipelineFactory::create(const config::PipelineConfig& config,
                        std::shared_ptr<net::IHttpClient> http) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!http) {
        http = net::makeCurlHttpClient();
    }

    PipelineDependencies deps;
    deps.embedder = std::make_shared<vector::HttpEmbeddingProvider>(
        http, vector::EmbeddingConfig{config.embedding.url, config.embedding.model,
                                      config.embedding.timeout});

    if (config.vector.backend == "memory") {
        auto index = vector::InMemoryVectorIndex::loadJsonLines(
            config.vector.corpusPath, config.vector.contractsCollection,
            config.vector.casesCollection);
        if (!index) {
            return index.error();
        }
        deps.vectorIndex = std::move(index).value();
    } else {
        deps.vectorIndex = std::make_shared<vector::QdrantVectorIndex>(
            http, vector::QdrantConfig{config.vector.url, config.vector.apiKey,
                                       config.vector.contractsCollection,
                                       config.vector.casesCollection, config.vector.timeout});
    }

    deps.sparseRetriever = std::make_shared<CandidatePoolBm25Retriever>();
    deps.reranker = createRerankerService(config, http);
    deps.citationExtractor = std::make_shared<citation::CitationExtractor>(
        citation::CitationExtractorConfig{config.citations.maxPerPassage,
                                          config.citations.lookupBaseUrl});

    unsigned int threads = std::thread::hardware_concurrency();
    if (threads == 0)
        threads = 4;
    deps.executor = std::make_shared<boost::asio::thread_pool>(std::min(threads, 8u));

    spdlog::debug("Pipeline: {} vector backend, reranking {}", config.vector.backend,
                  deps.reranker ? "enabled" : "disabled");
    return RetrievalPipeline::create(std::move(deps), config);
}

} // namespace lexsearch::search
