#include <lexsearch/core/deadline.h>
#include <lexsearch/search/retrieval_pipeline.h>
#include <lexsearch/search/score_fusion.h>

#include <spdlog/spdlog.h>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <unordered_map>

namespace lexsearch::search {

namespace {

using Clock = std::chrono::steady_clock;

int64_t microsSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

constexpr size_t kDefaultExecutorThreads = 4;

} // namespace

// ============================================================================
// RetrievalPipeline::Impl
// ============================================================================

class RetrievalPipeline::Impl {
public:
    Impl(PipelineDependencies deps, config::PipelineConfig cfg)
        : deps_(std::move(deps)), config_(std::move(cfg)) {
        if (!deps_.citationExtractor) {
            deps_.citationExtractor = std::make_shared<citation::CitationExtractor>(
                citation::CitationExtractorConfig{config_.citations.maxPerPassage,
                                                  config_.citations.lookupBaseUrl});
        }
        if (!deps_.preprocessor) {
            deps_.preprocessor = std::make_shared<query::QueryPreprocessor>();
        }
        if (!deps_.executor) {
            deps_.executor = std::make_shared<boost::asio::thread_pool>(kDefaultExecutorThreads);
        }
    }

    Result<void> validateRequest(const QueryRequest& request) const {
        if (isBlank(request.queryText)) {
            return Error{ErrorCode::InvalidArgument, "Query text is empty"};
        }
        if (request.queryText.size() > config_.search.maxQueryChars) {
            return Error{ErrorCode::InvalidArgument,
                         "Query text exceeds " + std::to_string(config_.search.maxQueryChars) +
                             " characters"};
        }
        if (request.resultLimit < 1 || request.resultLimit > config_.search.maxResultLimit) {
            return Error{ErrorCode::InvalidArgument,
                         "Result limit must be within [1, " +
                             std::to_string(config_.search.maxResultLimit) + "]"};
        }
        if (request.alpha && !(*request.alpha >= 0.0 && *request.alpha <= 1.0)) {
            return Error{ErrorCode::InvalidArgument, "Alpha must be within [0, 1]"};
        }
        const auto& f = request.filters;
        if (f.dateFrom && f.dateTo && *f.dateFrom > *f.dateTo) {
            return Error{ErrorCode::InvalidArgument, "Date filter range is empty"};
        }
        return {};
    }

    Result<ResultEnvelope> search(const QueryRequest& request) const {
        const auto start = Clock::now();
        stats_.totalQueries.fetch_add(1, std::memory_order_relaxed);

        if (auto valid = validateRequest(request); !valid) {
            stats_.rejectedQueries.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("Rejected query: {}", valid.error().message);
            return valid.error();
        }

        auto result = execute(request, start);
        const auto elapsed = microsSince(start);
        stats_.totalQueryTimeMicros.fetch_add(static_cast<uint64_t>(elapsed),
                                              std::memory_order_relaxed);
        if (!result) {
            stats_.failedQueries.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Query failed: {}", result.error().message);
            return result;
        }

        stats_.successfulQueries.fetch_add(1, std::memory_order_relaxed);
        if (result.value().degraded.any()) {
            stats_.degradedQueries.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    const config::PipelineConfig& config() const { return config_; }
    const Statistics& statistics() const { return stats_; }

private:
    Result<ResultEnvelope> execute(const QueryRequest& request, Clock::time_point start) const {
        if (!deps_.embedder || !deps_.vectorIndex) {
            return Error{ErrorCode::NotInitialized, "Pipeline has no embedder or vector index"};
        }

        ResultEnvelope envelope;
        const auto& flags = request.flags;

        // Query preparation
        auto processed = deps_.preprocessor->process(request.queryText, flags.expandQuery);
        envelope.query.processedQuery = processed.text;
        envelope.query.queryType = query::queryTypeToString(processed.type);
        envelope.query.jurisdiction = processed.jurisdiction;
        envelope.query.resolvedScope = request.collectionScope == CollectionScope::Auto
                                           ? query::QueryPreprocessor::route(processed.type)
                                           : request.collectionScope;

        // Dense retrieval
        auto stageStart = Clock::now();
        auto embedding = runWithDeadline<std::vector<float>>(
            *deps_.executor, config_.embedding.timeout, "query embedding",
            [embedder = deps_.embedder, text = processed.text]() { return embedder->embed(text); });
        envelope.stageTimingMicros["embed"] = microsSince(stageStart);
        if (!embedding) {
            return Error{ErrorCode::UpstreamUnavailable,
                         "Embedding provider unavailable: " + embedding.error().message};
        }

        stageStart = Clock::now();
        auto dense = runWithDeadline<vector::VectorSearchResult>(
            *deps_.executor, config_.vector.timeout, "vector search",
            [index = deps_.vectorIndex, emb = std::move(embedding).value(),
             topN = config_.search.denseTopN, scope = envelope.query.resolvedScope,
             filters = request.filters]() { return index->search(emb, topN, scope, filters); });
        envelope.stageTimingMicros["dense"] = microsSince(stageStart);
        if (!dense) {
            if (dense.error().code == ErrorCode::UpstreamUnavailable) {
                return dense.error();
            }
            return Error{ErrorCode::UpstreamUnavailable,
                         "Vector index unavailable: " + dense.error().message};
        }

        auto& denseResult = dense.value();
        if (!denseResult.failedCollections.empty()) {
            envelope.degraded.retrieval = true;
            for (const auto& name : denseResult.failedCollections) {
                envelope.degraded.reasons.push_back("retrieval: collection '" + name +
                                                    "' unavailable");
            }
        }

        // One candidate per chunk id; the vector index returns best hits first.
        std::vector<Candidate> pool;
        std::unordered_map<std::string, size_t> poolIndex;
        ScoreMap denseScores;
        pool.reserve(denseResult.hits.size());
        for (auto& hit : denseResult.hits) {
            if (!poolIndex.emplace(hit.id, pool.size()).second) {
                continue;
            }
            Candidate c;
            c.id = hit.id;
            c.text = std::move(hit.text);
            c.metadata = std::move(hit.metadata);
            c.denseScore = hit.similarity;
            denseScores.emplace(c.id, hit.similarity);
            pool.push_back(std::move(c));
        }
        spdlog::debug("Dense retrieval returned {} unique candidates", pool.size());

        // Sparse retrieval and fusion
        ScoreMap sparseScores;
        bool fuseSparse = false;
        if (flags.useHybrid && !pool.empty()) {
            stageStart = Clock::now();
            auto sparse = runSparse(processed.text, pool);
            envelope.stageTimingMicros["sparse"] = microsSince(stageStart);
            if (!sparse) {
                stats_.sparseFailures.fetch_add(1, std::memory_order_relaxed);
                spdlog::warn("Sparse retrieval skipped: {}", sparse.error().message);
                envelope.degraded.sparse = true;
                envelope.degraded.reasons.push_back("sparse: " + sparse.error().message);
            } else {
                fuseSparse = true;
                for (auto& hit : sparse.value()) {
                    sparseScores.emplace(hit.id, hit.score);
                    // Precomputed indexes may surface chunks dense retrieval missed
                    if (poolIndex.emplace(hit.id, pool.size()).second) {
                        Candidate c;
                        c.id = hit.id;
                        c.text = std::move(hit.text);
                        c.metadata = std::move(hit.metadata);
                        pool.push_back(std::move(c));
                    }
                }
            }
        }

        stageStart = Clock::now();
        const double alpha = fuseSparse ? request.alpha.value_or(config_.search.alpha) : 1.0;
        auto ranked = ScoreFusion(alpha).fuse(denseScores, sparseScores);
        for (auto& c : ranked) {
            auto& source = pool[poolIndex.at(c.id)];
            c.text = std::move(source.text);
            c.metadata = std::move(source.metadata);
        }
        envelope.stageTimingMicros["fusion"] = microsSince(stageStart);

        // Rerank
        if (flags.useReranking && config_.rerank.enabled && !ranked.empty()) {
            stageStart = Clock::now();
            if (!deps_.reranker) {
                markRerankDegraded(envelope, "reranker not configured");
            } else {
                CrossEncoderReranker reranker(
                    deps_.reranker,
                    RerankConfig{config_.rerank.topK, config_.rerank.maxPassageChars,
                                 config_.rerank.timeout},
                    deps_.executor);
                auto outcome = reranker.rerank(request.queryText, std::move(ranked));
                ranked = std::move(outcome.candidates);
                if (outcome.error) {
                    markRerankDegraded(envelope, outcome.error->message);
                }
            }
            envelope.stageTimingMicros["rerank"] = microsSince(stageStart);
        }

        envelope.totalCandidates = ranked.size();

        // Citations
        std::vector<std::vector<citation::CitationMatch>> citations;
        if (flags.extractCitations) {
            stageStart = Clock::now();
            try {
                citations.reserve(ranked.size());
                for (const auto& c : ranked) {
                    citations.push_back(deps_.citationExtractor->extract(c.text));
                }
            } catch (const std::exception& e) {
                citations.clear();
                stats_.citationFailures.fetch_add(1, std::memory_order_relaxed);
                spdlog::warn("Citation extraction skipped: {}", e.what());
                envelope.degraded.citations = true;
                envelope.degraded.reasons.push_back(std::string("citations: ") + e.what());
            }
            envelope.stageTimingMicros["citations"] = microsSince(stageStart);
        }

        // Truncate
        stageStart = Clock::now();
        const auto limit = static_cast<size_t>(request.resultLimit);
        if (ranked.size() > limit) {
            ranked.resize(limit);
        }
        if (citations.size() > limit) {
            citations.resize(limit);
        }
        envelope.rankedCandidates = std::move(ranked);
        envelope.citations = std::move(citations);
        envelope.stageTimingMicros["truncate"] = microsSince(stageStart);

        envelope.totalTimeMicros = microsSince(start);
        spdlog::debug("Query '{}' ({} scope): {} of {} candidates returned in {} us",
                      envelope.query.processedQuery,
                      collectionScopeToString(envelope.query.resolvedScope),
                      envelope.rankedCandidates.size(), envelope.totalCandidates,
                      envelope.totalTimeMicros);
        return envelope;
    }

    Result<std::vector<SparseHit>> runSparse(const std::string& queryText,
                                             const std::vector<Candidate>& pool) const {
        if (!deps_.sparseRetriever) {
            return Error{ErrorCode::NotInitialized, "no sparse retriever configured"};
        }
        try {
            return deps_.sparseRetriever->search(Bm25Index::tokenize(queryText), pool,
                                                 config_.search.sparseTopN);
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string("sparse retrieval threw: ") + e.what()};
        }
    }

    void markRerankDegraded(ResultEnvelope& envelope, const std::string& reason) const {
        stats_.rerankFailures.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Reranking skipped: {}", reason);
        envelope.degraded.reranking = true;
        envelope.degraded.reasons.push_back("reranking: " + reason);
    }

    PipelineDependencies deps_;
    config::PipelineConfig config_;
    mutable Statistics stats_;
};

// ============================================================================
// RetrievalPipeline
// ============================================================================

RetrievalPipeline::RetrievalPipeline(PipelineDependencies deps, config::PipelineConfig config)
    : pImpl_(std::make_unique<Impl>(std::move(deps), std::move(config))) {}

RetrievalPipeline::~RetrievalPipeline() = default;

Result<std::unique_ptr<RetrievalPipeline>>
RetrievalPipeline::create(PipelineDependencies deps, config::PipelineConfig config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!deps.embedder) {
        return Error{ErrorCode::NotInitialized, "No embedding provider"};
    }
    if (!deps.vectorIndex) {
        return Error{ErrorCode::NotInitialized, "No vector index"};
    }
    return std::make_unique<RetrievalPipeline>(std::move(deps), std::move(config));
}

Result<ResultEnvelope> RetrievalPipeline::search(const QueryRequest& request) const {
    return pImpl_->search(request);
}

Result<void> RetrievalPipeline::validateRequest(const QueryRequest& request) const {
    return pImpl_->validateRequest(request);
}

QueryRequest RetrievalPipeline::makeRequest(std::string queryText) const {
    QueryRequest request;
    request.queryText = std::move(queryText);
    request.resultLimit = pImpl_->config().search.defaultResultLimit;
    return request;
}

const config::PipelineConfig& RetrievalPipeline::config() const {
    return pImpl_->config();
}

const RetrievalPipeline::Statistics& RetrievalPipeline::getStatistics() const {
    return pImpl_->statistics();
}

} // namespace lexsearch::search
