#include <lexsearch/core/deadline.h>
#include <lexsearch/search/reranker.h>

#include <spdlog/spdlog.h>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cmath>

namespace lexsearch::search {

// ============================================================================
// RerankerService
// ============================================================================

RerankerService::RerankerService(Factory factory) : factory_(std::move(factory)) {}

RerankerService::RerankerService(std::shared_ptr<IReranker> loaded)
    : factory_([loaded]() -> Result<std::shared_ptr<IReranker>> { return loaded; }) {}

Result<std::shared_ptr<IReranker>> RerankerService::acquire() const {
    std::call_once(once_, [this]() {
        attempted_.store(true, std::memory_order_release);
        if (!factory_) {
            loadError_ = Error{ErrorCode::NotInitialized, "No reranker factory configured"};
            return;
        }
        try {
            auto loaded = factory_();
            if (!loaded) {
                loadError_ = loaded.error();
            } else if (!loaded.value()) {
                loadError_ = Error{ErrorCode::NotInitialized, "Reranker factory returned null"};
            } else {
                model_ = std::move(loaded).value();
                spdlog::info("Reranker model loaded");
            }
        } catch (const std::exception& e) {
            loadError_ = Error{ErrorCode::InternalError, std::string("Reranker load threw: ") + e.what()};
        }
        if (loadError_) {
            spdlog::warn("Reranker model unavailable: {}", loadError_->message);
        }
    });

    if (loadError_) {
        return *loadError_;
    }
    return model_;
}

bool RerankerService::loadAttempted() const {
    return attempted_.load(std::memory_order_acquire);
}

// ============================================================================
// CrossEncoderReranker
// ============================================================================

std::string truncatePassage(std::string_view text, size_t maxChars) {
    if (text.size() <= maxChars) {
        return std::string(text);
    }
    size_t cut = maxChars;
    // Back off over UTF-8 continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

CrossEncoderReranker::CrossEncoderReranker(std::shared_ptr<RerankerService> service,
                                           RerankConfig config,
                                           std::shared_ptr<boost::asio::thread_pool> executor)
    : service_(std::move(service)), config_(config), executor_(std::move(executor)) {}

RerankOutcome CrossEncoderReranker::rerank(const std::string& query,
                                           std::vector<Candidate> candidates) const {
    RerankOutcome outcome;
    outcome.candidates = std::move(candidates);

    if (outcome.candidates.empty() || config_.topK == 0) {
        return outcome;
    }
    if (!service_ || !executor_) {
        outcome.error = Error{ErrorCode::NotInitialized, "Reranker not configured"};
        return outcome;
    }

    auto model = service_->acquire();
    if (!model) {
        outcome.error = model.error();
        return outcome;
    }
    auto reranker = model.value();
    if (!reranker->isReady()) {
        outcome.error = Error{ErrorCode::NotInitialized, "Reranker is not ready"};
        return outcome;
    }

    const size_t window = std::min(config_.topK, outcome.candidates.size());
    std::vector<std::string> passages;
    passages.reserve(window);
    for (size_t i = 0; i < window; ++i) {
        passages.push_back(truncatePassage(outcome.candidates[i].text, config_.maxPassageChars));
    }

    auto scores = runWithDeadline<std::vector<double>>(
        *executor_, config_.timeout, "reranker inference",
        [reranker, query, passages = std::move(passages)]() {
            return reranker->scoreDocuments(query, passages);
        });
    if (!scores) {
        outcome.error = scores.error();
        return outcome;
    }

    const auto& values = scores.value();
    if (values.size() != window) {
        outcome.error = Error{ErrorCode::InvalidData,
                              "Reranker returned " + std::to_string(values.size()) +
                                  " scores for " + std::to_string(window) + " passages"};
        return outcome;
    }
    if (std::any_of(values.begin(), values.end(), [](double v) { return !std::isfinite(v); })) {
        outcome.error = Error{ErrorCode::InvalidData, "Reranker returned a non-finite score"};
        return outcome;
    }

    for (size_t i = 0; i < window; ++i) {
        outcome.candidates[i].rerankScore = values[i];
    }
    std::stable_sort(outcome.candidates.begin(),
                     outcome.candidates.begin() + static_cast<ptrdiff_t>(window),
                     [](const Candidate& a, const Candidate& b) {
                         return *a.rerankScore > *b.rerankScore;
                     });

    outcome.applied = true;
    outcome.scored = window;
    spdlog::debug("Reranked top {} of {} candidates", window, outcome.candidates.size());
    return outcome;
}

} // namespace lexsearch::search
