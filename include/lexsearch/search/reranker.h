#pragma once

#include <lexsearch/core/types.h>
#include <lexsearch/search/search_types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boost::asio {
class thread_pool;
}

namespace lexsearch::search {

/**
 * @brief Interface for cross-encoder document reranking
 *
 * A cross-encoder scores each (query, passage) pair jointly, which is more
 * accurate and much more expensive than embedding similarity. It is applied as
 * a second-stage ranker over a bounded shortlist.
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query
     *
     * @param query The search query
     * @param documents Passage texts to score
     * @return One relevance score per document, in input order, or error
     */
    virtual Result<std::vector<double>> scoreDocuments(const std::string& query,
                                                       const std::vector<std::string>& documents) = 0;

    /**
     * @brief Check if the reranker is ready to accept requests
     */
    virtual bool isReady() const = 0;
};

/**
 * @brief Process-wide holder of the reranker model
 *
 * The factory runs at most once, on first acquire(). Its outcome, including a
 * failure, is kept for the lifetime of the service: a failed load is reported
 * on every later acquire() without attempting to load again.
 */
class RerankerService {
public:
    using Factory = std::function<Result<std::shared_ptr<IReranker>>()>;

    explicit RerankerService(Factory factory);
    explicit RerankerService(std::shared_ptr<IReranker> loaded);

    RerankerService(const RerankerService&) = delete;
    RerankerService& operator=(const RerankerService&) = delete;

    Result<std::shared_ptr<IReranker>> acquire() const;

    bool loadAttempted() const;

private:
    Factory factory_;
    mutable std::once_flag once_;
    mutable std::atomic<bool> attempted_{false};
    mutable std::shared_ptr<IReranker> model_;
    mutable std::optional<Error> loadError_;
};

struct RerankConfig {
    size_t topK = 50;               // candidates sent to the model
    size_t maxPassageChars = 512;   // per-passage budget before scoring
    std::chrono::milliseconds timeout{2000};
};

struct RerankOutcome {
    std::vector<Candidate> candidates;
    bool applied = false;
    size_t scored = 0;
    std::optional<Error> error;
};

/**
 * @brief Reorders the top-K window of a fused candidate list
 *
 * Inside the window candidates are sorted by rerank score (ties keep their
 * fused order); candidates beyond the window keep their order and follow the
 * window. On any failure the input order is returned untouched with `error`
 * set. The set of candidate ids never changes.
 */
class CrossEncoderReranker {
public:
    CrossEncoderReranker(std::shared_ptr<RerankerService> service, RerankConfig config,
                         std::shared_ptr<boost::asio::thread_pool> executor);

    RerankOutcome rerank(const std::string& query, std::vector<Candidate> candidates) const;

    const RerankConfig& config() const { return config_; }

private:
    std::shared_ptr<RerankerService> service_;
    RerankConfig config_;
    std::shared_ptr<boost::asio::thread_pool> executor_;
};

// Cut text to at most maxChars bytes without splitting a UTF-8 sequence.
std::string truncatePassage(std::string_view text, size_t maxChars);

} // namespace lexsearch::search
