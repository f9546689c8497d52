// Shared helpers and collaborator fakes for Catch2 unit tests

#pragma once

#include <lexsearch/net/http_client.h>
#include <lexsearch/search/reranker.h>
#include <lexsearch/search/sparse_retriever.h>
#include <lexsearch/vector/embedding_provider.h>
#include <lexsearch/vector/vector_index.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace lexsearch::test {

/**
 * @brief Creates a unique temporary directory with the given prefix.
 */
inline std::filesystem::path make_temp_dir(std::string_view prefix = "lexsearch_test_") {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    std::uniform_int_distribution<int> dist(0, 9999);
    thread_local std::mt19937_64 rng{std::random_device{}()};
    for (int attempt = 0; attempt < 512; ++attempt) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto candidate =
            base / (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    return base;
}

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
        if (const char* prev = std::getenv(key_.c_str())) {
            previous_ = prev;
        }
        set(value);
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { set(previous_); }

private:
    void set(const std::optional<std::string>& value) {
        if (value) {
            ::setenv(key_.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

// ============================================================================
// Collaborator fakes
// ============================================================================

/**
 * Returns a fixed embedding, or fails / stalls on demand.
 */
class MockEmbeddingProvider : public vector::IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(std::vector<float> embedding = {1.0f, 0.0f})
        : embedding_(std::move(embedding)) {}

    Result<std::vector<float>> embed(const std::string& text) override {
        callCount_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastText_ = text;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (fail_) {
            return Error{ErrorCode::NetworkError, "embedding service down"};
        }
        return embedding_;
    }

    void setFail(bool fail) { fail_ = fail; }
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }
    int callCount() const { return callCount_.load(); }
    std::string lastText() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastText_;
    }

private:
    std::vector<float> embedding_;
    std::atomic<int> callCount_{0};
    std::atomic<bool> fail_{false};
    std::chrono::milliseconds delay_{0};
    mutable std::mutex mutex_;
    std::string lastText_;
};

/**
 * Serves a fixed hit list regardless of the query embedding.
 */
class MockVectorIndex : public vector::IVectorIndex {
public:
    explicit MockVectorIndex(std::vector<vector::VectorHit> hits = {}) : hits_(std::move(hits)) {}

    Result<vector::VectorSearchResult> search(const std::vector<float>& /*embedding*/, size_t topN,
                                              search::CollectionScope scope,
                                              const search::SearchFilters& /*filters*/) override {
        callCount_++;
        lastScope_ = scope;
        if (fail_) {
            return Error{ErrorCode::NetworkError, "vector index down"};
        }
        vector::VectorSearchResult result;
        result.hits = hits_;
        if (result.hits.size() > topN) {
            result.hits.resize(topN);
        }
        result.failedCollections = failedCollections_;
        return result;
    }

    void setFail(bool fail) { fail_ = fail; }
    void setFailedCollections(std::vector<std::string> names) {
        failedCollections_ = std::move(names);
    }
    int callCount() const { return callCount_.load(); }
    search::CollectionScope lastScope() const { return lastScope_.load(); }

private:
    std::vector<vector::VectorHit> hits_;
    std::vector<std::string> failedCollections_;
    std::atomic<int> callCount_{0};
    std::atomic<bool> fail_{false};
    std::atomic<search::CollectionScope> lastScope_{search::CollectionScope::Both};
};

/**
 * Counts calls and delegates to BM25 over the candidate pool.
 */
class CountingSparseRetriever : public search::ISparseRetriever {
public:
    Result<std::vector<search::SparseHit>> search(const std::vector<std::string>& queryTokens,
                                                  const std::vector<search::Candidate>& densePool,
                                                  size_t topN) override {
        callCount_++;
        if (throw_) {
            throw std::runtime_error("sparse index corrupted");
        }
        if (fail_) {
            return Error{ErrorCode::InternalError, "sparse index unavailable"};
        }
        return inner_.search(queryTokens, densePool, topN);
    }

    void setFail(bool fail) { fail_ = fail; }
    void setThrow(bool t) { throw_ = t; }
    int callCount() const { return callCount_.load(); }

private:
    search::CandidatePoolBm25Retriever inner_;
    std::atomic<int> callCount_{0};
    std::atomic<bool> fail_{false};
    std::atomic<bool> throw_{false};
};

/**
 * Scores passages from a per-text lookup (default: passage length).
 */
class MockReranker : public search::IReranker {
public:
    Result<std::vector<double>> scoreDocuments(const std::string& query,
                                               const std::vector<std::string>& documents) override {
        callCount_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastQuery_ = query;
            lastDocuments_ = documents;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (throw_) {
            throw std::runtime_error("inference crashed");
        }
        if (fail_) {
            return Error{ErrorCode::InternalError, "inference failed"};
        }
        std::vector<double> scores;
        scores.reserve(documents.size());
        for (const auto& doc : documents) {
            auto it = std::find_if(scoreByText_.begin(), scoreByText_.end(),
                                   [&doc](const auto& p) { return p.first == doc; });
            scores.push_back(it != scoreByText_.end() ? it->second
                                                      : static_cast<double>(doc.size()));
        }
        if (dropLast_ && !scores.empty()) {
            scores.pop_back();
        }
        return scores;
    }

    bool isReady() const override { return true; }

    void setScore(std::string text, double score) {
        scoreByText_.emplace_back(std::move(text), score);
    }
    void setFail(bool fail) { fail_ = fail; }
    void setThrow(bool t) { throw_ = t; }
    void setDropLast(bool drop) { dropLast_ = drop; }
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }
    int callCount() const { return callCount_.load(); }
    std::string lastQuery() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastQuery_;
    }
    std::vector<std::string> lastDocuments() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastDocuments_;
    }

private:
    std::vector<std::pair<std::string, double>> scoreByText_;
    std::atomic<int> callCount_{0};
    std::atomic<bool> fail_{false};
    std::atomic<bool> throw_{false};
    std::atomic<bool> dropLast_{false};
    std::chrono::milliseconds delay_{0};
    mutable std::mutex mutex_;
    std::string lastQuery_;
    std::vector<std::string> lastDocuments_;
};

/**
 * Answers POSTs from a queue of canned responses and records every request.
 */
class FakeHttpClient : public net::IHttpClient {
public:
    struct Request {
        std::string url;
        std::string body;
        std::vector<net::Header> headers;
    };

    void enqueue(long status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(net::HttpResponse{status, std::move(body)});
    }

    void enqueueError(ErrorCode code, std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(Error{code, std::move(message)});
    }

    Result<net::HttpResponse> postJson(std::string_view url, const std::string& body,
                                       const std::vector<net::Header>& headers,
                                       std::chrono::milliseconds /*timeout*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(Request{std::string(url), body, headers});
        if (responses_.empty()) {
            return Error{ErrorCode::NetworkError, "no canned response"};
        }
        auto next = std::move(responses_.front());
        responses_.pop_front();
        return next;
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<net::HttpResponse>> responses_;
    std::vector<Request> requests_;
};

inline vector::VectorHit makeHit(std::string id, double similarity, std::string text,
                                 std::string title = {}) {
    vector::VectorHit hit;
    hit.id = std::move(id);
    hit.similarity = similarity;
    hit.text = std::move(text);
    hit.metadata.title = std::move(title);
    hit.metadata.collection = "legal_cases";
    return hit;
}

} // namespace lexsearch::test
