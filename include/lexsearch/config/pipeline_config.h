#pragma once

#include <lexsearch/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace lexsearch::config {

struct SearchSettings {
    double alpha = 0.7;
    size_t denseTopN = 50;
    size_t sparseTopN = 100;
    int maxResultLimit = 50;
    int defaultResultLimit = 5;
    size_t maxQueryChars = 2000;
};

struct RerankSettings {
    bool enabled = true;
    size_t topK = 50;
    size_t maxPassageChars = 512;
    std::chrono::milliseconds timeout{2000};
    std::string endpoint = "http://localhost:8080";
    std::string model = "cross-encoder/ms-marco-MiniLM-L-6-v2";
};

struct CitationSettings {
    size_t maxPerPassage = 3;
    std::string lookupBaseUrl = "https://www.courtlistener.com/c/";
};

struct VectorSettings {
    std::string backend = "qdrant"; // "qdrant" or "memory"
    std::string url = "http://localhost:6333";
    std::string apiKey;
    std::string contractsCollection = "legal_contracts";
    std::string casesCollection = "legal_cases";
    std::chrono::milliseconds timeout{5000};
    std::string corpusPath; // JSON-lines file for the memory backend
};

struct EmbeddingSettings {
    std::string url = "http://localhost:11434";
    std::string model = "all-minilm";
    std::chrono::milliseconds timeout{3000};
};

struct LoggingSettings {
    std::string level; // empty: leave the caller's default
};

/**
 * @brief Complete runtime configuration of the retrieval pipeline
 *
 * Defaults are usable as-is against local services. Values come from the
 * config file, then environment overrides, and are checked once with
 * validate() before the pipeline is built.
 */
struct PipelineConfig {
    SearchSettings search;
    RerankSettings rerank;
    CitationSettings citations;
    VectorSettings vector;
    EmbeddingSettings embedding;
    LoggingSettings logging;

    Result<void> validate() const;
};

// Build a config from "section.key" values; unknown keys are ignored.
Result<PipelineConfig> pipelineConfigFromValues(const std::map<std::string, std::string>& values);

// Load from a TOML file. A missing file yields the defaults.
Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path);

// Apply LEXSEARCH_QDRANT_URL, LEXSEARCH_QDRANT_API_KEY, LEXSEARCH_EMBED_URL and
// LEXSEARCH_RERANK_URL when set and non-empty.
void applyEnvironmentOverrides(PipelineConfig& config);

} // namespace lexsearch::config
