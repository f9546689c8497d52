#include <lexsearch/config/config_helpers.h>
#include <lexsearch/config/pipeline_config.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <utility>

namespace lexsearch::config {

namespace {

Error badValue(const std::string& key, const std::string& value, const std::string& expected) {
    return Error{ErrorCode::InvalidArgument,
                 "Config " + key + " = '" + value + "': expected " + expected};
}

std::optional<std::string> lookup(const std::map<std::string, std::string>& values,
                                  const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> readDouble(const std::map<std::string, std::string>& values, const std::string& key,
                        double& out) {
    auto raw = lookup(values, key);
    if (!raw) {
        return {};
    }
    try {
        size_t used = 0;
        double parsed = std::stod(*raw, &used);
        if (used != raw->size() || !std::isfinite(parsed)) {
            return badValue(key, *raw, "a number");
        }
        out = parsed;
    } catch (const std::exception&) {
        return badValue(key, *raw, "a number");
    }
    return {};
}

template <typename Int>
Result<void> readInteger(const std::map<std::string, std::string>& values, const std::string& key,
                         Int& out) {
    auto raw = lookup(values, key);
    if (!raw) {
        return {};
    }
    try {
        size_t used = 0;
        long long parsed = std::stoll(*raw, &used);
        if (used != raw->size() || parsed < 0) {
            return badValue(key, *raw, "a non-negative integer");
        }
        if (static_cast<unsigned long long>(parsed) >
            static_cast<unsigned long long>(std::numeric_limits<Int>::max())) {
            return badValue(key, *raw, "an integer no larger than " +
                                           std::to_string(std::numeric_limits<Int>::max()));
        }
        out = static_cast<Int>(parsed);
    } catch (const std::exception&) {
        return badValue(key, *raw, "a non-negative integer");
    }
    return {};
}

Result<void> readMillis(const std::map<std::string, std::string>& values, const std::string& key,
                        std::chrono::milliseconds& out) {
    long long ms = out.count();
    auto r = readInteger(values, key, ms);
    if (r) {
        out = std::chrono::milliseconds(ms);
    }
    return r;
}

Result<void> readBool(const std::map<std::string, std::string>& values, const std::string& key,
                      bool& out) {
    auto raw = lookup(values, key);
    if (!raw) {
        return {};
    }
    if (*raw == "true" || *raw == "1" || *raw == "yes" || *raw == "on") {
        out = true;
    } else if (*raw == "false" || *raw == "0" || *raw == "no" || *raw == "off") {
        out = false;
    } else {
        return badValue(key, *raw, "true or false");
    }
    return {};
}

void readString(const std::map<std::string, std::string>& values, const std::string& key,
                std::string& out) {
    if (auto raw = lookup(values, key)) {
        out = *raw;
    }
}

} // namespace

Result<void> PipelineConfig::validate() const {
    if (!(search.alpha >= 0.0 && search.alpha <= 1.0)) {
        return Error{ErrorCode::InvalidArgument, "search.alpha must be within [0, 1]"};
    }
    if (search.denseTopN == 0) {
        return Error{ErrorCode::InvalidArgument, "search.dense_top_n must be positive"};
    }
    if (search.sparseTopN == 0) {
        return Error{ErrorCode::InvalidArgument, "search.sparse_top_n must be positive"};
    }
    if (search.maxResultLimit <= 0) {
        return Error{ErrorCode::InvalidArgument, "search.max_result_limit must be positive"};
    }
    if (search.defaultResultLimit <= 0 || search.defaultResultLimit > search.maxResultLimit) {
        return Error{ErrorCode::InvalidArgument,
                     "search.default_result_limit must be within [1, max_result_limit]"};
    }
    if (search.maxQueryChars == 0) {
        return Error{ErrorCode::InvalidArgument, "search.max_query_chars must be positive"};
    }
    if (rerank.enabled && (rerank.topK == 0 || rerank.maxPassageChars == 0)) {
        return Error{ErrorCode::InvalidArgument,
                     "rerank.top_k and rerank.max_passage_chars must be positive"};
    }
    for (const auto& [key, timeout] : {std::pair{"rerank.timeout_ms", rerank.timeout},
                                       std::pair{"vector.timeout_ms", vector.timeout},
                                       std::pair{"embedding.timeout_ms", embedding.timeout}}) {
        if (timeout.count() <= 0) {
            return Error{ErrorCode::InvalidArgument, std::string(key) + " must be positive"};
        }
    }
    if (citations.maxPerPassage == 0) {
        return Error{ErrorCode::InvalidArgument, "citations.max_per_passage must be positive"};
    }
    if (citations.lookupBaseUrl.empty()) {
        return Error{ErrorCode::InvalidArgument, "citations.lookup_base_url must not be empty"};
    }
    if (vector.backend != "qdrant" && vector.backend != "memory") {
        return Error{ErrorCode::InvalidArgument,
                     "vector.backend must be 'qdrant' or 'memory', got '" + vector.backend + "'"};
    }
    if (vector.backend == "memory" && vector.corpusPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "vector.corpus_path is required for the memory backend"};
    }
    if (vector.backend == "qdrant" && vector.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "vector.url must not be empty"};
    }
    if (embedding.url.empty() || embedding.model.empty()) {
        return Error{ErrorCode::InvalidArgument, "embedding.url and embedding.model are required"};
    }
    return {};
}

Result<PipelineConfig> pipelineConfigFromValues(const std::map<std::string, std::string>& values) {
    PipelineConfig cfg;

    for (auto r : {readDouble(values, "search.alpha", cfg.search.alpha),
                   readInteger(values, "search.dense_top_n", cfg.search.denseTopN),
                   readInteger(values, "search.sparse_top_n", cfg.search.sparseTopN),
                   readInteger(values, "search.max_result_limit", cfg.search.maxResultLimit),
                   readInteger(values, "search.default_result_limit", cfg.search.defaultResultLimit),
                   readInteger(values, "search.max_query_chars", cfg.search.maxQueryChars),
                   readBool(values, "rerank.enabled", cfg.rerank.enabled),
                   readInteger(values, "rerank.top_k", cfg.rerank.topK),
                   readInteger(values, "rerank.max_passage_chars", cfg.rerank.maxPassageChars),
                   readMillis(values, "rerank.timeout_ms", cfg.rerank.timeout),
                   readInteger(values, "citations.max_per_passage", cfg.citations.maxPerPassage),
                   readMillis(values, "vector.timeout_ms", cfg.vector.timeout),
                   readMillis(values, "embedding.timeout_ms", cfg.embedding.timeout)}) {
        if (!r) {
            return r.error();
        }
    }

    readString(values, "rerank.endpoint", cfg.rerank.endpoint);
    readString(values, "rerank.model", cfg.rerank.model);
    readString(values, "citations.lookup_base_url", cfg.citations.lookupBaseUrl);
    readString(values, "vector.backend", cfg.vector.backend);
    readString(values, "vector.url", cfg.vector.url);
    readString(values, "vector.api_key", cfg.vector.apiKey);
    readString(values, "vector.contracts_collection", cfg.vector.contractsCollection);
    readString(values, "vector.cases_collection", cfg.vector.casesCollection);
    readString(values, "embedding.url", cfg.embedding.url);
    readString(values, "embedding.model", cfg.embedding.model);
    readString(values, "logging.level", cfg.logging.level);

    if (auto corpus = lookup(values, "vector.corpus_path"); corpus && !corpus->empty()) {
        cfg.vector.corpusPath = expand_tilde(*corpus).string();
    }
    return cfg;
}

Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return PipelineConfig{};
    }
    auto values = parse_simple_toml(path);
    spdlog::debug("Loaded {} config values from {}", values.size(), path.string());
    return pipelineConfigFromValues(values);
}

void applyEnvironmentOverrides(PipelineConfig& config) {
    auto apply = [](const char* name, std::string& target) {
        if (const char* env = std::getenv(name); env && *env) {
            target = env;
            spdlog::debug("{} overrides configured value", name);
        }
    };
    apply("LEXSEARCH_QDRANT_URL", config.vector.url);
    apply("LEXSEARCH_QDRANT_API_KEY", config.vector.apiKey);
    apply("LEXSEARCH_EMBED_URL", config.embedding.url);
    apply("LEXSEARCH_RERANK_URL", config.rerank.endpoint);
}

} // namespace lexsearch::config
