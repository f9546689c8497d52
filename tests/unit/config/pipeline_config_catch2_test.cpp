// Catch2 tests for configuration loading, environment overrides and validation

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <lexsearch/config/config_helpers.h>
#include <lexsearch/config/pipeline_config.h>

#include "common/test_helpers_catch2.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

using namespace lexsearch;
using namespace lexsearch::config;
using lexsearch::test::make_temp_dir;
using lexsearch::test::ScopedEnvVar;
using lexsearch::test::write_file;
using Catch::Approx;

namespace {

struct TempDirGuard {
    std::filesystem::path path = make_temp_dir();
    ~TempDirGuard() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("parse_simple_toml reads sections and values", "[config][toml][catch2]") {
    TempDirGuard dir;
    auto file = write_file(dir.path / "config.toml", R"(# lexsearch settings
top = "level"

[search]
alpha = 0.5   # dense weight
dense_top_n = 20

[citations]
lookup_base_url = "https://cite.example/#anchor"

[ vector ]
url = 'http://qdrant:6333'
malformed line
)");

    auto values = parse_simple_toml(file);
    CHECK(values["top"] == "level");
    CHECK(values["search.alpha"] == "0.5");
    CHECK(values["search.dense_top_n"] == "20");
    CHECK(values["citations.lookup_base_url"] == "https://cite.example/#anchor");
    CHECK(values["vector.url"] == "http://qdrant:6333");
    CHECK(values.count("malformed line") == 0);

    CHECK(parse_config_value(file, "search", "alpha") == "0.5");
    CHECK(parse_config_value(file, "search", "missing").empty());
    CHECK(parse_simple_toml(dir.path / "absent.toml").empty());
}

TEST_CASE("parse_simple_toml trims and unquotes values", "[config][toml][catch2]") {
    TempDirGuard dir;
    auto file = write_file(dir.path / "quotes.toml",
                           "[rerank]\n"
                           "\t model   =   \"bge-reranker\"   \n"
                           "endpoint='http://rerank:8080'\n"
                           "mixed = \"open'\n"
                           "bare =  plain value  # trailing\n"
                           "empty = \"\"\n");

    auto values = parse_simple_toml(file);
    CHECK(values["rerank.model"] == "bge-reranker");
    CHECK(values["rerank.endpoint"] == "http://rerank:8080");
    CHECK(values["rerank.mixed"] == "\"open'");
    CHECK(values["rerank.bare"] == "plain value");
    CHECK(values["rerank.empty"].empty());
}

TEST_CASE("Config helper utilities", "[config][helpers][catch2]") {
    SECTION("expand_tilde uses HOME") {
        ScopedEnvVar home("HOME", std::string("/home/clerk"));
        CHECK(expand_tilde("~/corpus.jsonl") == std::filesystem::path("/home/clerk/corpus.jsonl"));
        CHECK(expand_tilde("/abs/path") == std::filesystem::path("/abs/path"));
    }

    SECTION("sanitize_for_terminal replaces control characters") {
        CHECK(sanitize_for_terminal("ok\x1b[31mred\n") == "ok?[31mred\n");
    }

    SECTION("Config path resolution order") {
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/xdg"));
        ScopedEnvVar env("LEXSEARCH_CONFIG", std::nullopt);
        CHECK(get_config_path() == std::filesystem::path("/xdg/lexsearch/config.toml"));
        {
            ScopedEnvVar explicitPath("LEXSEARCH_CONFIG", std::string("/etc/lexsearch.toml"));
            CHECK(get_config_path() == std::filesystem::path("/etc/lexsearch.toml"));
            CHECK(get_config_path("/override.toml") == std::filesystem::path("/override.toml"));
        }
    }
}

TEST_CASE("loadPipelineConfig", "[config][pipeline][catch2]") {
    TempDirGuard dir;

    SECTION("Missing file yields defaults") {
        auto cfg = loadPipelineConfig(dir.path / "none.toml");
        REQUIRE(cfg);
        CHECK(cfg.value().search.alpha == Approx(0.7));
        CHECK(cfg.value().search.defaultResultLimit == 5);
        CHECK(cfg.value().rerank.topK == 50);
        CHECK(cfg.value().citations.maxPerPassage == 3);
        CHECK(cfg.value().vector.contractsCollection == "legal_contracts");
        CHECK(cfg.value().vector.casesCollection == "legal_cases");
        CHECK(cfg.value().validate());
    }

    SECTION("File values override defaults") {
        auto file = write_file(dir.path / "config.toml", R"(
[search]
alpha = 0.4
dense_top_n = 30
sparse_top_n = 60
max_result_limit = 20
default_result_limit = 10

[rerank]
enabled = false
top_k = 25
timeout_ms = 750
endpoint = "http://rerank:8080"

[citations]
max_per_passage = 5

[vector]
backend = "memory"
corpus_path = "/data/corpus.jsonl"
cases_collection = "opinions"

[embedding]
url = "http://ollama:11434"
timeout_ms = 1500

[logging]
level = "debug"
)");
        auto loaded = loadPipelineConfig(file);
        REQUIRE(loaded);
        const auto& cfg = loaded.value();
        CHECK(cfg.search.alpha == Approx(0.4));
        CHECK(cfg.search.denseTopN == 30);
        CHECK(cfg.search.sparseTopN == 60);
        CHECK(cfg.search.maxResultLimit == 20);
        CHECK(cfg.search.defaultResultLimit == 10);
        CHECK_FALSE(cfg.rerank.enabled);
        CHECK(cfg.rerank.topK == 25);
        CHECK(cfg.rerank.timeout == std::chrono::milliseconds(750));
        CHECK(cfg.rerank.endpoint == "http://rerank:8080");
        CHECK(cfg.citations.maxPerPassage == 5);
        CHECK(cfg.vector.backend == "memory");
        CHECK(cfg.vector.corpusPath == "/data/corpus.jsonl");
        CHECK(cfg.vector.casesCollection == "opinions");
        CHECK(cfg.embedding.url == "http://ollama:11434");
        CHECK(cfg.embedding.timeout == std::chrono::milliseconds(1500));
        CHECK(cfg.logging.level == "debug");
        CHECK(cfg.validate());
    }

    SECTION("Malformed values are rejected with the key name") {
        auto file = write_file(dir.path / "bad.toml", "[search]\nalpha = high\n");
        auto loaded = loadPipelineConfig(file);
        REQUIRE_FALSE(loaded);
        CHECK(loaded.error().code == ErrorCode::InvalidArgument);
        CHECK(loaded.error().message.find("search.alpha") != std::string::npos);

        auto negative = pipelineConfigFromValues({{"search.dense_top_n", "-4"}});
        REQUIRE_FALSE(negative);
        CHECK(negative.error().code == ErrorCode::InvalidArgument);

        auto flag = pipelineConfigFromValues({{"rerank.enabled", "maybe"}});
        REQUIRE_FALSE(flag);
        CHECK(flag.error().message.find("rerank.enabled") != std::string::npos);
    }

    SECTION("Unknown keys are ignored") {
        auto cfg = pipelineConfigFromValues({{"search.unknown", "1"}, {"other.key", "x"}});
        REQUIRE(cfg);
        CHECK(cfg.value().validate());
    }
}

TEST_CASE("applyEnvironmentOverrides", "[config][env][catch2]") {
    ScopedEnvVar qdrant("LEXSEARCH_QDRANT_URL", std::string("http://qdrant.internal:6333"));
    ScopedEnvVar key("LEXSEARCH_QDRANT_API_KEY", std::string("secret"));
    ScopedEnvVar embed("LEXSEARCH_EMBED_URL", std::string(""));
    ScopedEnvVar rerank("LEXSEARCH_RERANK_URL", std::nullopt);

    PipelineConfig cfg;
    applyEnvironmentOverrides(cfg);
    CHECK(cfg.vector.url == "http://qdrant.internal:6333");
    CHECK(cfg.vector.apiKey == "secret");
    // Empty or unset variables keep configured values
    CHECK(cfg.embedding.url == "http://localhost:11434");
    CHECK(cfg.rerank.endpoint == "http://localhost:8080");
}

TEST_CASE("PipelineConfig::validate", "[config][validate][catch2]") {
    auto expectInvalid = [](const PipelineConfig& cfg) {
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    };

    PipelineConfig cfg;
    REQUIRE(cfg.validate());

    SECTION("alpha") {
        cfg.search.alpha = 1.2;
        expectInvalid(cfg);
        cfg.search.alpha = -0.1;
        expectInvalid(cfg);
    }

    SECTION("limits") {
        cfg.search.denseTopN = 0;
        expectInvalid(cfg);
        cfg.search.denseTopN = 50;
        cfg.search.defaultResultLimit = 60;
        expectInvalid(cfg);
        cfg.search.defaultResultLimit = 5;
        cfg.search.maxQueryChars = 0;
        expectInvalid(cfg);
    }

    SECTION("rerank window only matters when enabled") {
        cfg.rerank.topK = 0;
        expectInvalid(cfg);
        cfg.rerank.enabled = false;
        CHECK(cfg.validate());
    }

    SECTION("citations") {
        cfg.citations.maxPerPassage = 0;
        expectInvalid(cfg);
        cfg.citations.maxPerPassage = 3;
        cfg.citations.lookupBaseUrl.clear();
        expectInvalid(cfg);
    }

    SECTION("vector backend") {
        cfg.vector.backend = "pinecone";
        expectInvalid(cfg);
        cfg.vector.backend = "memory";
        expectInvalid(cfg);
        cfg.vector.corpusPath = "/data/corpus.jsonl";
        CHECK(cfg.validate());
    }

    SECTION("embedding") {
        cfg.embedding.model.clear();
        expectInvalid(cfg);
    }

    SECTION("every external call keeps a deadline") {
        cfg.vector.timeout = std::chrono::milliseconds(0);
        expectInvalid(cfg);
        cfg.vector.timeout = std::chrono::milliseconds(5000);
        cfg.embedding.timeout = std::chrono::milliseconds(0);
        expectInvalid(cfg);
        cfg.embedding.timeout = std::chrono::milliseconds(3000);
        cfg.rerank.timeout = std::chrono::milliseconds(-1);
        expectInvalid(cfg);
        cfg.rerank.enabled = false;
        expectInvalid(cfg);
    }

    SECTION("zero timeout read from the file is rejected") {
        auto parsed = pipelineConfigFromValues({{"vector.timeout_ms", "0"}});
        REQUIRE(parsed);
        expectInvalid(parsed.value());
    }
}

TEST_CASE("pipelineConfigFromValues range-checks integers", "[config][pipeline][catch2]") {
    auto expectRejected = [](std::map<std::string, std::string> values) {
        auto r = pipelineConfigFromValues(values);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    };

    // Larger than int; must not wrap around to a small limit
    expectRejected({{"search.max_result_limit", "4294967297"}});
    expectRejected({{"search.default_result_limit", "2147483648"}});

    auto largest = pipelineConfigFromValues({{"search.max_result_limit", "2147483647"}});
    REQUIRE(largest);
    CHECK(largest.value().search.maxResultLimit == 2147483647);
}
