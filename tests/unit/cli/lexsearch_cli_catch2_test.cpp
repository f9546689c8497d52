// Catch2 tests for command-line parsing and exit codes

#include <catch2/catch_test_macros.hpp>

#include <lexsearch/cli/lexsearch_cli.h>

#include "common/test_helpers_catch2.h"

#include <filesystem>
#include <string>
#include <vector>

using namespace lexsearch;
using lexsearch::cli::LexsearchCLI;
using lexsearch::test::make_temp_dir;
using lexsearch::test::ScopedEnvVar;
using lexsearch::test::write_file;

namespace {

int runCli(std::vector<std::string> args) {
    args.insert(args.begin(), "lexsearch");
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    LexsearchCLI cli;
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

struct CliEnvironment {
    CliEnvironment() {
        write_file(dir / "corpus.jsonl",
                   R"({"id": "c1", "text": "Held in 123 U.S. 456.", "embedding": [1, 0], "collection": "cases"})"
                   "\n");
        config = write_file(dir / "config.toml", "[vector]\nbackend = \"memory\"\ncorpus_path = \"" +
                                                     (dir / "corpus.jsonl").string() + "\"\n");
    }

    ~CliEnvironment() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir = make_temp_dir();
    std::filesystem::path config;
};

} // namespace

TEST_CASE("LexsearchCLI::parseLogLevel", "[cli][logging][catch2]") {
    CHECK(LexsearchCLI::parseLogLevel("debug") == spdlog::level::debug);
    CHECK(LexsearchCLI::parseLogLevel("WARNING") == spdlog::level::warn);
    CHECK(LexsearchCLI::parseLogLevel("err") == spdlog::level::err);
    CHECK(LexsearchCLI::parseLogLevel("silent") == spdlog::level::off);
    CHECK_FALSE(LexsearchCLI::parseLogLevel("loud"));
}

TEST_CASE("LexsearchCLI exit codes", "[cli][catch2]") {
    CliEnvironment env;
    ScopedEnvVar configVar("LEXSEARCH_CONFIG", env.config.string());
    ScopedEnvVar logVar("LEXSEARCH_LOG_LEVEL", std::string("off"));

    SECTION("cite succeeds on inline text") {
        CHECK(runCli({"cite", "See", "123", "U.S.", "456"}) == 0);
        CHECK(runCli({"cite", "--format", "plain", "See", "123", "U.S.", "456"}) == 0);
        CHECK(runCli({"cite", "--json", "Smith", "v.", "Jones"}) == 0);
    }

    SECTION("Unknown format is a usage error") {
        CHECK(runCli({"cite", "--format", "pdf", "text"}) != 0);
    }

    SECTION("Invalid search input exits with 2 before contacting services") {
        CHECK(runCli({"search", "--limit", "0", "contract"}) == 2);
        CHECK(runCli({"search", "--from", "2020-01-01", "--to", "2019-01-01", "contract"}) == 2);
    }

    SECTION("Unknown collection is rejected by the parser") {
        CHECK(runCli({"search", "--collection", "statutes", "contract"}) != 0);
    }

    SECTION("A subcommand is required") {
        CHECK(runCli({}) != 0);
    }

    SECTION("Broken configuration is reported") {
        auto bad = write_file(env.dir / "bad.toml", "[search]\nalpha = lots\n");
        ScopedEnvVar badConfig("LEXSEARCH_CONFIG", bad.string());
        CHECK(runCli({"search", "contract"}) == 2);
    }
}

TEST_CASE("LexsearchCLI loads configuration once", "[cli][config][catch2]") {
    CliEnvironment env;
    ScopedEnvVar configVar("LEXSEARCH_CONFIG", env.config.string());
    ScopedEnvVar qdrant("LEXSEARCH_QDRANT_URL", std::string("http://qdrant.test:6333"));

    LexsearchCLI cli;
    auto cfg = cli.getConfig();
    REQUIRE(cfg);
    CHECK(cfg.value().vector.backend == "memory");
    CHECK(cfg.value().vector.url == "http://qdrant.test:6333");

    auto pipeline = cli.getPipeline();
    REQUIRE(pipeline);
    auto again = cli.getPipeline();
    REQUIRE(again);
    CHECK(pipeline.value().get() == again.value().get());
}
