// Catch2 tests wiring a full pipeline from configuration over a fake transport

#include <catch2/catch_test_macros.hpp>

#include <lexsearch/search/pipeline_factory.h>

#include "common/test_helpers_catch2.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

using namespace lexsearch;
using namespace lexsearch::search;
using lexsearch::test::FakeHttpClient;
using lexsearch::test::make_temp_dir;
using lexsearch::test::write_file;
using nlohmann::json;

namespace {

constexpr const char* kCorpus =
    R"({"id": "k1", "text": "The indemnification clause survives termination of the agreement.", "embedding": [1, 0], "collection": "contracts", "title": "Supply Agreement"}
{"id": "c1", "text": "Breach of contract damages follow 410 F.3d 100.", "embedding": [0.8, 0.6], "collection": "cases", "case_name": "Acme v. Widget", "court": "ca2", "date_filed": "2005-06-01"}
{"id": "c2", "text": "Habeas corpus relief was denied.", "embedding": [0, 1], "collection": "cases", "case_name": "Ex parte Bell", "court": "scotus", "date_filed": "1998-01-01"}
)";

struct FactoryFixture {
    FactoryFixture() {
        dir = make_temp_dir();
        config.vector.backend = "memory";
        config.vector.corpusPath = write_file(dir / "corpus.jsonl", kCorpus).string();
        config.embedding.url = "http://embed:11434";
        config.rerank.endpoint = "http://rerank:8080";
    }

    ~FactoryFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
    config::PipelineConfig config;
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
};

json rerankResponse(size_t count) {
    json out = json::array();
    for (size_t i = 0; i < count; ++i) {
        // Reverse the fused order
        out.push_back({{"index", i}, {"score", static_cast<double>(i)}});
    }
    return out;
}

} // namespace

TEST_CASE("PipelineFactory builds a working memory-backed pipeline", "[search][factory][catch2]") {
    FactoryFixture fx;
    auto created = PipelineFactory::create(fx.config, fx.http);
    REQUIRE(created);
    auto& pipeline = *created.value();

    SECTION("Full request over fake services") {
        fx.http->enqueue(200, R"({"embedding": [1, 0]})");
        fx.http->enqueue(200, rerankResponse(3).dump());

        auto result = pipeline.search(pipeline.makeRequest("breach of contract"));
        REQUIRE(result);
        const auto& env = result.value();
        CHECK_FALSE(env.degraded.any());
        REQUIRE(env.rankedCandidates.size() == 3);
        for (const auto& c : env.rankedCandidates) {
            CHECK(c.rerankScore.has_value());
        }
        CHECK(*env.rankedCandidates[0].rerankScore == 2.0);

        auto requests = fx.http->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].url == "http://embed:11434/api/embeddings");
        CHECK(requests[1].url == "http://rerank:8080/rerank");
        CHECK(json::parse(requests[1].body)["query"] == "breach of contract");

        // c1 carries a citation wherever it landed
        bool linked = false;
        for (size_t i = 0; i < env.rankedCandidates.size(); ++i) {
            if (env.rankedCandidates[i].id == "c1") {
                REQUIRE(env.citations[i].size() == 1);
                linked = env.citations[i][0].normalizedUrl ==
                         "https://www.courtlistener.com/c/f3d/410/100/";
            }
        }
        CHECK(linked);
    }

    SECTION("Rerank service failure degrades without failing") {
        fx.http->enqueue(200, R"({"embedding": [1, 0]})");
        fx.http->enqueue(503, "warming up");

        auto req = pipeline.makeRequest("indemnification");
        req.collectionScope = CollectionScope::Contracts;
        auto result = pipeline.search(req);
        REQUIRE(result);
        CHECK(result.value().degraded.reranking);
        REQUIRE(result.value().rankedCandidates.size() == 1);
        CHECK(result.value().rankedCandidates[0].id == "k1");
    }

    SECTION("Embedding service down fails the request") {
        fx.http->enqueueError(ErrorCode::NetworkError, "connection refused");
        auto result = pipeline.search(pipeline.makeRequest("contract"));
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::UpstreamUnavailable);
    }
}

TEST_CASE("PipelineFactory rejects unusable configuration", "[search][factory][catch2]") {
    FactoryFixture fx;

    SECTION("Invalid values") {
        fx.config.search.alpha = 3.0;
        auto created = PipelineFactory::create(fx.config, fx.http);
        REQUIRE_FALSE(created);
        CHECK(created.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Missing corpus") {
        fx.config.vector.corpusPath = (fx.dir / "missing.jsonl").string();
        auto created = PipelineFactory::create(fx.config, fx.http);
        REQUIRE_FALSE(created);
        CHECK(created.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("PipelineFactory reranker service", "[search][factory][rerank][catch2]") {
    FactoryFixture fx;

    SECTION("Disabled reranking has no service") {
        fx.config.rerank.enabled = false;
        CHECK(PipelineFactory::createRerankerService(fx.config, fx.http) == nullptr);
    }

    SECTION("Service connects lazily") {
        auto service = PipelineFactory::createRerankerService(fx.config, fx.http);
        REQUIRE(service);
        CHECK_FALSE(service->loadAttempted());
        auto model = service->acquire();
        REQUIRE(model);
        CHECK(model.value()->isReady());
        CHECK(fx.http->requests().empty());
    }

    SECTION("Empty endpoint fails once and stays failed") {
        fx.config.rerank.endpoint.clear();
        auto service = PipelineFactory::createRerankerService(fx.config, fx.http);
        REQUIRE(service);
        CHECK_FALSE(service->acquire());
        CHECK_FALSE(service->acquire());
        CHECK(service->loadAttempted());
    }
}
