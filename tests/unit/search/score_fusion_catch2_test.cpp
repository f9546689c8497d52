// Catch2 tests for dense/sparse score fusion

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <lexsearch/search/score_fusion.h>

#include <limits>
#include <string>
#include <vector>

using namespace lexsearch::search;
using Catch::Approx;

namespace {

const Candidate& byId(const std::vector<Candidate>& fused, const std::string& id) {
    for (const auto& c : fused) {
        if (c.id == id) {
            return c;
        }
    }
    FAIL("missing candidate " << id);
    return fused.front();
}

} // namespace

TEST_CASE("ScoreFusion weights normalized signals by alpha", "[search][fusion][catch2]") {
    SECTION("Zero sparse scores leave dense order intact") {
        ScoreMap dense{{"a", 0.9}, {"b", 0.1}};
        ScoreMap sparse{{"a", 0.0}, {"b", 0.0}};

        auto fused = ScoreFusion(0.7).fuse(dense, sparse);

        REQUIRE(fused.size() == 2);
        CHECK(fused[0].id == "a");
        CHECK(fused[0].fusedScore == Approx(0.7));
        CHECK(fused[1].id == "b");
        CHECK(fused[1].fusedScore == Approx(0.7 * 0.1 / 0.9));
        CHECK(fused[0].fusedScore > fused[1].fusedScore);
    }

    SECTION("All-zero maps fuse to zero without dividing by zero") {
        ScoreMap dense{{"a", 0.0}, {"b", 0.0}};
        ScoreMap sparse{{"a", 0.0}, {"b", 0.0}};

        auto fused = fuse(dense, sparse, 0.7);

        REQUIRE(fused.size() == 2);
        for (const auto& c : fused) {
            CHECK(c.fusedScore == 0.0);
        }
        // Ties fall back to id order
        CHECK(fused[0].id == "a");
        CHECK(fused[1].id == "b");
    }

    SECTION("Missing signal counts as zero") {
        ScoreMap dense{{"a", 0.8}};
        ScoreMap sparse{{"b", 4.0}};

        auto fused = ScoreFusion(0.5).fuse(dense, sparse);

        REQUIRE(fused.size() == 2);
        CHECK(byId(fused, "a").fusedScore == Approx(0.5));
        CHECK(byId(fused, "b").fusedScore == Approx(0.5));
        CHECK(byId(fused, "b").denseScore == 0.0);
        CHECK(byId(fused, "b").sparseScore == 4.0);
        // Equal fused score: higher raw dense wins
        CHECK(fused[0].id == "a");
    }

    SECTION("Empty inputs produce no candidates") {
        CHECK(fuse({}, {}).empty());
    }
}

TEST_CASE("ScoreFusion alpha extremes select one signal", "[search][fusion][catch2]") {
    ScoreMap dense{{"a", 0.9}, {"b", 0.3}};
    ScoreMap sparse{{"a", 1.0}, {"b", 5.0}};

    SECTION("alpha = 1 is dense only") {
        auto fused = ScoreFusion(1.0).fuse(dense, sparse);
        CHECK(fused[0].id == "a");
        CHECK(byId(fused, "b").fusedScore == Approx(0.3 / 0.9));
    }

    SECTION("alpha = 0 is sparse only") {
        auto fused = ScoreFusion(0.0).fuse(dense, sparse);
        CHECK(fused[0].id == "b");
        CHECK(byId(fused, "b").fusedScore == Approx(1.0));
        CHECK(byId(fused, "a").fusedScore == Approx(0.2));
    }

    SECTION("Out-of-range alpha is clamped") {
        CHECK(ScoreFusion(1.5).alpha() == 1.0);
        CHECK(ScoreFusion(-0.5).alpha() == 0.0);
        CHECK(ScoreFusion(std::numeric_limits<double>::quiet_NaN()).alpha() == kDefaultAlpha);
    }
}

TEST_CASE("ScoreFusion keeps fused scores within [0, 1]", "[search][fusion][catch2]") {
    ScoreMap dense{{"a", -0.4}, {"b", 0.6}, {"c", std::numeric_limits<double>::infinity()}};
    ScoreMap sparse{{"a", 12.0}, {"b", -3.0}};

    auto fused = ScoreFusion(0.7).fuse(dense, sparse);

    REQUIRE(fused.size() == 3);
    for (const auto& c : fused) {
        CHECK(c.fusedScore >= 0.0);
        CHECK(c.fusedScore <= 1.0);
    }
    CHECK(byId(fused, "c").denseScore == 0.0);
    CHECK(byId(fused, "c").fusedScore == 0.0);
}

TEST_CASE("ScoreFusion normalizer", "[search][fusion][catch2]") {
    CHECK(ScoreFusion::normalizer({}) == 1.0);
    CHECK(ScoreFusion::normalizer({{"a", 0.0}}) == 1.0);
    CHECK(ScoreFusion::normalizer({{"a", -2.0}, {"b", -1.0}}) == 1.0);
    CHECK(ScoreFusion::normalizer({{"a", 2.5}, {"b", 1.0}}) == 2.5);
}

TEST_CASE("ScoreFusion ordering is deterministic", "[search][fusion][catch2]") {
    ScoreMap dense{{"d", 0.5}, {"c", 0.5}, {"b", 0.5}, {"a", 0.5}};
    auto first = fuse(dense, {}, 1.0);
    auto second = fuse(dense, {}, 1.0);

    REQUIRE(first.size() == 4);
    for (size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].id == second[i].id);
    }
    CHECK(first[0].id == "a");
    CHECK(first[3].id == "d");
}
