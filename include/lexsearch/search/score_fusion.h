#pragma once

#include <lexsearch/search/search_types.h>

#include <vector>

namespace lexsearch::search {

/**
 * @brief Linear fusion of dense and sparse retrieval scores
 *
 * Each signal is divided by its maximum (a non-positive or missing maximum is
 * replaced by 1), clamped to [0, 1], and combined as
 * `alpha * dense + (1 - alpha) * sparse`. An id present in only one map scores
 * 0 for the other signal. Output is sorted by fused score descending, then raw
 * dense score descending, then id ascending, so identical input always yields
 * identical order. Non-finite input scores are treated as 0.
 */
class ScoreFusion {
public:
    explicit ScoreFusion(double alpha = kDefaultAlpha);

    std::vector<Candidate> fuse(const ScoreMap& dense, const ScoreMap& sparse) const;

    double alpha() const { return alpha_; }

    // Divisor used to normalize a score map: its maximum if positive, else 1.
    static double normalizer(const ScoreMap& scores);

private:
    double alpha_;
};

// Ordering used by every stage that ranks by fused score.
bool fusedOrderBefore(const Candidate& a, const Candidate& b);

std::vector<Candidate> fuse(const ScoreMap& dense, const ScoreMap& sparse,
                            double alpha = kDefaultAlpha);

} // namespace lexsearch::search
