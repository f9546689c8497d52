#include <lexsearch/search/score_fusion.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace lexsearch::search {

namespace {

double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

double normalizedComponent(const ScoreMap& scores, const std::string& id, double divisor) {
    auto it = scores.find(id);
    if (it == scores.end()) {
        return 0.0;
    }
    return std::clamp(finiteOrZero(it->second) / divisor, 0.0, 1.0);
}

} // namespace

ScoreFusion::ScoreFusion(double alpha)
    : alpha_(std::isfinite(alpha) ? std::clamp(alpha, 0.0, 1.0) : kDefaultAlpha) {}

double ScoreFusion::normalizer(const ScoreMap& scores) {
    if (scores.empty()) {
        return 1.0;
    }
    double maxScore = 0.0;
    bool first = true;
    for (const auto& [id, score] : scores) {
        const double s = finiteOrZero(score);
        if (first || s > maxScore) {
            maxScore = s;
            first = false;
        }
    }
    // All-zero (or all-negative) maps would otherwise divide by zero
    return maxScore > 0.0 ? maxScore : 1.0;
}

bool fusedOrderBefore(const Candidate& a, const Candidate& b) {
    if (a.fusedScore != b.fusedScore) {
        return a.fusedScore > b.fusedScore;
    }
    if (a.denseScore != b.denseScore) {
        return a.denseScore > b.denseScore;
    }
    return a.id < b.id;
}

std::vector<Candidate> ScoreFusion::fuse(const ScoreMap& dense, const ScoreMap& sparse) const {
    std::vector<Candidate> fused;
    if (dense.empty() && sparse.empty()) {
        return fused;
    }

    const double maxDense = normalizer(dense);
    const double maxSparse = normalizer(sparse);

    fused.reserve(dense.size() + sparse.size());
    std::unordered_map<std::string, size_t> index;
    index.reserve(dense.size() + sparse.size());

    auto slotFor = [&](const std::string& id) -> Candidate& {
        auto [it, inserted] = index.try_emplace(id, fused.size());
        if (inserted) {
            Candidate c;
            c.id = id;
            fused.push_back(std::move(c));
        }
        return fused[it->second];
    };

    for (const auto& [id, score] : dense) {
        slotFor(id).denseScore = finiteOrZero(score);
    }
    for (const auto& [id, score] : sparse) {
        slotFor(id).sparseScore = finiteOrZero(score);
    }

    for (auto& c : fused) {
        const double d = normalizedComponent(dense, c.id, maxDense);
        const double s = normalizedComponent(sparse, c.id, maxSparse);
        c.fusedScore = std::clamp(alpha_ * d + (1.0 - alpha_) * s, 0.0, 1.0);
    }

    std::sort(fused.begin(), fused.end(), fusedOrderBefore);

    spdlog::debug("Fused {} dense and {} sparse scores into {} candidates (alpha={})",
                  dense.size(), sparse.size(), fused.size(), alpha_);
    return fused;
}

std::vector<Candidate> fuse(const ScoreMap& dense, const ScoreMap& sparse, double alpha) {
    return ScoreFusion(alpha).fuse(dense, sparse);
}

} // namespace lexsearch::search
