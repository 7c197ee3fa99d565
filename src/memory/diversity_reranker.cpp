#include "diversity_reranker.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace memoria {

static constexpr double kTieEpsilon = 1e-9;

// Pairwise similarity between two pool members. Mismatched lengths cannot
// occur after scoring against a single query, but are treated as unrelated.
static double pair_similarity(const Memory& a, const Memory& b) {
    try {
        return cosine_similarity(a.embedding, b.embedding);
    } catch (const DimensionMismatch&) {
        return 0.0;
    }
}

static bool better_candidate(double score, const ScoredMemory& c,
                             double best_score, const ScoredMemory& best) {
    if (std::fabs(score - best_score) > kTieEpsilon) return score > best_score;
    if (std::fabs(c.similarity - best.similarity) > kTieEpsilon) {
        return c.similarity > best.similarity;
    }
    return c.memory.updated_at > best.memory.updated_at;
}

std::vector<ScoredMemory> mmr_select(const std::vector<ScoredMemory>& pool,
                                     size_t k, double lambda) {
    if (!(lambda >= 0.0 && lambda <= 1.0)) {
        throw std::invalid_argument("mmr lambda must be within [0, 1]");
    }

    std::vector<ScoredMemory> selected;
    if (pool.empty() || k == 0) return selected;

    size_t target = std::min(k, pool.size());
    selected.reserve(target);

    std::vector<size_t> remaining(pool.size());
    for (size_t i = 0; i < pool.size(); ++i) remaining[i] = i;

    // Running max similarity of each pool entry to anything selected so far.
    std::vector<double> max_to_selected(pool.size(), 0.0);

    while (selected.size() < target && !remaining.empty()) {
        size_t best_pos = 0;
        double best_score = -std::numeric_limits<double>::infinity();

        for (size_t pos = 0; pos < remaining.size(); ++pos) {
            size_t idx = remaining[pos];
            double penalty = selected.empty() ? 0.0 : max_to_selected[idx];
            double score = lambda * pool[idx].similarity - (1.0 - lambda) * penalty;
            if (pos == 0 ||
                better_candidate(score, pool[idx], best_score, pool[remaining[best_pos]])) {
                best_pos = pos;
                best_score = score;
            }
        }

        size_t chosen = remaining[best_pos];
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best_pos));
        selected.push_back(pool[chosen]);

        for (size_t idx : remaining) {
            double sim = pair_similarity(pool[idx].memory, pool[chosen].memory);
            if (selected.size() == 1 || sim > max_to_selected[idx]) {
                max_to_selected[idx] = sim;
            }
        }
    }

    return selected;
}

} // namespace memoria
