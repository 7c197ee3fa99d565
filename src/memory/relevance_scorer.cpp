#include "relevance_scorer.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace memoria {

std::vector<ScoredMemory> score_candidates(const std::vector<Memory>& candidates,
                                           const Embedding& query) {
    std::vector<ScoredMemory> scored;
    scored.reserve(candidates.size());

    for (const auto& m : candidates) {
        if (m.embedding.empty()) {
            std::cerr << "[scorer] skipping memory " << m.id << ": no embedding\n";
            continue;
        }
        double sim = 0.0;
        try {
            sim = cosine_similarity(query, m.embedding);
        } catch (const DimensionMismatch& e) {
            std::cerr << "[scorer] skipping memory " << m.id << ": " << e.what() << "\n";
            continue;
        }
        if (!std::isfinite(sim)) {
            std::cerr << "[scorer] skipping memory " << m.id << ": non-finite embedding\n";
            continue;
        }
        scored.push_back({m, sim});
    }
    return scored;
}

std::vector<ScoredMemory> apply_relevance_floor(std::vector<ScoredMemory> scored,
                                                double floor) {
    scored.erase(std::remove_if(scored.begin(), scored.end(),
        [floor](const ScoredMemory& s) { return s.similarity < floor; }),
        scored.end());
    return scored;
}

void sort_by_similarity(std::vector<ScoredMemory>& scored) {
    std::stable_sort(scored.begin(), scored.end(),
        [](const ScoredMemory& a, const ScoredMemory& b) {
            if (a.similarity != b.similarity) return a.similarity > b.similarity;
            return a.memory.updated_at > b.memory.updated_at;
        });
}

} // namespace memoria
