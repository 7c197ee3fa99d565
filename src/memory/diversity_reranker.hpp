#pragma once
#include "../memory.hpp"
#include <cstddef>
#include <vector>

namespace memoria {

// Maximal Marginal Relevance selection.
//
// Greedily picks up to `k` entries from `pool`, each time taking the one
// maximizing
//     lambda * sim(c, query) - (1 - lambda) * max_{s in selected} sim(c, s)
// where sim(c, query) is the precomputed ScoredMemory::similarity and
// sim(c, s) is the cosine similarity of the two embeddings. Ties go to the
// higher query similarity, then to the more recently updated memory.
//
// Returns entries in selection order; never more than min(k, pool.size()).
// Throws std::invalid_argument if lambda is outside [0, 1].
std::vector<ScoredMemory> mmr_select(const std::vector<ScoredMemory>& pool,
                                     size_t k, double lambda);

} // namespace memoria
