#pragma once
#include "../memory.hpp"
#include <vector>

namespace memoria {

// Pair each candidate with its cosine similarity to `query`.
// Candidates with an empty embedding, one whose length differs from the
// query, or one that yields a non-finite similarity (NaN or infinite
// components) are malformed: they are skipped and logged, never raised.
std::vector<ScoredMemory> score_candidates(const std::vector<Memory>& candidates,
                                           const Embedding& query);

// Keep only entries with similarity >= floor.
std::vector<ScoredMemory> apply_relevance_floor(std::vector<ScoredMemory> scored,
                                                double floor);

// Similarity descending; equal scores put the most recently updated first.
void sort_by_similarity(std::vector<ScoredMemory>& scored);

} // namespace memoria
