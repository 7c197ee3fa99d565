#pragma once
#include <vector>
#include <string>

namespace memoria {

using Embedding = std::vector<float>;

// Cosine similarity in [-1, 1]. Throws DimensionMismatch if the lengths
// differ. A zero-magnitude (or empty) vector yields 0.0.
double cosine_similarity(const Embedding& a, const Embedding& b);

// L2-normalize in place. Zero vectors are left untouched.
void normalize(Embedding& vec);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
// Returns empty if the size is not a multiple of sizeof(float).
Embedding deserialize_vector(const std::string& data);

} // namespace memoria
