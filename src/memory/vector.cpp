#include "vector.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace memoria {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) throw DimensionMismatch(a.size(), b.size());

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12) return 0.0;

    // Rounding can push |dot| / denom a hair past 1
    return std::clamp(dot / denom, -1.0, 1.0);
}

void normalize(Embedding& vec) {
    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * static_cast<double>(v);
    norm = std::sqrt(norm);
    if (norm < 1e-12) return;
    for (float& v : vec) v = static_cast<float>(v / norm);
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const std::string& data) {
    if (data.empty() || data.size() % sizeof(float) != 0) return {};

    Embedding vec(data.size() / sizeof(float));
    std::memcpy(vec.data(), data.data(), data.size());
    return vec;
}

} // namespace memoria
