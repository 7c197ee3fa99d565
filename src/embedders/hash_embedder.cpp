#include "hash_embedder.hpp"
#include <cctype>
#include <stdexcept>

namespace memoria {

HashEmbedder::HashEmbedder(uint32_t dims) : dims_(dims) {
    if (dims_ == 0) throw std::invalid_argument("HashEmbedder: dimensions must be positive");
}

static bool is_word_byte(unsigned char c) {
    // Bytes >= 0x80 belong to multi-byte UTF-8 letters; keep them inside tokens
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

Embedding HashEmbedder::embed(const std::string& text) {
    Embedding vec(dims_, 0.0f);

    constexpr uint32_t fnv_offset = 2166136261u;
    constexpr uint32_t fnv_prime  = 16777619u;

    uint32_t hash = fnv_offset;
    bool in_token = false;
    auto flush = [&]() {
        if (in_token) vec[hash % dims_] += 1.0f;
        hash = fnv_offset;
        in_token = false;
    };

    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            hash ^= static_cast<unsigned char>(std::tolower(c));
            hash *= fnv_prime;
            in_token = true;
        } else {
            flush();
        }
    }
    flush();

    normalize(vec);
    return vec;
}

} // namespace memoria
