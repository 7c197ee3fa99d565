#pragma once
#include "vector.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <optional>

namespace memoria {

struct CachedEmbedding {
    Embedding vector;
    uint64_t timestamp;
    uint64_t last_access;
};

// Process-local embedding cache with a TTL and an LRU size bound.
// Owned by whoever constructs it and handed to CachingEmbedder; there is no
// global instance.
class EmbeddingCache {
public:
    EmbeddingCache(uint32_t ttl_seconds, uint32_t max_entries);

    // Look up a cached vector. Returns nullopt on miss or expiry.
    std::optional<Embedding> get(const std::string& model, const std::string& text);

    // Store a vector. Empty vectors are ignored.
    void put(const std::string& model, const std::string& text, const Embedding& vector);

    uint32_t size() const;
    void clear();

    // SHA-256 (hex) of model + '\x01' + text.
    static std::string compute_key(const std::string& model, const std::string& text);

private:
    void evict();

    uint32_t ttl_seconds_;
    uint32_t max_entries_;
    std::unordered_map<std::string, CachedEmbedding> entries_;
    mutable std::mutex mutex_;
};

} // namespace memoria
