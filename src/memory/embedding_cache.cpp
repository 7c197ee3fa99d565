#include "embedding_cache.hpp"
#include "../util.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <vector>

namespace memoria {

EmbeddingCache::EmbeddingCache(uint32_t ttl_seconds, uint32_t max_entries)
    : ttl_seconds_(ttl_seconds), max_entries_(max_entries) {}

std::string EmbeddingCache::compute_key(const std::string& model, const std::string& text) {
    std::string material;
    material.reserve(model.size() + 1 + text.size());
    material += model;
    material += '\x01';
    material += text;

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(material.data()), material.size(), hash);

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : hash) {
        out += hex[b >> 4];
        out += hex[b & 0x0F];
    }
    return out;
}

std::optional<Embedding> EmbeddingCache::get(const std::string& model, const std::string& text) {
    std::string key = compute_key(model, text);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    uint64_t now = epoch_seconds();
    if ((now - it->second.timestamp) > ttl_seconds_) {
        entries_.erase(it);
        return std::nullopt;
    }

    it->second.last_access = now;
    return it->second.vector;
}

void EmbeddingCache::put(const std::string& model, const std::string& text,
                         const Embedding& vector) {
    if (vector.empty()) return;

    std::string key = compute_key(model, text);
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = epoch_seconds();
    entries_[key] = CachedEmbedding{vector, now, now};

    evict();
}

void EmbeddingCache::evict() {
    // Must be called with mutex_ already held.

    uint64_t now = epoch_seconds();

    // Remove TTL-expired entries first.
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if ((now - it->second.timestamp) > ttl_seconds_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    // If still over capacity, evict by oldest last_access.
    if (entries_.size() > max_entries_) {
        std::vector<std::pair<uint64_t, std::string>> key_access; // {last_access, key}
        key_access.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            key_access.emplace_back(entry.last_access, key);
        }

        std::sort(key_access.begin(), key_access.end());

        size_t to_remove = entries_.size() - max_entries_;
        for (size_t i = 0; i < to_remove; ++i) {
            entries_.erase(key_access[i].second);
        }
    }
}

uint32_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

void EmbeddingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace memoria
