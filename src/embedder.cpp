#include "embedder.hpp"
#include "embedders/caching_embedder.hpp"
#include "embedders/hash_embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace memoria {

static std::unique_ptr<Embedder> create_base_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;

    // Resolve OpenAI API key once (explicit embedding key, or provider fallback)
    std::string openai_key = emb.api_key;
    if (openai_key.empty()) openai_key = config.api_key_for("openai");

    // Resolve provider: explicit config, or auto-detect from available API keys
    std::string provider = emb.provider;
    if (provider.empty()) {
        if (!openai_key.empty()) {
            provider = "openai";
            std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
        }
    }
    if (provider.empty()) return nullptr;

    auto timeout = static_cast<long>(emb.timeout_seconds);

    if (provider == "openai") {
        if (openai_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(openai_key, http, emb.base_url, emb.model, timeout);
    }

    if (provider == "ollama") {
        std::string base_url = emb.base_url.empty() ? config.base_url_for("ollama") : emb.base_url;
        return create_ollama_embedder(http, base_url, emb.model, timeout);
    }

    if (provider == "hash") {
        return std::make_unique<HashEmbedder>(emb.dimensions);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    auto base = create_base_embedder(config, http);
    if (!base || !config.embeddings.cache) return base;

    // Hash embeddings are cheaper to recompute than to look up
    if (base->embedder_name() == "hash") return base;

    auto cache = std::make_shared<EmbeddingCache>(config.embeddings.cache_ttl,
                                                  config.embeddings.cache_max_entries);
    return std::make_unique<CachingEmbedder>(std::move(base), std::move(cache));
}

} // namespace memoria
