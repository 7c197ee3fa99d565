#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace memoria {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct StoreConfig {
    std::string backend = "sqlite";
    std::string path;                   // empty = ~/.memoria/memory.<ext>
};

struct EmbeddingConfig {
    std::string provider;               // "openai", "ollama", "hash"; empty = auto-detect
    std::string api_key;                // empty = fall back to providers["openai"]
    std::string base_url;
    std::string model;
    uint32_t dimensions = 1536;         // only used by the hash embedder
    uint32_t timeout_seconds = 30;
    bool cache = true;
    uint32_t cache_ttl = 3600;
    uint32_t cache_max_entries = 1000;
};

struct LlmConfig {
    std::string provider = "openrouter";
    std::string model = "openai/gpt-4o-mini";
    double extraction_temperature = 0.2;
    double summary_temperature = 0.3;
    uint32_t timeout_seconds = 60;
};

struct RetrievalConfig {
    double relevance_floor = 0.25;
    uint32_t pool_size = 24;            // candidates kept before MMR
    uint32_t mmr_k = 10;
    double mmr_lambda = 0.7;
    uint32_t budget_chars = 1000;
    double salience_bump = 0.05;
    uint32_t search_limit = 10;
};

struct DistillConfig {
    uint32_t min_turns = 4;
    uint32_t max_turns = 12;
    uint32_t min_content_chars = 15;
    double min_salience = 0.6;
    double default_salience = 0.7;      // manual store_memory writes
};

struct Config {
    StoreConfig store;
    EmbeddingConfig embeddings;
    LlmConfig llm;
    RetrievalConfig retrieval;
    DistillConfig distill;

    std::unordered_map<std::string, ProviderEntry> providers;

    // Load from ~/.memoria/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-loaded document. Wrong-typed values keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;
};

} // namespace memoria
