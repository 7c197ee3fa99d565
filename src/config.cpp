#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace memoria {

nlohmann::json Config::defaults_json() {
    return {
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"providers", {
            {"openai", {{"api_key", ""}}},
            {"openrouter", {{"api_key", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}}
        }},
        {"embeddings", {
            {"provider", ""},
            {"model", ""},
            {"dimensions", 1536},
            {"timeout_seconds", 30},
            {"cache", true},
            {"cache_ttl", 3600},
            {"cache_max_entries", 1000}
        }},
        {"llm", {
            {"provider", "openrouter"},
            {"model", "openai/gpt-4o-mini"},
            {"extraction_temperature", 0.2},
            {"summary_temperature", 0.3},
            {"timeout_seconds", 60}
        }},
        {"retrieval", {
            {"relevance_floor", 0.25},
            {"pool_size", 24},
            {"mmr_k", 10},
            {"mmr_lambda", 0.7},
            {"budget_chars", 1000},
            {"salience_bump", 0.05},
            {"search_limit", 10}
        }},
        {"distill", {
            {"min_turns", 4},
            {"max_turns", 12},
            {"min_content_chars", 15},
            {"min_salience", 0.6},
            {"default_salience", 0.7}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string()) out = obj[name].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_unsigned()) out = obj[name].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* name, double& out) {
    if (obj.contains(name) && obj[name].is_number()) out = obj[name].get<double>();
}

static void read_bool(const nlohmann::json& obj, const char* name, bool& out) {
    if (obj.contains(name) && obj[name].is_boolean()) out = obj[name].get<bool>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("store") && j["store"].is_object()) {
        const auto& s = j["store"];
        read_string(s, "backend", cfg.store.backend);
        read_string(s, "path", cfg.store.path);
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        const auto& e = j["embeddings"];
        read_string(e, "provider", cfg.embeddings.provider);
        read_string(e, "api_key", cfg.embeddings.api_key);
        read_string(e, "base_url", cfg.embeddings.base_url);
        read_string(e, "model", cfg.embeddings.model);
        read_uint(e, "dimensions", cfg.embeddings.dimensions);
        read_uint(e, "timeout_seconds", cfg.embeddings.timeout_seconds);
        read_bool(e, "cache", cfg.embeddings.cache);
        read_uint(e, "cache_ttl", cfg.embeddings.cache_ttl);
        read_uint(e, "cache_max_entries", cfg.embeddings.cache_max_entries);
    }

    if (j.contains("llm") && j["llm"].is_object()) {
        const auto& l = j["llm"];
        read_string(l, "provider", cfg.llm.provider);
        read_string(l, "model", cfg.llm.model);
        read_double(l, "extraction_temperature", cfg.llm.extraction_temperature);
        read_double(l, "summary_temperature", cfg.llm.summary_temperature);
        read_uint(l, "timeout_seconds", cfg.llm.timeout_seconds);
    }

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        const auto& r = j["retrieval"];
        read_double(r, "relevance_floor", cfg.retrieval.relevance_floor);
        read_uint(r, "pool_size", cfg.retrieval.pool_size);
        read_uint(r, "mmr_k", cfg.retrieval.mmr_k);
        read_double(r, "mmr_lambda", cfg.retrieval.mmr_lambda);
        read_uint(r, "budget_chars", cfg.retrieval.budget_chars);
        read_double(r, "salience_bump", cfg.retrieval.salience_bump);
        read_uint(r, "search_limit", cfg.retrieval.search_limit);
    }

    if (j.contains("distill") && j["distill"].is_object()) {
        const auto& d = j["distill"];
        read_uint(d, "min_turns", cfg.distill.min_turns);
        read_uint(d, "max_turns", cfg.distill.max_turns);
        read_uint(d, "min_content_chars", cfg.distill.min_content_chars);
        read_double(d, "min_salience", cfg.distill.min_salience);
        read_double(d, "default_salience", cfg.distill.default_salience);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.memoria/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original && atomic_write_file(config_path, j.dump(4) + "\n")) {
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        cfg.providers["openrouter"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;
    if (const char* v = std::getenv("MEMORIA_EMBEDDINGS_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("MEMORIA_STORE_PATH"))
        cfg.store.path = v;

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace memoria
