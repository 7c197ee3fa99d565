#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace memoria;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values match the retrieval contract", "[config]") {
    Config cfg;
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.retrieval.relevance_floor == 0.25);
    REQUIRE(cfg.retrieval.pool_size == 24);
    REQUIRE(cfg.retrieval.mmr_k == 10);
    REQUIRE(cfg.retrieval.mmr_lambda == 0.7);
    REQUIRE(cfg.retrieval.budget_chars == 1000);
    REQUIRE(cfg.retrieval.salience_bump == 0.05);
    REQUIRE(cfg.distill.min_turns == 4);
    REQUIRE(cfg.distill.max_turns == 12);
    REQUIRE(cfg.distill.min_content_chars == 15);
    REQUIRE(cfg.distill.min_salience == 0.6);
}

TEST_CASE("Config: defaults_json parses to default struct", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.retrieval.mmr_lambda == plain.retrieval.mmr_lambda);
    REQUIRE(cfg.llm.provider == plain.llm.provider);
    REQUIRE(cfg.llm.model == plain.llm.model);
    REQUIRE(cfg.embeddings.dimensions == plain.embeddings.dimensions);
    REQUIRE(cfg.base_url_for("ollama") == "http://localhost:11434");
}

// ── api_key_for / base_url_for ───────────────────────────────────

TEST_CASE("Config::api_key_for: returns correct key per provider", "[config]") {
    Config cfg;
    cfg.providers["openai"].api_key = "sk-oai-456";
    cfg.providers["openrouter"].api_key = "sk-or-789";

    REQUIRE(cfg.api_key_for("openai") == "sk-oai-456");
    REQUIRE(cfg.api_key_for("openrouter") == "sk-or-789");
    REQUIRE(cfg.api_key_for("unknown").empty());
}

TEST_CASE("Config::base_url_for: unknown provider returns empty", "[config]") {
    Config cfg;
    cfg.providers["ollama"].base_url = "http://ollama:11434";
    REQUIRE(cfg.base_url_for("ollama") == "http://ollama:11434");
    REQUIRE(cfg.base_url_for("openai").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: overrides tunables", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "store": { "backend": "json", "path": "/tmp/x.json" },
        "retrieval": { "relevance_floor": 0.3, "mmr_k": 5, "mmr_lambda": 0.5 },
        "distill": { "min_turns": 6 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(cfg.store.path == "/tmp/x.json");
    REQUIRE(cfg.retrieval.relevance_floor == 0.3);
    REQUIRE(cfg.retrieval.mmr_k == 5);
    REQUIRE(cfg.retrieval.mmr_lambda == 0.5);
    REQUIRE(cfg.retrieval.pool_size == 24);
    REQUIRE(cfg.distill.min_turns == 6);
}

TEST_CASE("Config::from_json: wrong-typed values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "retrieval": { "mmr_k": "ten", "mmr_lambda": true, "pool_size": -3 },
        "embeddings": { "cache": "yes" }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.retrieval.mmr_k == 10);
    REQUIRE(cfg.retrieval.mmr_lambda == 0.7);
    REQUIRE(cfg.retrieval.pool_size == 24);
    REQUIRE(cfg.embeddings.cache);
}

TEST_CASE("Config::from_json: non-object document yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.store.backend == "sqlite");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "memoria_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("OPENAI_API_KEY");
        unsetenv("OPENROUTER_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
        unsetenv("MEMORIA_EMBEDDINGS_PROVIDER");
        unsetenv("MEMORIA_STORE_PATH");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("OPENAI_API_KEY");
        unsetenv("MEMORIA_STORE_PATH");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.memoria/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.memoria");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: creates default file when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.retrieval.mmr_k == 10);
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config().contains("retrieval"));
}

TEST_CASE("Config::load: reads file and merges missing defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({
        "providers": { "openai": { "api_key": "sk-file-oai" } },
        "retrieval": { "budget_chars": 600 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("openai") == "sk-file-oai");
    REQUIRE(cfg.retrieval.budget_chars == 600);
    REQUIRE(cfg.retrieval.mmr_k == 10);

    auto j = g.read_config();
    REQUIRE(j["retrieval"]["budget_chars"] == 600);
    REQUIRE(j["retrieval"]["mmr_lambda"] == 0.7);
    REQUIRE(j.contains("distill"));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.retrieval.relevance_floor == 0.25);
}

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({
        "providers": { "openai": { "api_key": "sk-file" } },
        "store": { "path": "/tmp/from-file.db" }
    })");
    setenv("OPENAI_API_KEY", "sk-env", 1);
    setenv("MEMORIA_STORE_PATH", "/tmp/from-env.db", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("openai") == "sk-env");
    REQUIRE(cfg.store.path == "/tmp/from-env.db");
}
