#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "memory/json_store.hpp"
#include "util.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unistd.h>

using namespace memoria;

static std::string json_test_path() {
    return "/tmp/memoria_test_json_" + std::to_string(getpid()) + ".json";
}

struct JsonFixture {
    std::string path = json_test_path();
    JsonStore store{path};

    ~JsonFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + ".tmp");
    }
};

static NewMemory make_memory(const std::string& content, Embedding embedding = {1.0f, 0.0f},
                             std::optional<double> salience = 0.7) {
    NewMemory m;
    m.content = content;
    m.kind = MemoryKind::Preference;
    m.tags = {"music"};
    m.embedding = std::move(embedding);
    m.salience = salience;
    m.source.origin = "conversation";
    m.source.reference_id = "conv-1";
    m.source.extracted_at = 1700000000;
    return m;
}

// ── Insert and read back ─────────────────────────────────────

TEST_CASE("JsonStore: upsert inserts and get reads every field", "[json_store]") {
    JsonFixture f;
    REQUIRE(f.store.backend_name() == "json");

    auto id = f.store.upsert("u1", make_memory("Likes jazz", {0.5f, -0.25f}));
    REQUIRE_FALSE(id.empty());

    auto m = f.store.get(id);
    REQUIRE(m.has_value());
    const auto& mem = m.value_or(Memory{});
    REQUIRE(mem.owner == "u1");
    REQUIRE(mem.content == "Likes jazz");
    REQUIRE(mem.kind == MemoryKind::Preference);
    REQUIRE(mem.tags == std::vector<std::string>{"music"});
    REQUIRE(mem.embedding == Embedding{0.5f, -0.25f});
    REQUIRE(std::abs(mem.salience - 0.7) < 1e-9);
    REQUIRE_FALSE(mem.decay_at.has_value());
    REQUIRE(mem.created_at > 0);
    REQUIRE(mem.created_at == mem.updated_at);
    REQUIRE(mem.source.origin == "conversation");
    REQUIRE(mem.source.reference_id == "conv-1");
    REQUIRE(mem.source.extracted_at == 1700000000);
}

TEST_CASE("JsonStore: missing salience defaults", "[json_store]") {
    JsonFixture f;
    auto id = f.store.upsert("u1", make_memory("Likes jazz", {1.0f}, std::nullopt));
    REQUIRE(std::abs(f.store.get(id).value_or(Memory{}).salience - kDefaultSalience) < 1e-9);
}

TEST_CASE("JsonStore: salience clamped on insert", "[json_store]") {
    JsonFixture f;
    auto id = f.store.upsert("u1", make_memory("Likes jazz", {1.0f}, 3.0));
    REQUIRE(f.store.get(id).value_or(Memory{}).salience == 1.0);
}

TEST_CASE("JsonStore: get unknown id", "[json_store]") {
    JsonFixture f;
    REQUIRE_FALSE(f.store.get("nope").has_value());
}

TEST_CASE("JsonStore: empty owner or content rejected", "[json_store]") {
    JsonFixture f;
    REQUIRE_THROWS_AS(f.store.upsert("", make_memory("x")), std::invalid_argument);
    REQUIRE_THROWS_AS(f.store.upsert("u1", make_memory("")), std::invalid_argument);
}

// ── Dedup ────────────────────────────────────────────────────

TEST_CASE("JsonStore: same owner and content updates in place", "[json_store]") {
    JsonFixture f;
    auto first = f.store.upsert("u1", make_memory("Likes jazz", {1.0f, 0.0f}, 0.8));

    auto second_input = make_memory("Likes jazz", {0.0f, 1.0f}, 0.6);
    second_input.tags = {"genre"};
    second_input.kind = MemoryKind::Profile;
    auto second = f.store.upsert("u1", second_input);

    REQUIRE(first == second);
    auto all = f.store.find_active("u1", epoch_seconds());
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].embedding == Embedding{0.0f, 1.0f});
    REQUIRE(all[0].tags == std::vector<std::string>{"genre"});
    REQUIRE(all[0].kind == MemoryKind::Profile);
    // Salience survives a dedup-update
    REQUIRE(std::abs(all[0].salience - 0.8) < 1e-9);
}

TEST_CASE("JsonStore: same content for different owners is distinct", "[json_store]") {
    JsonFixture f;
    auto a = f.store.upsert("u1", make_memory("Likes jazz"));
    auto b = f.store.upsert("u2", make_memory("Likes jazz"));
    REQUIRE(a != b);
    REQUIRE(f.store.find_active("u1", epoch_seconds()).size() == 1);
    REQUIRE(f.store.find_active("u2", epoch_seconds()).size() == 1);
}

// ── Expiry ───────────────────────────────────────────────────

TEST_CASE("JsonStore: find_active excludes expired memories", "[json_store]") {
    JsonFixture f;
    uint64_t now = epoch_seconds();

    auto expired = make_memory("Old fact about the user");
    expired.decay_at = now - 10;
    f.store.upsert("u1", expired);

    auto boundary = make_memory("Expires exactly now");
    boundary.decay_at = now;
    f.store.upsert("u1", boundary);

    auto future = make_memory("Fact valid until later");
    future.decay_at = now + 3600;
    f.store.upsert("u1", future);

    f.store.upsert("u1", make_memory("Fact without expiry"));

    auto active = f.store.find_active("u1", now);
    REQUIRE(active.size() == 2);
    for (const auto& m : active) {
        REQUIRE(m.content != "Old fact about the user");
        REQUIRE(m.content != "Expires exactly now");
    }
}

TEST_CASE("JsonStore: purge_expired removes only expired rows", "[json_store]") {
    JsonFixture f;
    uint64_t now = epoch_seconds();

    auto expired = make_memory("Old fact about the user");
    expired.decay_at = now - 10;
    auto expired_id = f.store.upsert("u1", expired);
    auto kept_id = f.store.upsert("u2", make_memory("Fact without expiry"));

    REQUIRE(f.store.purge_expired(now) == 1);
    REQUIRE_FALSE(f.store.get(expired_id).has_value());
    REQUIRE(f.store.get(kept_id).has_value());
    REQUIRE(f.store.purge_expired(now) == 0);
}

// ── Salience ─────────────────────────────────────────────────

TEST_CASE("JsonStore: bump_salience adds delta", "[json_store]") {
    JsonFixture f;
    auto a = f.store.upsert("u1", make_memory("Likes jazz", {1.0f}, 0.6));
    auto b = f.store.upsert("u1", make_memory("Works as a nurse", {1.0f}, 0.7));

    REQUIRE(f.store.bump_salience({a, b, "missing"}, 0.05) == 2);
    REQUIRE(std::abs(f.store.get(a).value_or(Memory{}).salience - 0.65) < 1e-9);
    REQUIRE(std::abs(f.store.get(b).value_or(Memory{}).salience - 0.75) < 1e-9);
}

TEST_CASE("JsonStore: repeated bumps never exceed 1.0", "[json_store]") {
    JsonFixture f;
    auto id = f.store.upsert("u1", make_memory("Likes jazz", {1.0f}, 0.9));
    for (int i = 0; i < 10; i++) {
        f.store.bump_salience({id}, 0.05);
    }
    REQUIRE(f.store.get(id).value_or(Memory{}).salience == 1.0);
}

TEST_CASE("JsonStore: negative bump clamps at 0.0", "[json_store]") {
    JsonFixture f;
    auto id = f.store.upsert("u1", make_memory("Likes jazz", {1.0f}, 0.1));
    f.store.bump_salience({id}, -0.5);
    REQUIRE(f.store.get(id).value_or(Memory{}).salience == 0.0);
}

TEST_CASE("JsonStore: bump with no ids touches nothing", "[json_store]") {
    JsonFixture f;
    REQUIRE(f.store.bump_salience({}, 0.05) == 0);
}

// ── Delete and stats ─────────────────────────────────────────

TEST_CASE("JsonStore: delete_all_for removes one owner only", "[json_store]") {
    JsonFixture f;
    f.store.upsert("u1", make_memory("Likes jazz"));
    f.store.upsert("u1", make_memory("Works as a nurse"));
    f.store.upsert("u2", make_memory("Likes jazz"));

    REQUIRE(f.store.delete_all_for("u1") == 2);
    REQUIRE(f.store.find_active("u1", epoch_seconds()).empty());
    REQUIRE(f.store.find_active("u2", epoch_seconds()).size() == 1);
    REQUIRE(f.store.delete_all_for("u1") == 0);
}

TEST_CASE("JsonStore: stats groups by kind", "[json_store]") {
    JsonFixture f;
    auto pref = make_memory("Likes jazz", {1.0f}, 0.6);
    f.store.upsert("u1", pref);
    auto pref2 = make_memory("Prefers vinyl records", {1.0f}, 0.8);
    f.store.upsert("u1", pref2);
    auto job = make_memory("Works as a nurse", {1.0f}, 0.9);
    job.kind = MemoryKind::Profile;
    f.store.upsert("u1", job);
    f.store.upsert("u2", make_memory("Other user memory"));

    auto stats = f.store.stats("u1");
    REQUIRE(stats.total == 3);
    REQUIRE(stats.by_kind[MemoryKind::Preference].count == 2);
    REQUIRE(std::abs(stats.by_kind[MemoryKind::Preference].avg_salience - 0.7) < 1e-9);
    REQUIRE(stats.by_kind[MemoryKind::Profile].count == 1);
    REQUIRE(stats.by_kind.count(MemoryKind::Project) == 0);
}

// ── Persistence ──────────────────────────────────────────────

TEST_CASE("JsonStore: data survives reopen", "[json_store]") {
    std::string path = json_test_path() + ".reopen";
    std::string id;
    {
        JsonStore store(path);
        id = store.upsert("u1", make_memory("Likes jazz"));
    }
    {
        JsonStore store(path);
        auto m = store.get(id);
        REQUIRE(m.has_value());
        REQUIRE(m.value_or(Memory{}).content == "Likes jazz");
    }
    std::filesystem::remove(path);
}

TEST_CASE("JsonStore: file holds an array of records", "[json_store]") {
    JsonFixture f;
    f.store.upsert("u1", make_memory("Likes jazz", {0.5f}));

    std::ifstream in(f.path);
    auto j = nlohmann::json::parse(in);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["owner"] == "u1");
    REQUIRE(j[0]["kind"] == "preference");
    REQUIRE(j[0]["source"]["origin"] == "conversation");
    REQUIRE_FALSE(j[0].contains("decay_at"));
}

TEST_CASE("JsonStore: corrupt file starts empty and is rewritten", "[json_store]") {
    std::string path = json_test_path() + ".corrupt";
    {
        std::ofstream out(path);
        out << "{ this is not json";
    }
    {
        JsonStore store(path);
        REQUIRE(store.find_active("u1", epoch_seconds()).empty());
        store.upsert("u1", make_memory("Likes jazz"));
    }
    JsonStore reopened(path);
    REQUIRE(reopened.find_active("u1", epoch_seconds()).size() == 1);
    std::filesystem::remove(path);
}

TEST_CASE("JsonStore: dedup index rebuilt after delete", "[json_store]") {
    JsonFixture f;
    f.store.upsert("u1", make_memory("Likes jazz"));
    f.store.upsert("u2", make_memory("Works as a nurse"));
    f.store.delete_all_for("u1");

    auto first = f.store.upsert("u2", make_memory("Works as a nurse", {0.0f, 1.0f}));
    auto second = f.store.upsert("u2", make_memory("Works as a nurse", {1.0f, 1.0f}));
    REQUIRE(first == second);
    REQUIRE(f.store.find_active("u2", epoch_seconds()).size() == 1);
}

// ── Write failures and encoding ──────────────────────────────

// Swaps the store's directory for a plain file so every write fails.
static void block_directory(const std::string& dir) {
    std::filesystem::remove_all(dir);
    std::ofstream(dir) << "blocker";
}

static void unblock_directory(const std::string& dir) {
    std::filesystem::remove(dir);
    std::filesystem::create_directories(dir);
}

TEST_CASE("JsonStore: failed write leaves the store unchanged", "[json_store]") {
    std::string dir = json_test_path() + ".dir";
    std::string path = dir + "/memory.json";
    std::filesystem::create_directories(dir);

    JsonStore store(path);
    auto jazz = store.upsert("u1", make_memory("Likes jazz", {1.0f, 0.0f}, 0.5));

    block_directory(dir);
    REQUIRE_THROWS_AS(store.upsert("u1", make_memory("Works as a nurse")), StoreError);
    REQUIRE_THROWS_AS(store.upsert("u1", make_memory("Likes jazz", {0.0f, 1.0f})), StoreError);
    REQUIRE_THROWS_AS(store.bump_salience({jazz}, 0.3), StoreError);
    REQUIRE_THROWS_AS(store.delete_all_for("u1"), StoreError);

    auto active = store.find_active("u1", epoch_seconds());
    REQUIRE(active.size() == 1);
    REQUIRE(active[0].content == "Likes jazz");
    REQUIRE(active[0].embedding == Embedding{1.0f, 0.0f});
    REQUIRE(std::abs(active[0].salience - 0.5) < 1e-9);

    // The rejected record is not written along with the next mutation.
    unblock_directory(dir);
    store.upsert("u1", make_memory("Plays bass guitar in a band"));
    JsonStore reopened(path);
    auto reloaded = reopened.find_active("u1", epoch_seconds());
    REQUIRE(reloaded.size() == 2);
    for (const auto& m : reloaded) {
        REQUIRE(m.content != "Works as a nurse");
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonStore: invalid UTF-8 is stored as U+FFFD", "[json_store]") {
    JsonFixture f;
    auto m = make_memory("Lives near the caf\xC3 in Lyon");
    m.tags = {"caf\xC3"};
    auto id = f.store.upsert("u1", m);

    auto stored = f.store.get(id).value_or(Memory{});
    REQUIRE(stored.content == "Lives near the caf\xEF\xBF\xBD in Lyon");
    REQUIRE(stored.tags == std::vector<std::string>{"caf\xEF\xBF\xBD"});

    // Later writes keep working and the dedup key survives a reload.
    f.store.upsert("u1", make_memory("Works as a nurse"));
    JsonStore reopened(f.path);
    REQUIRE(reopened.find_active("u1", epoch_seconds()).size() == 2);
    REQUIRE(reopened.upsert("u1", m) == id);
}
