#pragma once
#include "memory/vector.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memoria {

struct Config; // forward declaration

enum class MemoryKind { Preference, Project, Fact, Profile };

// Provenance of a memory. Informational only, never used in ranking.
struct MemorySource {
    std::string origin;         // "conversation", "manual", "activity_analysis", ...
    std::string reference_id;   // e.g. conversation id; empty if none
    uint64_t extracted_at = 0;
};

struct Memory {
    std::string id;
    std::string owner;
    std::string content;
    MemoryKind kind = MemoryKind::Fact;
    std::vector<std::string> tags;
    Embedding embedding;
    double salience = 0.5;
    std::optional<uint64_t> decay_at;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    MemorySource source;

    bool is_expired(uint64_t now) const { return decay_at.has_value() && *decay_at <= now; }
};

// Input to MemoryStore::upsert. The (owner, content) pair is the dedup key.
struct NewMemory {
    std::string content;
    MemoryKind kind = MemoryKind::Fact;
    std::vector<std::string> tags;
    Embedding embedding;
    std::optional<double> salience;     // defaulted by the store if absent
    MemorySource source;
    std::optional<uint64_t> decay_at;
};

struct ScoredMemory {
    Memory memory;
    double similarity = 0.0;
};

struct KindStats {
    uint32_t count = 0;
    double avg_salience = 0.0;
};

struct MemoryStats {
    uint32_t total = 0;
    std::map<MemoryKind, KindStats> by_kind;
};

constexpr double kDefaultSalience = 0.5;

// Clamp a salience value into [0, 1].
double clamp_salience(double value);

// Durable per-user memory collection.
// Implementations must be safe to call from several threads; upserts on the
// same (owner, content) key are serialized (last writer wins).
// Failures of the underlying storage are reported as StoreError.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual std::string backend_name() const = 0;

    // Memories of `owner` whose decay_at is absent or later than `now`.
    virtual std::vector<Memory> find_active(const std::string& owner, uint64_t now) = 0;

    // Insert, or update embedding/tags/source/kind/decay_at of the existing
    // (owner, content) record. Returns the record id.
    virtual std::string upsert(const std::string& owner, const NewMemory& memory) = 0;

    // Add delta to the salience of every id, clamp to [0, 1], stamp updated_at.
    // Returns the number of records touched.
    virtual uint32_t bump_salience(const std::vector<std::string>& ids, double delta) = 0;

    // Remove every memory owned by `owner`. Returns the count removed.
    virtual uint32_t delete_all_for(const std::string& owner) = 0;

    virtual std::optional<Memory> get(const std::string& id) = 0;

    virtual MemoryStats stats(const std::string& owner) = 0;

    // Physically remove memories whose decay_at has passed. Returns count removed.
    virtual uint32_t purge_expired(uint64_t now) = 0;
};

std::string kind_to_string(MemoryKind kind);
// Unknown names map to MemoryKind::Fact.
MemoryKind kind_from_string(const std::string& s);
bool is_known_kind(const std::string& s);

// Create a store backend from config via the plugin registry.
// Throws std::invalid_argument for an unknown backend name.
std::unique_ptr<MemoryStore> create_memory_store(const Config& config);

} // namespace memoria
