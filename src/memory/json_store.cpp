#include "json_store.hpp"
#include "entry_json.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

static memoria::StoreRegistrar reg_json("json",
    [](const memoria::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = memoria::expand_home("~/.memoria/memory.json");
        }
        return std::make_unique<memoria::JsonStore>(path);
    });

namespace memoria {

JsonStore::JsonStore(const std::string& path) : path_(path) {
    load();
}

void JsonStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) return;

        entries_.clear();
        entries_.reserve(j.size());
        for (const auto& item : j) {
            if (!item.is_object()) continue;
            auto m = memory_from_json(item);
            if (m.id.empty() || m.owner.empty() || m.content.empty()) continue;
            entries_.push_back(std::move(m));
        }
        rebuild_index();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] " << path_ << " is corrupt (" << e.what()
                  << "), starting empty\n";
        entries_.clear();
        key_index_.clear();
    }
}

void JsonStore::save(const std::vector<Memory>& entries) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : entries) {
        j.push_back(memory_to_json(entry));
    }
    if (!atomic_write_file(path_, j.dump(2, ' ', false,
                                          nlohmann::json::error_handler_t::replace))) {
        throw StoreError("failed to write " + path_);
    }
}

void JsonStore::commit(std::vector<Memory> entries) {
    // Must be called with mutex_ already held. Nothing changes in memory
    // unless the file write succeeded.
    save(entries);
    entries_ = std::move(entries);
    rebuild_index();
}

void JsonStore::rebuild_index() {
    key_index_.clear();
    for (size_t i = 0; i < entries_.size(); ++i) {
        key_index_[{entries_[i].owner, entries_[i].content}] = i;
    }
}

std::vector<Memory> JsonStore::find_active(const std::string& owner, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Memory> result;
    for (const auto& entry : entries_) {
        if (entry.owner == owner && !entry.is_expired(now)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::string JsonStore::upsert(const std::string& owner, const NewMemory& memory) {
    if (owner.empty() || memory.content.empty()) {
        throw std::invalid_argument("upsert requires owner and content");
    }

    // The file only holds valid UTF-8; keep the in-memory copy identical so
    // the dedup key survives a reload.
    std::string content = utf8_sanitize(memory.content);
    std::vector<std::string> tags;
    tags.reserve(memory.tags.size());
    for (const auto& t : memory.tags) tags.push_back(utf8_sanitize(t));
    MemorySource source = memory.source;
    source.origin = utf8_sanitize(source.origin);
    source.reference_id = utf8_sanitize(source.reference_id);

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = epoch_seconds();
    std::vector<Memory> next = entries_;

    auto it = key_index_.find({owner, content});
    if (it != key_index_.end()) {
        auto& entry = next[it->second];
        entry.embedding = memory.embedding;
        entry.tags = std::move(tags);
        entry.source = std::move(source);
        entry.kind = memory.kind;
        entry.decay_at = memory.decay_at;
        entry.updated_at = now;
        std::string id = entry.id;
        commit(std::move(next));
        return id;
    }

    Memory entry;
    entry.id = generate_id();
    entry.owner = owner;
    entry.content = std::move(content);
    entry.kind = memory.kind;
    entry.tags = std::move(tags);
    entry.embedding = memory.embedding;
    entry.salience = clamp_salience(memory.salience.value_or(kDefaultSalience));
    entry.decay_at = memory.decay_at;
    entry.created_at = now;
    entry.updated_at = now;
    entry.source = std::move(source);

    std::string id = entry.id;
    next.push_back(std::move(entry));
    commit(std::move(next));
    return id;
}

uint32_t JsonStore::bump_salience(const std::vector<std::string>& ids, double delta) {
    if (ids.empty()) return 0;
    std::unordered_set<std::string> wanted(ids.begin(), ids.end());

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = epoch_seconds();
    std::vector<Memory> next = entries_;
    uint32_t touched = 0;
    for (auto& entry : next) {
        if (wanted.count(entry.id) == 0) continue;
        entry.salience = clamp_salience(entry.salience + delta);
        entry.updated_at = now;
        ++touched;
    }
    if (touched > 0) commit(std::move(next));
    return touched;
}

uint32_t JsonStore::delete_all_for(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Memory> next;
    next.reserve(entries_.size());
    for (const auto& m : entries_) {
        if (m.owner != owner) next.push_back(m);
    }
    auto removed = static_cast<uint32_t>(entries_.size() - next.size());
    if (removed > 0) commit(std::move(next));
    return removed;
}

std::optional<Memory> JsonStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.id == id) return entry;
    }
    return std::nullopt;
}

MemoryStats JsonStore::stats(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryStats stats;
    std::map<MemoryKind, double> salience_sum;
    for (const auto& entry : entries_) {
        if (entry.owner != owner) continue;
        stats.total++;
        stats.by_kind[entry.kind].count++;
        salience_sum[entry.kind] += entry.salience;
    }
    for (auto& [kind, ks] : stats.by_kind) {
        ks.avg_salience = salience_sum[kind] / static_cast<double>(ks.count);
    }
    return stats;
}

uint32_t JsonStore::purge_expired(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Memory> next;
    next.reserve(entries_.size());
    for (const auto& m : entries_) {
        if (!m.is_expired(now)) next.push_back(m);
    }
    auto removed = static_cast<uint32_t>(entries_.size() - next.size());
    if (removed > 0) commit(std::move(next));
    return removed;
}

} // namespace memoria
