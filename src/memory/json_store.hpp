#pragma once
#include "../memory.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace memoria {

// Single-file JSON backend. The whole collection lives in memory and is
// rewritten atomically after every mutation; suited to small deployments
// and tests. A mutation whose write fails leaves the store unchanged.
// Invalid UTF-8 in stored text is replaced with U+FFFD.
class JsonStore : public MemoryStore {
public:
    explicit JsonStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    std::vector<Memory> find_active(const std::string& owner, uint64_t now) override;
    std::string upsert(const std::string& owner, const NewMemory& memory) override;
    uint32_t bump_salience(const std::vector<std::string>& ids, double delta) override;
    uint32_t delete_all_for(const std::string& owner) override;
    std::optional<Memory> get(const std::string& id) override;
    MemoryStats stats(const std::string& owner) override;
    uint32_t purge_expired(uint64_t now) override;

private:
    void load();
    void save(const std::vector<Memory>& entries) const;
    void commit(std::vector<Memory> entries);
    void rebuild_index();

    std::string path_;
    std::vector<Memory> entries_;
    std::map<std::pair<std::string, std::string>, size_t> key_index_; // (owner, content) -> index
    mutable std::mutex mutex_;
};

} // namespace memoria
