#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace memoria {

// SQLite backend. One row per (owner, content); embeddings stored as raw
// float BLOBs, tags and source as JSON text.
class SqliteStore : public MemoryStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::vector<Memory> find_active(const std::string& owner, uint64_t now) override;
    std::string upsert(const std::string& owner, const NewMemory& memory) override;
    uint32_t bump_salience(const std::vector<std::string>& ids, double delta) override;
    uint32_t delete_all_for(const std::string& owner) override;
    std::optional<Memory> get(const std::string& id) override;
    MemoryStats stats(const std::string& owner) override;
    uint32_t purge_expired(uint64_t now) override;

private:
    void init_schema();
    void exec(const char* sql);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace memoria
