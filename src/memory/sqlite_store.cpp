#include "sqlite_store.hpp"
#include "entry_json.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

static memoria::StoreRegistrar reg_sqlite("sqlite",
    [](const memoria::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = memoria::expand_home("~/.memoria/memory.db");
        }
        return std::make_unique<memoria::SqliteStore>(path);
    });

namespace memoria {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static constexpr const char* kSelectColumns =
    "SELECT id, owner, content, kind, tags, embedding, salience, decay_at,"
    " created_at, updated_at, source FROM memories";

static std::string column_string(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : std::string();
}

// Columns as laid out by kSelectColumns.
static Memory memory_from_stmt(sqlite3_stmt* stmt) {
    Memory m;
    m.id = column_string(stmt, 0);
    m.owner = column_string(stmt, 1);
    m.content = column_string(stmt, 2);
    m.kind = kind_from_string(column_string(stmt, 3));

    auto tags = nlohmann::json::parse(column_string(stmt, 4), nullptr, false);
    if (!tags.is_discarded()) m.tags = tags_from_json(tags);

    const void* blob = sqlite3_column_blob(stmt, 5);
    int blob_size = sqlite3_column_bytes(stmt, 5);
    if (blob && blob_size > 0) {
        m.embedding = deserialize_vector(
            std::string(static_cast<const char*>(blob), static_cast<size_t>(blob_size)));
    }

    m.salience = sqlite3_column_double(stmt, 6);
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        m.decay_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    }
    m.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
    m.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));

    auto source = nlohmann::json::parse(column_string(stmt, 10), nullptr, false);
    if (!source.is_discarded()) m.source = source_from_json(source);
    return m;
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("failed to open database " + path_ + ": " + err);
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError(msg);
    }
}

void SqliteStore::init_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id         TEXT PRIMARY KEY,"
        "  owner      TEXT NOT NULL,"
        "  content    TEXT NOT NULL,"
        "  kind       TEXT NOT NULL,"
        "  tags       TEXT NOT NULL DEFAULT '[]',"
        "  embedding  BLOB,"
        "  salience   REAL NOT NULL,"
        "  decay_at   INTEGER,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  source     TEXT NOT NULL DEFAULT '{}',"
        "  UNIQUE(owner, content)"
        ");");
    exec("CREATE INDEX IF NOT EXISTS memories_owner ON memories(owner);");
    exec("CREATE INDEX IF NOT EXISTS memories_decay ON memories(decay_at);");
}

std::vector<Memory> SqliteStore::find_active(const std::string& owner, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(kSelectColumns) +
        " WHERE owner = ? AND (decay_at IS NULL OR decay_at > ?);";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(now));

    std::vector<Memory> results;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        results.push_back(memory_from_stmt(g.stmt));
    }
    if (rc != SQLITE_DONE) throw StoreError(sqlite3_errmsg(db_));
    return results;
}

std::string SqliteStore::upsert(const std::string& owner, const NewMemory& memory) {
    if (owner.empty() || memory.content.empty()) {
        throw std::invalid_argument("upsert requires owner and content");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = epoch_seconds();
    std::string new_id = generate_id();
    std::string tags = nlohmann::json(memory.tags).dump(-1, ' ', false,
                                                        nlohmann::json::error_handler_t::replace);
    std::string source = source_to_json(memory.source).dump(-1, ' ', false,
                                                             nlohmann::json::error_handler_t::replace);
    std::string blob = serialize_vector(memory.embedding);
    double salience = clamp_salience(memory.salience.value_or(kDefaultSalience));

    // Salience and created_at of an existing row are kept.
    const char* sql =
        "INSERT INTO memories (id, owner, content, kind, tags, embedding, salience,"
        " decay_at, created_at, updated_at, source)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(owner, content) DO UPDATE SET"
        "  kind = excluded.kind,"
        "  tags = excluded.tags,"
        "  embedding = excluded.embedding,"
        "  decay_at = excluded.decay_at,"
        "  updated_at = excluded.updated_at,"
        "  source = excluded.source;";

    {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
            throw StoreError(sqlite3_errmsg(db_));
        }
        sqlite3_bind_text(g.stmt, 1, new_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 3, memory.content.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 4, kind_to_string(memory.kind).c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 5, tags.c_str(), -1, SQLITE_TRANSIENT);
        if (blob.empty()) {
            sqlite3_bind_null(g.stmt, 6);
        } else {
            sqlite3_bind_blob(g.stmt, 6, blob.data(), static_cast<int>(blob.size()),
                              SQLITE_TRANSIENT);
        }
        sqlite3_bind_double(g.stmt, 7, salience);
        if (memory.decay_at) {
            sqlite3_bind_int64(g.stmt, 8, static_cast<sqlite3_int64>(*memory.decay_at));
        } else {
            sqlite3_bind_null(g.stmt, 8);
        }
        sqlite3_bind_int64(g.stmt, 9, static_cast<sqlite3_int64>(now));
        sqlite3_bind_int64(g.stmt, 10, static_cast<sqlite3_int64>(now));
        sqlite3_bind_text(g.stmt, 11, source.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw StoreError(sqlite3_errmsg(db_));
        }
    }

    StmtGuard g;
    const char* select_id = "SELECT id FROM memories WHERE owner = ? AND content = ?;";
    if (sqlite3_prepare_v2(db_, select_id, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, memory.content.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError("upserted row not found");
    }
    return column_string(g.stmt, 0);
}

uint32_t SqliteStore::bump_salience(const std::vector<std::string>& ids, double delta) {
    if (ids.empty()) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql =
        "UPDATE memories SET salience = MIN(1.0, MAX(0.0, salience + ?)),"
        " updated_at = ? WHERE id IN (";
    for (size_t i = 0; i < ids.size(); ++i) {
        sql += (i == 0) ? "?" : ", ?";
    }
    sql += ");";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_double(g.stmt, 1, delta);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(epoch_seconds()));
    int col = 3;
    for (const auto& id : ids) {
        sqlite3_bind_text(g.stmt, col++, id.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

uint32_t SqliteStore::delete_all_for(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "DELETE FROM memories WHERE owner = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

std::optional<Memory> SqliteStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(kSelectColumns) + " WHERE id = ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return memory_from_stmt(g.stmt);
    }
    return std::nullopt;
}

MemoryStats SqliteStore::stats(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql =
        "SELECT kind, COUNT(*), AVG(salience) FROM memories"
        " WHERE owner = ? GROUP BY kind;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);

    MemoryStats stats;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        auto& ks = stats.by_kind[kind_from_string(column_string(g.stmt, 0))];
        auto count = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
        double avg = sqlite3_column_double(g.stmt, 2);
        // Unknown kind strings fold into fact; merge the averages.
        double total_salience = ks.avg_salience * ks.count + avg * count;
        ks.count += count;
        ks.avg_salience = ks.count > 0 ? total_salience / ks.count : 0.0;
        stats.total += count;
    }
    return stats;
}

uint32_t SqliteStore::purge_expired(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "DELETE FROM memories WHERE decay_at IS NOT NULL AND decay_at <= ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(now));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

} // namespace memoria
