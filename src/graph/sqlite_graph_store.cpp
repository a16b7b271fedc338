#include "sqlite_graph_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

static graphmem::GraphStoreRegistrar reg_sqlite("sqlite",
    [](const graphmem::StoreConfig& config) {
        std::string path = config.path;
        if (path.empty()) {
            path = "~/.graphmem/graph.db";
        }
        return std::make_unique<graphmem::SqliteGraphStore>(graphmem::expand_home(path));
    });

using json = nlohmann::json;

namespace graphmem {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Result codes that mean "the database is not usable right now" rather
// than "this query is wrong".
static bool is_connectivity_error(int rc) {
    switch (rc & 0xff) {
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_FULL:
        case SQLITE_READONLY:
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
        case SQLITE_PERM:
        case SQLITE_PROTOCOL:
            return true;
        default:
            return false;
    }
}

static void bind_params(sqlite3_stmt* stmt, const json& params) {
    if (params.is_null()) return;
    if (!params.is_array()) {
        throw std::invalid_argument("GraphStore params must be a JSON array");
    }
    int idx = 1;
    for (const auto& p : params) {
        if (p.is_string()) {
            const auto& s = p.get_ref<const std::string&>();
            sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
        } else if (p.is_boolean()) {
            sqlite3_bind_int(stmt, idx, p.get<bool>() ? 1 : 0);
        } else if (p.is_number_integer()) {
            sqlite3_bind_int64(stmt, idx, p.get<int64_t>());
        } else if (p.is_number_float()) {
            sqlite3_bind_double(stmt, idx, p.get<double>());
        } else if (p.is_null()) {
            sqlite3_bind_null(stmt, idx);
        } else {
            std::string text = p.dump();
            sqlite3_bind_text(stmt, idx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        ++idx;
    }
}

static json row_from_stmt(sqlite3_stmt* stmt) {
    json row = json::object();
    int cols = sqlite3_column_count(stmt);
    for (int i = 0; i < cols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        switch (sqlite3_column_type(stmt, i)) {
            case SQLITE_INTEGER:
                row[name] = static_cast<int64_t>(sqlite3_column_int64(stmt, i));
                break;
            case SQLITE_FLOAT:
                row[name] = sqlite3_column_double(stmt, i);
                break;
            case SQLITE_NULL:
                row[name] = nullptr;
                break;
            default: {
                auto* v = sqlite3_column_text(stmt, i);
                row[name] = v ? std::string(reinterpret_cast<const char*>(v)) : std::string();
                break;
            }
        }
    }
    return row;
}

SqliteGraphStore::SqliteGraphStore(const std::string& path, int busy_timeout_ms)
    : path_(path), busy_timeout_ms_(busy_timeout_ms) {}

SqliteGraphStore::~SqliteGraphStore() {
    close();
}

void SqliteGraphStore::close() {
    if (db_) {
        // close_v2 defers the close until outstanding statements finalize
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void SqliteGraphStore::fail(int rc, const std::string& context) {
    std::string err = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (is_connectivity_error(rc)) {
        // Drop the handle; the next call reopens from scratch.
        close();
        throw StorageUnavailableError("SqliteGraphStore: " + err);
    }
    throw std::runtime_error("SqliteGraphStore: " + err);
}

void SqliteGraphStore::ensure_open() {
    if (db_) return;

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageUnavailableError("SqliteGraphStore: cannot create " +
                                          parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        close();
        throw StorageUnavailableError("SqliteGraphStore: failed to open " + path_ + ": " + err);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms_);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    init_schema();
    std::cerr << "[store] Opened graph database " << path_ << "\n";
}

void SqliteGraphStore::init_schema() {
    static const char* const kSchema[] = {
        "CREATE TABLE IF NOT EXISTS nodes ("
        "  id         TEXT PRIMARY KEY,"
        "  label      TEXT NOT NULL,"
        "  session_id TEXT,"
        "  created_at INTEGER NOT NULL,"
        "  expires_at INTEGER,"
        "  properties TEXT NOT NULL DEFAULT '{}'"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_nodes_session "
        "  ON nodes(session_id, label, created_at);",
        "CREATE TABLE IF NOT EXISTS edges ("
        "  source     TEXT NOT NULL,"
        "  target     TEXT NOT NULL,"
        "  relation   TEXT NOT NULL,"
        "  properties TEXT NOT NULL DEFAULT '{}',"
        "  PRIMARY KEY (source, target, relation)"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_edges_target ON edges(target, relation);",
    };
    for (const char* sql : kSchema) {
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) fail(rc, "schema");
    }
}

bool SqliteGraphStore::probe() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        ensure_open();
        int rc = sqlite3_exec(db_, "SELECT 1 FROM nodes LIMIT 1;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) fail(rc, "probe");
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[store] Probe failed: " << e.what() << "\n";
        return false;
    }
}

uint64_t SqliteGraphStore::run_write(const Statement& s) {
    StmtGuard g;
    int rc = sqlite3_prepare_v2(db_, s.query.c_str(), -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) fail(rc, "prepare");
    bind_params(g.stmt, s.params);

    rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) fail(rc, "write");
    return static_cast<uint64_t>(sqlite3_changes(db_));
}

uint64_t SqliteGraphStore::write(const std::string& query, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    return run_write(Statement{query, params});
}

uint64_t SqliteGraphStore::write_batch(const std::vector<Statement>& statements) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();

    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) fail(rc, "begin");

    uint64_t changed = 0;
    try {
        for (const auto& s : statements) {
            changed += run_write(s);
        }
    } catch (...) {
        // fail() may already have closed the handle, which rolls back.
        if (db_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    rc = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        fail(rc, "commit");
    }
    return changed;
}

std::vector<json> SqliteGraphStore::read(const std::string& query, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();

    StmtGuard g;
    int rc = sqlite3_prepare_v2(db_, query.c_str(), -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) fail(rc, "prepare");
    bind_params(g.stmt, params);

    std::vector<json> rows;
    rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        rows.push_back(row_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) fail(rc, "read");
    return rows;
}

} // namespace graphmem
