#pragma once
#include "graph_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace graphmem {

// Property graph kept in two SQLite tables:
//   nodes(id, label, session_id, created_at, expires_at, properties)
//   edges(source, target, relation, properties)
// The database is opened lazily and reopened after a connectivity failure,
// so a store that starts unreachable recovers without a restart.
class SqliteGraphStore : public GraphStore {
public:
    explicit SqliteGraphStore(const std::string& path, int busy_timeout_ms = 2000);
    ~SqliteGraphStore() override;

    // Non-copyable
    SqliteGraphStore(const SqliteGraphStore&) = delete;
    SqliteGraphStore& operator=(const SqliteGraphStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    bool probe() override;

    uint64_t write(const std::string& query,
                   const nlohmann::json& params = nlohmann::json::array()) override;
    uint64_t write_batch(const std::vector<Statement>& statements) override;
    std::vector<nlohmann::json> read(const std::string& query,
                                     const nlohmann::json& params = nlohmann::json::array()) override;


private:
    void ensure_open();            // caller holds mutex_
    void init_schema();
    void close();
    [[noreturn]] void fail(int rc, const std::string& context);
    uint64_t run_write(const Statement& stmt);

    sqlite3* db_ = nullptr;
    std::string path_;
    int busy_timeout_ms_;
    mutable std::mutex mutex_;
};

} // namespace graphmem
