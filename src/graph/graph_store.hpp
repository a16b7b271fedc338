#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace graphmem {

// One parameterised write. Params are positional (a JSON array); strings,
// numbers, booleans and null bind natively, objects and arrays bind as
// their JSON text.
struct Statement {
    std::string query;
    nlohmann::json params = nlohmann::json::array();
};

// Thin transactional interface to the property-graph database.
//
// Errors:
//   StorageUnavailableError  the backend cannot be reached (open, I/O, lock
//                            timeouts); the call had no effect
//   std::runtime_error       the backend is reachable but rejected the query
//                            (syntax, constraint violation)
class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual std::string backend_name() const = 0;

    // Connectivity check. Never throws.
    virtual bool probe() = 0;

    // Run a single write. Returns the number of rows changed.
    virtual uint64_t write(const std::string& query,
                           const nlohmann::json& params = nlohmann::json::array()) = 0;

    // Run all statements in one transaction: either every statement applies
    // or none does. Returns the total number of rows changed.
    virtual uint64_t write_batch(const std::vector<Statement>& statements) = 0;

    // Run a read. Each row is a JSON object keyed by column name.
    virtual std::vector<nlohmann::json> read(const std::string& query,
                                             const nlohmann::json& params = nlohmann::json::array()) = 0;
};

} // namespace graphmem
