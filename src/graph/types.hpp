#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace graphmem {

// ── Labels and relations ───────────────────────────────────────

namespace labels {
    constexpr const char* ChatSession      = "ChatSession";
    constexpr const char* ShortTermMessage = "ShortTermMessage";
    constexpr const char* Knowledge        = "Knowledge";
} // namespace labels

namespace relations {
    constexpr const char* HasMessage    = "HAS_MESSAGE";
    constexpr const char* Next          = "NEXT";
    constexpr const char* ContributedTo = "CONTRIBUTED_TO";
    constexpr const char* Yielded       = "YIELDED";
} // namespace relations

// Node ids are namespaced by kind so a session id can never collide with
// a message id in the shared nodes table.
std::string session_node_id(const std::string& session_id);
std::string new_message_id();
std::string new_knowledge_id();

// ── Persisted entities ─────────────────────────────────────────

struct ShortTermMessage {
    std::string id;
    std::string session_id;
    std::string role;
    std::string content;
    int64_t created_at = 0;  // epoch ms, strictly increasing within a session
    int64_t expires_at = 0;  // epoch ms
    bool degraded = false;   // held by the fallback cache, not yet in the store

    bool expired(int64_t now_ms) const { return expires_at <= now_ms; }
};

struct Knowledge {
    std::string id;
    std::string session_id;
    std::string summary;
    std::optional<std::string> note;
    int64_t created_at = 0;
    std::vector<std::string> source_ids; // CONTRIBUTED_TO sources, chronological
};

// ── Generic graph shapes (export views and deltas) ─────────────

struct GraphNode {
    std::string id;
    std::string label;
    nlohmann::json properties = nlohmann::json::object();
    bool degraded = false;
};

struct GraphEdge {
    std::string source;
    std::string target;
    std::string relation;
    nlohmann::json properties = nlohmann::json::object();
};

struct GraphView {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
};

// Proposed, not yet persisted nodes and edges. Uses the same labels,
// relations and node ids it will be persisted with.
struct GraphDelta {
    std::string session_id;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    bool empty() const { return nodes.empty() && edges.empty(); }
};

struct AppliedDelta {
    std::string session_id;
    std::vector<std::string> message_ids;
    std::vector<std::string> knowledge_ids;
    size_t nodes_created = 0;
    size_t edges_created = 0;
};

struct ExportFilter {
    std::optional<std::string> session_id;
    bool include_expired = false;
};

struct MemoryHealth {
    bool store_reachable = false;
    bool fallback_active = false;
    size_t fallback_size = 0;
    std::string state;       // "healthy" or "degraded"
    std::string backend;
    std::string last_error;
};

// ── JSON conversion ────────────────────────────────────────────

nlohmann::json message_to_json(const ShortTermMessage& msg);
ShortTermMessage message_from_node(const GraphNode& node);
GraphNode message_to_node(const ShortTermMessage& msg);

nlohmann::json node_to_json(const GraphNode& node);
nlohmann::json edge_to_json(const GraphEdge& edge);
nlohmann::json view_to_json(const GraphView& view);
nlohmann::json delta_to_json(const GraphDelta& delta);
nlohmann::json applied_to_json(const AppliedDelta& applied);
nlohmann::json health_to_json(const MemoryHealth& health);

} // namespace graphmem
