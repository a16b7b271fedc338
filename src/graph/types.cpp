#include "types.hpp"
#include "../util.hpp"

using json = nlohmann::json;

namespace graphmem {

std::string session_node_id(const std::string& session_id) {
    return "session:" + session_id;
}

std::string new_message_id() {
    return "msg:" + generate_id();
}

std::string new_knowledge_id() {
    return "knowledge:" + generate_id();
}

json message_to_json(const ShortTermMessage& msg) {
    return {
        {"id", msg.id},
        {"session_id", msg.session_id},
        {"role", msg.role},
        {"content", msg.content},
        {"created_at", msg.created_at},
        {"created_at_iso", format_timestamp_ms(msg.created_at)},
        {"expires_at", msg.expires_at},
        {"degraded", msg.degraded}
    };
}

ShortTermMessage message_from_node(const GraphNode& node) {
    ShortTermMessage msg;
    msg.id = node.id;
    msg.session_id = node.properties.value("session_id", "");
    msg.role = node.properties.value("role", "");
    msg.content = node.properties.value("content", "");
    msg.created_at = node.properties.value("created_at", int64_t{0});
    msg.expires_at = node.properties.value("expires_at", int64_t{0});
    msg.degraded = node.degraded;
    return msg;
}

GraphNode message_to_node(const ShortTermMessage& msg) {
    GraphNode node;
    node.id = msg.id;
    node.label = labels::ShortTermMessage;
    node.properties = {
        {"session_id", msg.session_id},
        {"role", msg.role},
        {"content", msg.content},
        {"created_at", msg.created_at},
        {"expires_at", msg.expires_at}
    };
    node.degraded = msg.degraded;
    return node;
}

json node_to_json(const GraphNode& node) {
    json j = {
        {"id", node.id},
        {"label", node.label},
        {"properties", node.properties}
    };
    if (node.degraded) j["degraded"] = true;
    return j;
}

json edge_to_json(const GraphEdge& edge) {
    json j = {
        {"source", edge.source},
        {"target", edge.target},
        {"type", edge.relation}
    };
    if (!edge.properties.empty()) j["properties"] = edge.properties;
    return j;
}

json view_to_json(const GraphView& view) {
    json nodes = json::array();
    for (const auto& n : view.nodes) nodes.push_back(node_to_json(n));
    json edges = json::array();
    for (const auto& e : view.edges) edges.push_back(edge_to_json(e));
    return {{"nodes", nodes}, {"edges", edges}};
}

json delta_to_json(const GraphDelta& delta) {
    json j = view_to_json(GraphView{delta.nodes, delta.edges});
    j["session_id"] = delta.session_id;
    return j;
}

json applied_to_json(const AppliedDelta& applied) {
    return {
        {"session_id", applied.session_id},
        {"message_ids", applied.message_ids},
        {"knowledge_ids", applied.knowledge_ids},
        {"nodes_created", applied.nodes_created},
        {"edges_created", applied.edges_created}
    };
}

json health_to_json(const MemoryHealth& health) {
    json j = {
        {"store_reachable", health.store_reachable},
        {"fallback_active", health.fallback_active},
        {"fallback_size", health.fallback_size},
        {"state", health.state},
        {"backend", health.backend}
    };
    if (!health.last_error.empty()) j["last_error"] = health.last_error;
    return j;
}

} // namespace graphmem
