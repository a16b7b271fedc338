#include "api.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../memory/graph_memory.hpp"
#include "../prompt.hpp"
#include "../provider.hpp"
#include "../simulation/coordinator.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>

using json = nlohmann::json;

namespace graphmem {

static ApiResponse json_response(int status, const json& body) {
    ApiResponse resp;
    resp.status = status;
    resp.body = body.dump();
    return resp;
}

static ApiResponse error_response(int status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

static json parse_body(const ApiRequest& request) {
    json body = json::parse(request.body.empty() ? "{}" : request.body);
    if (!body.is_object()) throw std::invalid_argument("Request body must be a JSON object");
    return body;
}

static std::string required_string(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || trim(it->get<std::string>()).empty()) {
        throw std::invalid_argument(std::string("Missing field: ") + key);
    }
    return it->get<std::string>();
}

static std::optional<std::string> optional_string(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) throw std::invalid_argument(std::string("Field must be a string: ") + key);
    return it->get<std::string>();
}

static json history_json(const std::vector<ShortTermMessage>& history) {
    json arr = json::array();
    for (const auto& m : history) arr.push_back(message_to_json(m));
    return arr;
}

ApiRouter::ApiRouter(GraphMemoryService& memory,
                     SimulationCoordinator& simulations,
                     Provider& provider,
                     const ProviderConfig& provider_config)
    : memory_(memory),
      simulations_(simulations),
      provider_(provider),
      model_(provider_config.model),
      temperature_(provider_config.temperature) {}

ApiResponse ApiRouter::handle(const ApiRequest& request) {
    std::vector<std::string> parts;
    for (const auto& p : split(request.path, '/')) {
        if (!p.empty()) parts.push_back(url_decode(p));
    }
    if (parts.empty() || parts[0] != "api") return error_response(404, "Not found");
    parts.erase(parts.begin());

    try {
        return route(request, parts);
    } catch (const NoMessagesError& e) {
        return error_response(404, e.what());
    } catch (const NotFoundError& e) {
        return error_response(404, e.what());
    } catch (const AlreadyCommittedError& e) {
        return error_response(409, e.what());
    } catch (const InvalidStateError& e) {
        return error_response(409, e.what());
    } catch (const StorageUnavailableError& e) {
        return error_response(503, e.what());
    } catch (const GeneratorError& e) {
        return error_response(502, e.what());
    } catch (const json::exception& e) {
        return error_response(400, std::string("Malformed request: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[server] " << request.method << " " << request.path
                  << " failed: " << e.what() << "\n";
        return error_response(500, e.what());
    }
}

ApiResponse ApiRouter::route(const ApiRequest& request, const std::vector<std::string>& parts) {
    const std::string& m = request.method;
    size_t n = parts.size();

    if (n == 1 && parts[0] == "health") {
        if (m == "GET") return health();
    } else if (n == 1 && parts[0] == "chat") {
        if (m == "POST") return chat(request);
    } else if (n == 2 && parts[0] == "memory" && parts[1] == "consolidate") {
        if (m == "POST") return consolidate(request);
    } else if (n == 2 && parts[0] == "memory") {
        if (m == "GET") return memory_history(parts[1]);
    } else if (n == 1 && parts[0] == "graph") {
        if (m == "GET") return graph(request);
        if (m == "DELETE") return clear_graph(request);
    } else if (n >= 2 && parts[0] == "simulation") {
        if (n == 2 && parts[1] == "commit") {
            if (m == "POST") return simulation_commit(request);
        } else if (parts[1] == "run") {
            if (n == 2) {
                if (m == "POST") return simulation_submit(request);
                if (m == "GET") return simulation_list();
            } else if (n == 3) {
                if (m == "GET") return simulation_status(parts[2]);
                if (m == "DELETE") return simulation_discard(parts[2]);
            } else if (n == 4 && parts[3] == "cancel") {
                if (m == "POST") return simulation_cancel(parts[2]);
            } else {
                return error_response(404, "Not found");
            }
        } else {
            return error_response(404, "Not found");
        }
    } else {
        return error_response(404, "Not found");
    }
    return error_response(405, "Method not allowed");
}

// ── Memory ─────────────────────────────────────────────────────

ApiResponse ApiRouter::health() {
    MemoryHealth h = memory_.health();
    json body = health_to_json(h);
    body["status"] = h.store_reachable ? "ok" : "degraded";
    body["provider"] = {
        {"name", provider_.provider_name()},
        {"reachable", provider_.reachable()},
    };
    return json_response(200, body);
}

ApiResponse ApiRouter::chat(const ApiRequest& request) {
    json body = parse_body(request);
    std::string session_id = required_string(body, "session_id");
    std::string message = required_string(body, "message");

    ShortTermMessage user_msg = memory_.record_message(session_id, "user", message);

    std::string reply;
    try {
        auto messages = build_chat_messages(memory_.history(session_id));
        ChatResponse resp = provider_.chat(messages, model_, temperature_);
        reply = resp.content.value_or("");
    } catch (const GeneratorError& e) {
        std::cerr << "[server] Chat reply failed for session " << session_id
                  << ": " << e.what() << "\n";
        return json_response(502, json{
            {"error", e.what()},
            {"session_id", session_id},
            {"degraded", user_msg.degraded},
        });
    }

    ShortTermMessage reply_msg = memory_.record_message(session_id, "assistant", reply);
    return json_response(200, json{
        {"session_id", session_id},
        {"reply", reply},
        {"degraded", user_msg.degraded || reply_msg.degraded},
        {"short_term_snapshot", history_json(memory_.history(session_id))},
    });
}

ApiResponse ApiRouter::memory_history(const std::string& session_id) {
    return json_response(200, history_json(memory_.history(session_id)));
}

ApiResponse ApiRouter::consolidate(const ApiRequest& request) {
    json body = parse_body(request);
    std::string session_id = required_string(body, "session_id");
    auto note = optional_string(body, "note");
    if (!note) note = optional_string(body, "notes");

    Knowledge k = memory_.consolidate(session_id, note);
    return json_response(200, json{{"knowledge_id", k.id}, {"summary", k.summary}});
}

ApiResponse ApiRouter::graph(const ApiRequest& request) {
    ExportFilter filter;
    std::string session = request.query_param("session");
    if (!session.empty()) filter.session_id = session;
    std::string expired = to_lower(request.query_param("include_expired"));
    filter.include_expired = expired == "true" || expired == "1";
    return json_response(200, view_to_json(memory_.export_graph(filter)));
}

ApiResponse ApiRouter::clear_graph(const ApiRequest& request) {
    if (to_lower(request.query_param("confirm")) != "true") {
        return error_response(400, "Refusing to clear the graph without confirm=true");
    }
    memory_.reset();
    return json_response(200, json{{"status", "graph cleared"}});
}

// ── Simulation ─────────────────────────────────────────────────

ApiResponse ApiRouter::simulation_submit(const ApiRequest& request) {
    json body = parse_body(request);

    SimulationRequest req;
    auto it = body.find("participants");
    if (it == body.end() || !it->is_array()) {
        throw std::invalid_argument("participants must be an array");
    }
    for (const auto& p : *it) {
        Participant participant;
        if (p.is_string()) {
            participant.role = p.get<std::string>();
        } else if (p.is_object()) {
            participant.role = p.value("role", "");
            participant.persona = p.value("persona", "");
        } else {
            throw std::invalid_argument("participant must be a string or an object");
        }
        req.participants.push_back(std::move(participant));
    }
    auto limit = body.find("turn_limit");
    if (limit == body.end() || !limit->is_number_integer() || limit->get<int64_t>() < 1) {
        throw std::invalid_argument("turn_limit must be a positive integer");
    }
    int64_t turns = limit->get<int64_t>();
    req.turn_limit = turns > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(turns);
    req.seed_context = body.value("seed_context", "");

    std::string job_id = simulations_.submit(req);
    SimulationJob job = simulations_.status(job_id);
    return json_response(202, json{
        {"job_id", job_id},
        {"status", job_status_to_string(job.status)},
    });
}

ApiResponse ApiRouter::simulation_list() {
    json arr = json::array();
    for (const auto& s : simulations_.list()) arr.push_back(job_summary_to_json(s));
    return json_response(200, arr);
}

ApiResponse ApiRouter::simulation_status(const std::string& job_id) {
    return json_response(200, job_to_json(simulations_.status(job_id)));
}

ApiResponse ApiRouter::simulation_cancel(const std::string& job_id) {
    return json_response(200, job_to_json(simulations_.cancel(job_id)));
}

ApiResponse ApiRouter::simulation_discard(const std::string& job_id) {
    simulations_.discard(job_id);
    return json_response(200, json{{"job_id", job_id}, {"status", "discarded"}});
}

ApiResponse ApiRouter::simulation_commit(const ApiRequest& request) {
    json body = parse_body(request);
    std::string job_id = required_string(body, "job_id");
    auto target = optional_string(body, "target_session_id");

    AppliedDelta applied = simulations_.commit(job_id, target);
    json out = applied_to_json(applied);
    out["job_id"] = job_id;
    return json_response(200, out);
}

} // namespace graphmem
