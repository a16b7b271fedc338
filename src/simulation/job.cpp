#include "job.hpp"
#include "../util.hpp"

using json = nlohmann::json;

namespace graphmem {

const char* job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "queued";
}

std::string simulation_session_id(const std::string& job_id) {
    return "sim-" + job_id;
}

GraphDelta build_dialogue_delta(const std::string& job_id,
                                const std::vector<Participant>& participants,
                                const std::string& seed_context,
                                const std::vector<ProgressRecord>& progress,
                                const std::optional<std::string>& summary) {
    GraphDelta delta;
    delta.session_id = simulation_session_id(job_id);
    const std::string session_node = session_node_id(delta.session_id);

    json roles = json::array();
    for (const auto& p : participants) roles.push_back(p.role);

    int64_t started = progress.empty() ? epoch_millis() : progress.front().timestamp;
    GraphNode session;
    session.id = session_node;
    session.label = labels::ChatSession;
    session.properties = {
        {"session_id", delta.session_id},
        {"created_at", started},
        {"simulation_job", job_id},
        {"seed_context", seed_context},
        {"participants", roles},
        {"turns", progress.size()}
    };
    delta.nodes.push_back(std::move(session));

    std::vector<std::string> message_ids;
    for (const auto& rec : progress) {
        GraphNode msg;
        msg.id = "msg:" + job_id + "-" + std::to_string(rec.turn_index);
        msg.label = labels::ShortTermMessage;
        msg.properties = {
            {"session_id", delta.session_id},
            {"role", rec.speaker},
            {"content", rec.content},
            {"created_at", rec.timestamp},
            {"turn_index", rec.turn_index}
        };
        delta.edges.push_back(GraphEdge{session_node, msg.id, relations::HasMessage,
                                        json{{"order", rec.turn_index}}});
        if (!message_ids.empty()) {
            delta.edges.push_back(GraphEdge{message_ids.back(), msg.id, relations::Next,
                                            json{{"sequence", rec.turn_index}}});
        }
        message_ids.push_back(msg.id);
        delta.nodes.push_back(std::move(msg));
    }

    if (summary) {
        GraphNode knowledge;
        knowledge.id = "knowledge:" + job_id;
        knowledge.label = labels::Knowledge;
        knowledge.properties = {
            {"session_id", delta.session_id},
            {"summary", *summary},
            {"created_at", progress.empty() ? started : progress.back().timestamp},
            {"source_count", message_ids.size()},
            {"seed_context", seed_context}
        };
        delta.edges.push_back(GraphEdge{session_node, knowledge.id, relations::Yielded,
                                        json::object()});
        for (const auto& id : message_ids) {
            delta.edges.push_back(GraphEdge{id, knowledge.id, relations::ContributedTo,
                                            json::object()});
        }
        delta.nodes.push_back(std::move(knowledge));
    }
    return delta;
}

json progress_to_json(const ProgressRecord& record) {
    json j = {
        {"turn_index", record.turn_index},
        {"speaker", record.speaker},
        {"content", record.content},
        {"timestamp", record.timestamp}
    };
    if (record.delta_snapshot) j["delta"] = delta_to_json(*record.delta_snapshot);
    return j;
}

json job_to_json(const SimulationJob& job) {
    json participants = json::array();
    for (const auto& p : job.participants) {
        participants.push_back({{"role", p.role}, {"persona", p.persona}});
    }
    json progress = json::array();
    for (const auto& rec : job.progress) progress.push_back(progress_to_json(rec));

    json j = {
        {"job_id", job.id},
        {"status", job_status_to_string(job.status)},
        {"participants", participants},
        {"seed_context", job.seed_context},
        {"turn_limit", job.turn_limit},
        {"progress", progress},
        {"finished_naturally", job.finished_naturally},
        {"committed", job.committed},
        {"created_at", job.created_at},
        {"started_at", job.started_at},
        {"finished_at", job.finished_at}
    };
    j["latest_delta"] = job.latest_delta ? delta_to_json(*job.latest_delta) : json(nullptr);
    if (!job.summary.empty()) j["summary"] = job.summary;
    if (!job.error.empty()) j["error"] = job.error;
    if (job.commit_result) j["commit_result"] = applied_to_json(*job.commit_result);
    return j;
}

json job_summary_to_json(const JobSummary& summary) {
    return {
        {"job_id", summary.id},
        {"status", job_status_to_string(summary.status)},
        {"turns_completed", summary.turns_completed},
        {"turn_limit", summary.turn_limit},
        {"committed", summary.committed},
        {"created_at", summary.created_at}
    };
}

} // namespace graphmem
