#pragma once
#include "../generator.hpp"
#include "../graph/types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace graphmem {

enum class JobStatus { Queued, Running, Completed, Failed, Cancelled };

const char* job_status_to_string(JobStatus status);

// Completed, Failed and Cancelled never change again.
inline bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

struct SimulationRequest {
    std::vector<Participant> participants;
    uint32_t turn_limit = 0;
    std::string seed_context;
};

struct ProgressRecord {
    uint32_t turn_index = 0;
    std::string speaker;
    std::string content;
    int64_t timestamp = 0;                   // epoch ms
    std::optional<GraphDelta> delta_snapshot; // dialogue so far, when attached
};

// Snapshot of a job as seen by pollers. Always a copy.
struct SimulationJob {
    std::string id;
    JobStatus status = JobStatus::Queued;
    std::vector<Participant> participants;
    std::string seed_context;
    uint32_t turn_limit = 0;
    std::vector<ProgressRecord> progress;
    std::optional<GraphDelta> latest_delta;
    std::optional<GraphDelta> final_delta;
    std::string summary;
    std::string error;
    bool finished_naturally = false;
    bool committed = false;
    std::optional<AppliedDelta> commit_result;
    int64_t created_at = 0;
    int64_t started_at = 0;
    int64_t finished_at = 0;
};

struct JobSummary {
    std::string id;
    JobStatus status = JobStatus::Queued;
    uint32_t turns_completed = 0;
    uint32_t turn_limit = 0;
    bool committed = false;
    int64_t created_at = 0;
};

// Session a job's delta is proposed for unless commit names another.
std::string simulation_session_id(const std::string& job_id);

// Graph delta for the dialogue so far: session node, one message node per
// record (HAS_MESSAGE + NEXT). With a summary, also a Knowledge node linked
// from every message (CONTRIBUTED_TO) and from the session (YIELDED).
// Node ids depend only on the job id and turn index, so successive
// snapshots describe the same nodes.
GraphDelta build_dialogue_delta(const std::string& job_id,
                                const std::vector<Participant>& participants,
                                const std::string& seed_context,
                                const std::vector<ProgressRecord>& progress,
                                const std::optional<std::string>& summary = std::nullopt);

nlohmann::json progress_to_json(const ProgressRecord& record);
nlohmann::json job_to_json(const SimulationJob& job);
nlohmann::json job_summary_to_json(const JobSummary& summary);

} // namespace graphmem
