#pragma once
#include "job.hpp"
#include "../config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace graphmem {

class EventBus;
class GraphMemoryService;

// Owns simulation jobs: each submitted job runs on its own thread, pollers
// read snapshot copies, and a completed job's delta is committed through
// GraphMemoryService at most once.
class SimulationCoordinator {
public:
    SimulationCoordinator(DialogueGenerator& generator,
                          Summarizer& summarizer,
                          GraphMemoryService& memory,
                          const SimulationConfig& config,
                          EventBus* bus = nullptr);
    ~SimulationCoordinator();

    SimulationCoordinator(const SimulationCoordinator&) = delete;
    SimulationCoordinator& operator=(const SimulationCoordinator&) = delete;

    // Validate, enqueue and start a job. Returns its id without waiting.
    // Throws std::invalid_argument for fewer than two participants,
    // empty or duplicate roles, or a turn limit outside [1, max_turns].
    std::string submit(const SimulationRequest& request);

    // Throws NotFoundError for unknown ids.
    SimulationJob status(const std::string& job_id);

    // queued/running -> cancelled; no-op for terminal jobs. Returns the snapshot.
    SimulationJob cancel(const std::string& job_id);

    // Apply the completed job's delta to target_session (default sim-<id>).
    // Throws NotFoundError, InvalidStateError, AlreadyCommittedError or
    // StorageUnavailableError (the job stays committable).
    AppliedDelta commit(const std::string& job_id,
                        const std::optional<std::string>& target_session = std::nullopt);

    // Forget a terminal job. Throws InvalidStateError while it is active.
    void discard(const std::string& job_id);

    // Jobs in submission order.
    std::vector<JobSummary> list();

    // Block until the job is terminal. Returns false on timeout.
    bool wait(const std::string& job_id, std::chrono::milliseconds timeout);

    // Cancel every active job and join all workers.
    void shutdown();

private:
    struct JobRecord {
        std::mutex mutex;
        std::condition_variable cv;
        SimulationJob job;
        std::atomic<bool> cancel_requested{false};
        std::atomic<bool> worker_done{false};
        bool committing = false;
    };

    struct Worker {
        std::shared_ptr<JobRecord> record;
        std::thread thread;
    };

    void run(const std::shared_ptr<JobRecord>& rec);

    std::shared_ptr<JobRecord> find(const std::string& job_id);

    // Require rec.mutex held. transition() returns false if the job is
    // already terminal; check_timeout() returns true if it failed the job.
    bool transition(JobRecord& rec, JobStatus to, const std::string& error = "");
    bool check_timeout(JobRecord& rec, int64_t now_ms);

    void publish_status(const SimulationJob& snapshot);
    void reap_finished();
    void enforce_retention();   // requires mutex_ held

    DialogueGenerator& generator_;
    Summarizer& summarizer_;
    GraphMemoryService& memory_;
    SimulationConfig config_;
    EventBus* bus_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobRecord>> jobs_;
    std::vector<std::string> order_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    bool shut_down_ = false;
};

} // namespace graphmem
