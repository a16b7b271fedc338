#include "coordinator.hpp"
#include "../errors.hpp"
#include "../event_bus.hpp"
#include "../memory/graph_memory.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace graphmem {

SimulationCoordinator::SimulationCoordinator(DialogueGenerator& generator,
                                             Summarizer& summarizer,
                                             GraphMemoryService& memory,
                                             const SimulationConfig& config,
                                             EventBus* bus)
    : generator_(generator),
      summarizer_(summarizer),
      memory_(memory),
      config_(config),
      bus_(bus) {}

SimulationCoordinator::~SimulationCoordinator() {
    shutdown();
}

static void validate_request(const SimulationRequest& request, uint32_t max_turns) {
    if (request.participants.size() < 2) {
        throw std::invalid_argument("A simulation needs at least two participants");
    }
    std::unordered_set<std::string> roles;
    for (const auto& p : request.participants) {
        std::string role = trim(p.role);
        if (role.empty()) {
            throw std::invalid_argument("Participant role must not be empty");
        }
        if (!roles.insert(role).second) {
            throw std::invalid_argument("Duplicate participant role: " + role);
        }
    }
    if (request.turn_limit < 1 || request.turn_limit > max_turns) {
        throw std::invalid_argument("turn_limit must be between 1 and " +
                                    std::to_string(max_turns));
    }
}

// ── State transitions ──────────────────────────────────────────

bool SimulationCoordinator::transition(JobRecord& rec, JobStatus to, const std::string& error) {
    auto& job = rec.job;
    if (is_terminal(job.status)) return false;
    if (to == JobStatus::Running && job.status != JobStatus::Queued) return false;

    job.status = to;
    if (to == JobStatus::Running) job.started_at = epoch_millis();
    if (is_terminal(to)) job.finished_at = epoch_millis();
    if (!error.empty()) job.error = error;
    rec.cv.notify_all();
    return true;
}

bool SimulationCoordinator::check_timeout(JobRecord& rec, int64_t now_ms) {
    if (config_.timeout_seconds == 0 || is_terminal(rec.job.status)) return false;
    int64_t start = rec.job.started_at ? rec.job.started_at : rec.job.created_at;
    if (now_ms - start <= static_cast<int64_t>(config_.timeout_seconds) * 1000) return false;

    transition(rec, JobStatus::Failed,
               "Simulation exceeded " + std::to_string(config_.timeout_seconds) + " seconds");
    rec.cancel_requested = true;
    return true;
}

void SimulationCoordinator::publish_status(const SimulationJob& snapshot) {
    if (is_terminal(snapshot.status)) {
        std::cerr << "[simulation] Job " << snapshot.id << " "
                  << job_status_to_string(snapshot.status);
        if (!snapshot.error.empty()) std::cerr << ": " << snapshot.error;
        std::cerr << "\n";
    }
    JobStatusChangedEvent ev;
    ev.job_id = snapshot.id;
    ev.status = job_status_to_string(snapshot.status);
    ev.error = snapshot.error;
    publish(bus_, ev);
}

// ── Execution ──────────────────────────────────────────────────

void SimulationCoordinator::run(const std::shared_ptr<JobRecord>& rec) {
    struct DoneGuard {
        JobRecord& r;
        ~DoneGuard() { r.worker_done = true; }
    } done{*rec};

    std::vector<Participant> participants;
    std::string seed;
    std::string job_id;
    uint32_t limit = 0;
    SimulationJob snapshot;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (!transition(*rec, JobStatus::Running)) return;  // cancelled while queued
        participants = rec->job.participants;
        seed = rec->job.seed_context;
        job_id = rec->job.id;
        limit = rec->job.turn_limit;
        snapshot = rec->job;
    }
    publish_status(snapshot);

    // Records a status change made by this worker and publishes it.
    auto finish = [&](JobStatus to, const std::string& error) {
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            changed = transition(*rec, to, error);
            snapshot = rec->job;
        }
        if (changed) publish_status(snapshot);
    };

    std::vector<DialogueTurn> transcript;
    std::vector<ProgressRecord> records;
    bool natural_end = false;

    for (uint32_t turn = 0; turn < limit; ++turn) {
        if (rec->cancel_requested) return;
        bool timed_out = false;
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            timed_out = check_timeout(*rec, epoch_millis());
            if (timed_out) snapshot = rec->job;
        }
        if (timed_out) {
            publish_status(snapshot);
            return;
        }

        const Participant& speaker = participants[turn % participants.size()];
        GeneratedTurn out;
        try {
            out = generator_.next_turn(speaker, participants, transcript, seed);
        } catch (const std::exception& e) {
            finish(JobStatus::Failed, "Generator failed for " + speaker.role + ": " + e.what());
            return;
        }

        transcript.push_back({speaker.role, out.content});
        ProgressRecord pr;
        pr.turn_index = turn;
        pr.speaker = speaker.role;
        pr.content = out.content;
        pr.timestamp = epoch_millis();
        records.push_back(pr);
        if (config_.delta_snapshot_interval > 0 &&
            (turn + 1) % config_.delta_snapshot_interval == 0) {
            pr.delta_snapshot = build_dialogue_delta(job_id, participants, seed, records);
        }

        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            // Cancelled or timed out while the generator was running: the
            // finished turn is dropped.
            if (rec->job.status != JobStatus::Running) return;
            if (pr.delta_snapshot) rec->job.latest_delta = pr.delta_snapshot;
            rec->job.progress.push_back(std::move(pr));
        }

        JobProgressEvent ev;
        ev.job_id = job_id;
        ev.turn_index = turn;
        ev.speaker = speaker.role;
        publish(bus_, ev);

        if (out.finished) {
            natural_end = true;
            break;
        }
    }

    if (rec->cancel_requested) return;

    std::string summary;
    try {
        summary = summarizer_.summarize(transcript, std::nullopt);
    } catch (const std::exception& e) {
        finish(JobStatus::Failed, std::string("Summary failed: ") + e.what());
        return;
    }

    GraphDelta final_delta = build_dialogue_delta(job_id, participants, seed, records, summary);
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (check_timeout(*rec, epoch_millis())) {
            changed = true;
        } else if (rec->job.status == JobStatus::Running) {
            rec->job.summary = summary;
            rec->job.final_delta = final_delta;
            rec->job.latest_delta = std::move(final_delta);
            rec->job.finished_naturally = natural_end;
            changed = transition(*rec, JobStatus::Completed);
        }
        snapshot = rec->job;
    }
    if (changed) publish_status(snapshot);
}

// ── Public API ─────────────────────────────────────────────────

std::string SimulationCoordinator::submit(const SimulationRequest& request) {
    validate_request(request, config_.max_turns);
    reap_finished();

    auto rec = std::make_shared<JobRecord>();
    rec->job.id = generate_id();
    rec->job.status = JobStatus::Queued;
    rec->job.participants = request.participants;
    for (auto& p : rec->job.participants) p.role = trim(p.role);
    rec->job.seed_context = request.seed_context;
    rec->job.turn_limit = request.turn_limit;
    rec->job.created_at = epoch_millis();
    const std::string id = rec->job.id;

    std::lock_guard<std::mutex> workers_lock(workers_mutex_);
    if (shut_down_) throw InvalidStateError("Simulation coordinator is shut down");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.emplace(id, rec);
        order_.push_back(id);
        enforce_retention();
    }
    SimulationJob snapshot;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        snapshot = rec->job;
    }
    publish_status(snapshot);

    workers_.push_back(Worker{rec, std::thread([this, rec]() { run(rec); })});
    std::cerr << "[simulation] Job " << id << " queued: "
              << request.participants.size() << " participants, "
              << request.turn_limit << " turns\n";
    return id;
}

std::shared_ptr<SimulationCoordinator::JobRecord>
SimulationCoordinator::find(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) throw NotFoundError("Unknown simulation job: " + job_id);
    return it->second;
}

SimulationJob SimulationCoordinator::status(const std::string& job_id) {
    auto rec = find(job_id);
    SimulationJob snapshot;
    bool timed_out = false;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        timed_out = check_timeout(*rec, epoch_millis());
        snapshot = rec->job;
    }
    if (timed_out) publish_status(snapshot);
    return snapshot;
}

SimulationJob SimulationCoordinator::cancel(const std::string& job_id) {
    auto rec = find(job_id);
    SimulationJob snapshot;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        changed = check_timeout(*rec, epoch_millis());
        if (!changed) {
            changed = transition(*rec, JobStatus::Cancelled);
            if (changed) rec->cancel_requested = true;
        }
        snapshot = rec->job;
    }
    if (changed) publish_status(snapshot);
    return snapshot;
}

AppliedDelta SimulationCoordinator::commit(const std::string& job_id,
                                           const std::optional<std::string>& target_session) {
    auto rec = find(job_id);
    GraphDelta delta;
    std::string target;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        auto& job = rec->job;
        if (job.committed) throw AlreadyCommittedError(job_id);
        if (rec->committing) {
            throw InvalidStateError("Simulation job " + job_id + " is being committed");
        }
        if (job.status != JobStatus::Completed || !job.final_delta) {
            throw InvalidStateError("Simulation job " + job_id + " is " +
                                    job_status_to_string(job.status) +
                                    "; only completed jobs can be committed");
        }
        rec->committing = true;
        delta = *job.final_delta;
        target = target_session && !target_session->empty()
            ? *target_session : simulation_session_id(job_id);
    }

    AppliedDelta applied;
    try {
        applied = memory_.apply_delta(delta, target);
    } catch (...) {
        std::lock_guard<std::mutex> lock(rec->mutex);
        rec->committing = false;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        rec->committing = false;
        rec->job.committed = true;
        rec->job.commit_result = applied;
    }
    std::cerr << "[simulation] Job " << job_id << " committed to session " << target << "\n";
    return applied;
}

void SimulationCoordinator::discard(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) throw NotFoundError("Unknown simulation job: " + job_id);
    {
        std::lock_guard<std::mutex> job_lock(it->second->mutex);
        if (!is_terminal(it->second->job.status) || it->second->committing) {
            throw InvalidStateError("Simulation job " + job_id + " is still active");
        }
    }
    jobs_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), job_id), order_.end());
}

std::vector<JobSummary> SimulationCoordinator::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobSummary> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto& rec = jobs_.at(id);
        std::lock_guard<std::mutex> job_lock(rec->mutex);
        JobSummary s;
        s.id = id;
        s.status = rec->job.status;
        s.turns_completed = static_cast<uint32_t>(rec->job.progress.size());
        s.turn_limit = rec->job.turn_limit;
        s.committed = rec->job.committed;
        s.created_at = rec->job.created_at;
        out.push_back(std::move(s));
    }
    return out;
}

bool SimulationCoordinator::wait(const std::string& job_id, std::chrono::milliseconds timeout) {
    auto rec = find(job_id);
    std::unique_lock<std::mutex> lock(rec->mutex);
    return rec->cv.wait_for(lock, timeout, [&] { return is_terminal(rec->job.status); });
}

void SimulationCoordinator::enforce_retention() {
    // Must be called with mutex_ already held.
    size_t limit = config_.max_retained_jobs == 0 ? 1 : config_.max_retained_jobs;
    auto it = order_.begin();
    while (jobs_.size() > limit && it != order_.end()) {
        auto& rec = jobs_.at(*it);
        bool droppable;
        {
            std::lock_guard<std::mutex> job_lock(rec->mutex);
            droppable = is_terminal(rec->job.status) && !rec->committing;
        }
        if (!droppable) {
            ++it;
            continue;
        }
        std::cerr << "[simulation] Dropping job " << *it << " (retention limit)\n";
        jobs_.erase(*it);
        it = order_.erase(it);
    }
}

void SimulationCoordinator::reap_finished() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto split = std::stable_partition(workers_.begin(), workers_.end(),
            [](const Worker& w) { return !w.record->worker_done; });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void SimulationCoordinator::shutdown() {
    std::vector<std::shared_ptr<JobRecord>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, rec] : jobs_) records.push_back(rec);
    }
    for (auto& rec : records) {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (transition(*rec, JobStatus::Cancelled)) rec->cancel_requested = true;
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        shut_down_ = true;
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

} // namespace graphmem
