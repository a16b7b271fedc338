#pragma once
#include <string>
#include <mutex>
#include <cstdint>

namespace graphmem {

enum class HealthState { Healthy, Degraded };

inline const char* health_state_to_string(HealthState s) {
    return s == HealthState::Healthy ? "healthy" : "degraded";
}

// Two-state view of the graph store connection.
//
//   Healthy  --(probe failure / store exception)-->  Degraded
//   Degraded --(successful probe / operation)----->  Healthy
//
// While degraded, best-effort callers only retry the store once
// retry_backoff_ms has passed since the last failure.
class ConnectionHealth {
public:
    explicit ConnectionHealth(uint32_t retry_backoff_ms);

    HealthState state() const;
    bool healthy() const { return state() == HealthState::Healthy; }

    // True if a store attempt should be made at now_ms.
    bool should_attempt(int64_t now_ms) const;

    // Each returns true if the call changed the state.
    bool mark_failure(const std::string& reason, int64_t now_ms);
    bool mark_success();

    std::string last_error() const;

private:
    uint32_t retry_backoff_ms_;
    HealthState state_ = HealthState::Healthy;
    int64_t last_failure_ms_ = 0;
    std::string last_error_;
    mutable std::mutex mutex_;
};

} // namespace graphmem
