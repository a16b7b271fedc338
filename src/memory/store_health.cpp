#include "store_health.hpp"

namespace graphmem {

ConnectionHealth::ConnectionHealth(uint32_t retry_backoff_ms)
    : retry_backoff_ms_(retry_backoff_ms) {}

HealthState ConnectionHealth::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionHealth::should_attempt(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HealthState::Healthy) return true;
    return now_ms - last_failure_ms_ >= static_cast<int64_t>(retry_backoff_ms_);
}

bool ConnectionHealth::mark_failure(const std::string& reason, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_failure_ms_ = now_ms;
    last_error_ = reason;
    if (state_ == HealthState::Degraded) return false;
    state_ = HealthState::Degraded;
    return true;
}

bool ConnectionHealth::mark_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HealthState::Healthy) return false;
    state_ = HealthState::Healthy;
    last_error_.clear();
    return true;
}

std::string ConnectionHealth::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace graphmem
