#include "fallback_cache.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace graphmem {

FallbackCache::FallbackCache(uint32_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries) {}

size_t FallbackCache::append(const ShortTermMessage& msg, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entries = by_session_[msg.session_id];
    // Per-session appends arrive in created_at order; keep the vector sorted
    // even if a caller ever hands us an older record.
    auto pos = std::upper_bound(entries.begin(), entries.end(), msg.created_at,
        [](int64_t ts, const ShortTermMessage& m) { return ts < m.created_at; });
    auto inserted = entries.insert(pos, msg);
    inserted->degraded = true;
    ++total_;

    prune_locked(now_ms);
    return evict_locked();
}

size_t FallbackCache::prune_locked(int64_t now_ms) {
    // Must be called with mutex_ already held.
    size_t removed = 0;
    for (auto it = by_session_.begin(); it != by_session_.end(); ) {
        auto& entries = it->second;
        auto before = entries.size();
        entries.erase(std::remove_if(entries.begin(), entries.end(),
            [now_ms](const ShortTermMessage& m) { return m.expired(now_ms); }),
            entries.end());
        removed += before - entries.size();
        if (entries.empty()) {
            it = by_session_.erase(it);
        } else {
            ++it;
        }
    }
    total_ -= removed;
    return removed;
}

size_t FallbackCache::evict_locked() {
    // Must be called with mutex_ already held.
    size_t evicted = 0;
    while (total_ > max_entries_) {
        // Each session vector is sorted, so its front is that session's oldest.
        auto oldest = by_session_.end();
        for (auto it = by_session_.begin(); it != by_session_.end(); ++it) {
            if (oldest == by_session_.end() ||
                it->second.front().created_at < oldest->second.front().created_at) {
                oldest = it;
            }
        }
        std::cerr << "[memory] Fallback cache full, dropping message "
                  << oldest->second.front().id << " of session " << oldest->first << "\n";
        oldest->second.erase(oldest->second.begin());
        if (oldest->second.empty()) by_session_.erase(oldest);
        --total_;
        ++evicted;
    }
    return evicted;
}

std::vector<ShortTermMessage> FallbackCache::session_entries(const std::string& session_id,
                                                             int64_t now_ms,
                                                             bool include_expired) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ShortTermMessage> out;
    auto it = by_session_.find(session_id);
    if (it == by_session_.end()) return out;
    for (const auto& m : it->second) {
        if (include_expired || !m.expired(now_ms)) out.push_back(m);
    }
    return out;
}

std::vector<ShortTermMessage> FallbackCache::all_entries(int64_t now_ms,
                                                         bool include_expired) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ShortTermMessage> out;
    out.reserve(total_);
    for (const auto& [session, entries] : by_session_) {
        for (const auto& m : entries) {
            if (include_expired || !m.expired(now_ms)) out.push_back(m);
        }
    }
    return out;
}

std::vector<std::string> FallbackCache::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(by_session_.size());
    for (const auto& [session, _] : by_session_) out.push_back(session);
    std::sort(out.begin(), out.end());
    return out;
}

int64_t FallbackCache::last_timestamp(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_session_.find(session_id);
    if (it == by_session_.end() || it->second.empty()) return 0;
    return it->second.back().created_at;
}

size_t FallbackCache::remove(const std::string& session_id,
                             const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_session_.find(session_id);
    if (it == by_session_.end()) return 0;

    std::unordered_set<std::string> drop(ids.begin(), ids.end());
    auto& entries = it->second;
    auto before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
        [&drop](const ShortTermMessage& m) { return drop.count(m.id) > 0; }),
        entries.end());
    size_t removed = before - entries.size();
    if (entries.empty()) by_session_.erase(it);
    total_ -= removed;
    return removed;
}

size_t FallbackCache::prune_expired(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    return prune_locked(now_ms);
}

size_t FallbackCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

bool FallbackCache::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ == 0;
}

void FallbackCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_session_.clear();
    total_ = 0;
}

} // namespace graphmem
