#pragma once
#include "../graph/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <cstdint>

namespace graphmem {

// Bounded, time-expiring in-memory mirror of short-term messages that could
// not be written to the graph store. Entries are kept per session in
// created_at order; all methods are thread-safe.
class FallbackCache {
public:
    explicit FallbackCache(uint32_t max_entries);

    // Append a message. Expired entries are dropped first; if the cache is
    // still over capacity the oldest entries (by created_at) are evicted.
    // Returns the number of entries evicted for capacity.
    size_t append(const ShortTermMessage& msg, int64_t now_ms);

    // Entries for one session in created_at order.
    std::vector<ShortTermMessage> session_entries(const std::string& session_id,
                                                  int64_t now_ms,
                                                  bool include_expired) const;

    // All entries, grouped by session, each group in created_at order.
    std::vector<ShortTermMessage> all_entries(int64_t now_ms, bool include_expired) const;

    // Sessions with at least one cached entry.
    std::vector<std::string> sessions() const;

    // Latest created_at cached for a session, 0 if none.
    int64_t last_timestamp(const std::string& session_id) const;

    // Drop entries by id (after they have been written to the store).
    size_t remove(const std::string& session_id, const std::vector<std::string>& ids);

    size_t prune_expired(int64_t now_ms);

    size_t size() const;
    bool empty() const;
    void clear();

private:
    size_t prune_locked(int64_t now_ms);
    size_t evict_locked();

    uint32_t max_entries_;
    std::unordered_map<std::string, std::vector<ShortTermMessage>> by_session_;
    size_t total_ = 0;
    mutable std::mutex mutex_;
};

} // namespace graphmem
