#pragma once
#include "../config.hpp"
#include "../graph/graph_store.hpp"
#include "../graph/types.hpp"
#include "fallback_cache.hpp"
#include "store_health.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphmem {

class EventBus;
class Summarizer;

// Orchestrates message ingestion, consolidation, export, delta application
// and hygiene over a GraphStore, falling back to the FallbackCache while the
// store is unreachable. Thread-safe; appends are serialized per session.
class GraphMemoryService {
public:
    using Clock = std::function<int64_t()>;   // epoch milliseconds

    GraphMemoryService(GraphStore& store,
                       FallbackCache& cache,
                       Summarizer& summarizer,
                       const MemoryConfig& memory_config,
                       const StoreConfig& store_config,
                       EventBus* bus = nullptr,
                       Clock clock = nullptr);

    GraphMemoryService(const GraphMemoryService&) = delete;
    GraphMemoryService& operator=(const GraphMemoryService&) = delete;

    // Append a message to the session's chain. Falls back to the cache on a
    // store failure and never throws for one. Throws std::invalid_argument
    // for an empty session or role.
    ShortTermMessage record_message(const std::string& session_id,
                                    const std::string& role,
                                    const std::string& content);

    // Summarize all live messages of the session into a Knowledge node.
    // Throws NoMessagesError, StorageUnavailableError or GeneratorError.
    Knowledge consolidate(const std::string& session_id,
                          const std::optional<std::string>& note = std::nullopt);

    // Live messages of the session in chronological order, store and cache merged.
    std::vector<ShortTermMessage> history(const std::string& session_id);

    // Serialized graph; unflushed cache entries are included and marked degraded.
    GraphView export_graph(const ExportFilter& filter = {});

    // Write a proposed delta into target_session. Node ids are kept, so the
    // same delta cannot be applied twice. Throws StorageUnavailableError or
    // std::runtime_error (e.g. ids already present).
    AppliedDelta apply_delta(const GraphDelta& delta, const std::string& target_session);

    // Delete all persisted and cached memory. Throws StorageUnavailableError
    // if the store cannot be cleared (the cache is cleared regardless).
    void reset();

    // Probe the store, reconcile on recovery, report.
    MemoryHealth health();

    // Write cached entries through to the store, oldest first per session.
    // Returns the number of messages flushed.
    size_t reconcile();

    // Delete expired messages that fed no knowledge, re-linking NEXT around
    // them. Returns the number deleted.
    size_t purge_expired();

private:
    struct SessionState {
        std::mutex mutex;
        int64_t last_ts = 0;      // latest created_at handed out
        bool tail_loaded = false; // last_ts includes what the store holds
    };

    std::shared_ptr<SessionState> session_state(const std::string& session_id);

    // The following require the session's mutex to be held.
    void load_tail(SessionState& st, const std::string& session_id);
    size_t flush_session(const std::string& session_id);
    std::vector<ShortTermMessage> live_messages(const std::string& session_id,
                                                int64_t now_ms, bool durable);

    void note_success();
    void note_failure(const std::string& reason);
    void maybe_reconcile();

    int64_t ttl_ms() const { return static_cast<int64_t>(ttl_minutes_) * 60 * 1000; }

    GraphStore& store_;
    FallbackCache& cache_;
    Summarizer& summarizer_;
    EventBus* bus_;
    Clock clock_;
    uint32_t ttl_minutes_;
    ConnectionHealth health_;

    // reset/purge take it exclusively, every other operation shared.
    std::shared_mutex reset_mutex_;

    std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;

    std::atomic<bool> reconcile_pending_{false};
    std::atomic<bool> reconciling_{false};
};

} // namespace graphmem
