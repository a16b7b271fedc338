#pragma once
#include <string>
#include <cstdint>

namespace graphmem {

// Tag-based event dispatch, no RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* StoreHealthChanged = "StoreHealthChanged";
    constexpr const char* MessageRecorded    = "MessageRecorded";
    constexpr const char* KnowledgeCreated   = "KnowledgeCreated";
    constexpr const char* JobStatusChanged   = "JobStatusChanged";
    constexpr const char* JobProgress        = "JobProgress";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct StoreHealthChangedEvent : Event {
    static constexpr const char* TAG = event_tags::StoreHealthChanged;
    bool reachable = false;
    std::string reason;     // error text when degrading, empty on recovery
    size_t pending = 0;     // fallback entries waiting for reconciliation

    StoreHealthChangedEvent() { type_tag = TAG; }
};

struct MessageRecordedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageRecorded;
    std::string session_id;
    std::string message_id;
    std::string role;
    bool degraded = false;

    MessageRecordedEvent() { type_tag = TAG; }
};

struct KnowledgeCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::KnowledgeCreated;
    std::string session_id;
    std::string knowledge_id;
    size_t source_count = 0;

    KnowledgeCreatedEvent() { type_tag = TAG; }
};

struct JobStatusChangedEvent : Event {
    static constexpr const char* TAG = event_tags::JobStatusChanged;
    std::string job_id;
    std::string status;
    std::string error;

    JobStatusChangedEvent() { type_tag = TAG; }
};

struct JobProgressEvent : Event {
    static constexpr const char* TAG = event_tags::JobProgress;
    std::string job_id;
    uint32_t turn_index = 0;
    std::string speaker;

    JobProgressEvent() { type_tag = TAG; }
};

} // namespace graphmem
