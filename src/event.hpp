#pragma once
#include "stream_reader.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace chatrelay {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* RelayCompleted   = "RelayCompleted";
    constexpr const char* ChatStart        = "ChatStart";
    constexpr const char* ConnectionChange = "ConnectionChange";
    constexpr const char* ChatDelta        = "ChatDelta";
    constexpr const char* ChatComplete     = "ChatComplete";
    constexpr const char* ChatError        = "ChatError";
    constexpr const char* RetryExhausted   = "RetryExhausted";
} // namespace event_tags

// ── Relay (server side) ─────────────────────────────────────────

// One per admitted request, success or not.
struct RelayCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::RelayCompleted;
    std::string request_id;
    std::string provider;
    uint64_t duration_ms = 0;
    size_t fragment_count = 0;
    size_t error_count = 0;
    std::string error;        // empty on success

    RelayCompletedEvent() { type_tag = TAG; }
};

// ── Chat session (client side) ──────────────────────────────────

struct ChatStartEvent : Event {
    static constexpr const char* TAG = event_tags::ChatStart;
    std::string text;         // user text being sent
    bool is_retry = false;

    ChatStartEvent() { type_tag = TAG; }
};

struct ConnectionChangeEvent : Event {
    static constexpr const char* TAG = event_tags::ConnectionChange;
    ConnectionStatus from = ConnectionStatus::Disconnected;
    ConnectionStatus to = ConnectionStatus::Disconnected;

    ConnectionChangeEvent() { type_tag = TAG; }
};

struct ChatDeltaEvent : Event {
    static constexpr const char* TAG = event_tags::ChatDelta;
    size_t message_index = 0;
    std::string delta;

    ChatDeltaEvent() { type_tag = TAG; }
};

struct ChatCompleteEvent : Event {
    static constexpr const char* TAG = event_tags::ChatComplete;
    size_t message_index = 0;
    std::string content;
    std::string request_id;

    ChatCompleteEvent() { type_tag = TAG; }
};

struct ChatErrorEvent : Event {
    static constexpr const char* TAG = event_tags::ChatError;
    std::string message;

    ChatErrorEvent() { type_tag = TAG; }
};

struct RetryExhaustedEvent : Event {
    static constexpr const char* TAG = event_tags::RetryExhausted;
    uint32_t attempts = 0;

    RetryExhaustedEvent() { type_tag = TAG; }
};

} // namespace chatrelay
