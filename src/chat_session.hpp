#pragma once
#include "event_bus.hpp"
#include "http.hpp"
#include "provider.hpp"
#include "stream_reader.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

// Shown when a request failed before any reply could be streamed.
extern const char* const kTransportErrorReply;

struct ChatMessage {
    Role role = Role::User;
    std::string content;
    std::string timestamp;                                  // ISO 8601 UTC
    nlohmann::json metadata = nlohmann::json::object();     // {"error": true} on failure

    bool is_error() const;
};

struct SessionOptions {
    std::string api_url;
    uint32_t max_retries = 3;
    std::vector<Header> headers;       // added to every request (identity, origin)
    long idle_timeout_seconds = 60;
};

struct StreamMetrics {
    std::string request_id;            // from the metadata frame
    uint64_t start_ms = 0;             // epoch millis of the dispatch
    size_t message_count = 0;          // content frames applied
    size_t error_count = 0;
    std::vector<uint64_t> latency_ms;  // last 10 fragment arrival times, relative to open
};

enum class RetryResult { Dispatched, Busy, Exhausted, NothingToRetry };

// Client side of the relay: keeps the conversation, drives one streaming
// request at a time and rebuilds the assistant reply from the frames.
// Observers are notified through the event bus with the session lock
// released, so handlers may call back into the session.
class ChatSession : public StreamTarget {
public:
    ChatSession(HttpClient& http, SessionOptions options, EventBus* bus = nullptr);

    // Append a user message and stream the reply. Blocks until the stream
    // ended. Returns false without doing anything when text is blank or a
    // request is already in flight. payload keys are merged into the
    // request body and remembered for retry().
    bool send_message(const std::string& text,
                      const nlohmann::json& payload = nlohmann::json::object());

    // Resubmit the last user message after a failed reply.
    RetryResult retry();

    // Forget messages, error and retry count. False while a request is in flight.
    bool clear();

    // Abandon the in-flight stream. A new message may be sent right away;
    // later frames and the late end of the old stream are ignored.
    void cancel();

    std::vector<ChatMessage> messages() const;
    ConnectionStatus status() const;
    uint32_t retry_count() const;
    std::string error() const;
    bool in_flight() const;
    StreamMetrics metrics() const;

    // StreamTarget
    void on_metadata(const MetadataFrame& meta, const std::string& stream_token) override;
    void on_content(const std::string& text, const std::string& stream_token) override;
    void on_done(const std::string& stream_token) override;
    void on_error(const std::string& message, const std::string& stream_token) override;

private:
    using Outbox = std::vector<std::function<void(EventBus&)>>;

    struct StreamingTarget {
        size_t index;
        std::string token;
    };

    // All *_locked helpers expect mutex_ held.
    void begin_dispatch_locked(const std::string& text, const std::string& token,
                               bool is_retry, Outbox& outbox);
    std::string build_body_locked() const;
    bool set_status_locked(ConnectionStatus to, Outbox& outbox);
    bool is_active_locked(const std::string& token) const;
    void fail_request_locked(const std::string& message, Outbox& outbox);
    void fail_status_locked(long status, const std::string& body, Outbox& outbox);

    void run_request(const std::string& body, const std::string& token);
    void on_stream_opened(const std::string& token);
    void finish_request(const HttpResponse& response, bool terminal_seen,
                        const std::string& token);
    void publish(Outbox& outbox);

    HttpClient& http_;
    SessionOptions options_;
    EventBus* bus_;

    mutable std::mutex mutex_;
    std::vector<ChatMessage> messages_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    uint32_t retry_count_ = 0;
    std::string error_;
    nlohmann::json last_payload_ = nlohmann::json::object();
    bool in_flight_ = false;
    std::string request_token_;                 // token of the current dispatch
    bool cancelled_ = false;
    std::optional<StreamingTarget> streaming_;  // open sink for content frames
    std::chrono::steady_clock::time_point opened_at_;
    StreamMetrics metrics_;
};

} // namespace chatrelay
