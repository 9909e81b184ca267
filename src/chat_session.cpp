#include "chat_session.hpp"
#include "event.hpp"
#include "util.hpp"

#include <cstddef>
#include <iostream>

using json = nlohmann::json;

namespace chatrelay {

const char* const kTransportErrorReply = "Sorry, there was an error processing your request.";

static constexpr size_t kLatencyWindow = 10;

bool ChatMessage::is_error() const {
    auto it = metadata.find("error");
    return it != metadata.end() && it->is_boolean() && it->get<bool>();
}

ChatSession::ChatSession(HttpClient& http, SessionOptions options, EventBus* bus)
    : http_(http), options_(std::move(options)), bus_(bus) {}

// ── State helpers ───────────────────────────────────────────────

bool ChatSession::set_status_locked(ConnectionStatus to, Outbox& outbox) {
    ConnectionStatus from = status_;
    if (!can_transition(from, to)) {
        std::cerr << "[client] Refused transition " << connection_status_name(from)
                  << " -> " << connection_status_name(to) << '\n';
        return false;
    }
    status_ = to;
    outbox.push_back([from, to](EventBus& bus) {
        ConnectionChangeEvent ev;
        ev.from = from;
        ev.to = to;
        bus.publish(ev);
    });
    return true;
}

bool ChatSession::is_active_locked(const std::string& token) const {
    return streaming_ && streaming_->token == token && !cancelled_;
}

void ChatSession::publish(Outbox& outbox) {
    if (bus_) {
        for (auto& fn : outbox) fn(*bus_);
    }
    outbox.clear();
}

std::string ChatSession::build_body_locked() const {
    json msgs = json::array();
    for (const auto& m : messages_) {
        if (m.is_error()) continue;
        msgs.push_back({{"role", role_to_string(m.role)}, {"content", m.content}});
    }
    json body = {{"messages", msgs}};
    for (auto& [key, value] : last_payload_.items()) {
        body[key] = value;
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

void ChatSession::begin_dispatch_locked(const std::string& text, const std::string& token,
                                        bool is_retry, Outbox& outbox) {
    in_flight_ = true;
    cancelled_ = false;
    request_token_ = token;
    streaming_.reset();
    error_.clear();
    metrics_ = StreamMetrics{};
    metrics_.start_ms = epoch_millis();

    messages_.push_back({Role::User, text, timestamp_now(), json::object()});

    outbox.push_back([text, is_retry](EventBus& bus) {
        ChatStartEvent ev;
        ev.text = text;
        ev.is_retry = is_retry;
        bus.publish(ev);
    });
    set_status_locked(ConnectionStatus::Connecting, outbox);
}

// ── Public API ──────────────────────────────────────────────────

bool ChatSession::send_message(const std::string& text, const json& payload) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;
    std::string token = generate_uuid();

    Outbox outbox;
    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_) return false;
        last_payload_ = payload.is_object() ? payload : json::object();
        begin_dispatch_locked(trimmed, token, false, outbox);
        body = build_body_locked();
    }
    publish(outbox);
    run_request(body, token);
    return true;
}

RetryResult ChatSession::retry() {
    std::string token = generate_uuid();

    Outbox outbox;
    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_) return RetryResult::Busy;

        if (retry_count_ >= options_.max_retries) {
            error_ = "Maximum retry attempts reached";
            uint32_t attempts = retry_count_;
            outbox.push_back([attempts](EventBus& bus) {
                RetryExhaustedEvent ev;
                ev.attempts = attempts;
                bus.publish(ev);
            });
        } else {
            size_t user_idx = messages_.size();
            for (size_t i = messages_.size(); i > 0; --i) {
                if (messages_[i - 1].role == Role::User) {
                    user_idx = i - 1;
                    break;
                }
            }
            if (user_idx == messages_.size()) return RetryResult::NothingToRetry;

            // A user turn that already got a real reply has nothing to retry.
            for (size_t i = user_idx + 1; i < messages_.size(); ++i) {
                const auto& m = messages_[i];
                if (m.role == Role::Assistant && !m.is_error() && !m.content.empty())
                    return RetryResult::NothingToRetry;
            }

            std::string text = messages_[user_idx].content;
            messages_.erase(messages_.begin() + static_cast<std::ptrdiff_t>(user_idx),
                            messages_.end());
            ++retry_count_;
            begin_dispatch_locked(text, token, true, outbox);
            body = build_body_locked();
        }
    }

    publish(outbox);
    if (body.empty()) return RetryResult::Exhausted;
    run_request(body, token);
    return RetryResult::Dispatched;
}

bool ChatSession::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_) return false;
    messages_.clear();
    error_.clear();
    retry_count_ = 0;
    return true;
}

void ChatSession::cancel() {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_ || cancelled_) return;
        cancelled_ = true;
        in_flight_ = false;
        streaming_.reset();
        set_status_locked(ConnectionStatus::Disconnected, outbox);
    }
    publish(outbox);
}

std::vector<ChatMessage> ChatSession::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

ConnectionStatus ChatSession::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

uint32_t ChatSession::retry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_count_;
}

std::string ChatSession::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool ChatSession::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

StreamMetrics ChatSession::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

// ── Transport ───────────────────────────────────────────────────

void ChatSession::run_request(const std::string& body, const std::string& token) {
    ClientStreamReader reader(*this, token);

    std::vector<Header> headers = options_.headers;
    headers.emplace_back("Content-Type", "application/json");
    headers.emplace_back("Accept", "text/event-stream");

    auto still_wanted = [this, &token]() {
        std::lock_guard<std::mutex> lock(mutex_);
        return !cancelled_ && request_token_ == token;
    };

    HttpResponse response = http_.stream_post(
        options_.api_url, body, headers,
        [&](const char* data, size_t len) -> bool {
            if (!still_wanted()) return false;
            return reader.feed(data, len);
        },
        options_.idle_timeout_seconds,
        [&](long status) -> bool {
            if (!still_wanted()) return false;
            if (status >= 200 && status < 300) on_stream_opened(token);
            return true;
        });

    finish_request(response, reader.finished(), token);
}

void ChatSession::on_stream_opened(const std::string& token) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || request_token_ != token) return;
        messages_.push_back({Role::Assistant, "", timestamp_now(), json::object()});
        streaming_ = StreamingTarget{messages_.size() - 1, token};
        opened_at_ = std::chrono::steady_clock::now();
        set_status_locked(ConnectionStatus::Connected, outbox);
    }
    publish(outbox);
}

void ChatSession::fail_request_locked(const std::string& message, Outbox& outbox) {
    error_ = message;
    ++metrics_.error_count;

    if (streaming_ && streaming_->index < messages_.size()) {
        auto& m = messages_[streaming_->index];
        m.metadata["error"] = true;
        if (m.content.empty()) m.content = kTransportErrorReply;
    } else {
        json meta = {{"error", true}};
        messages_.push_back({Role::Assistant, kTransportErrorReply, timestamp_now(), meta});
    }
    streaming_.reset();
    set_status_locked(ConnectionStatus::Error, outbox);

    outbox.push_back([message](EventBus& bus) {
        ChatErrorEvent ev;
        ev.message = message;
        bus.publish(ev);
    });
}

void ChatSession::fail_status_locked(long status, const std::string& body, Outbox& outbox) {
    std::string message;
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") &&
        parsed["error"].is_string() && !parsed["error"].get<std::string>().empty()) {
        message = parsed["error"].get<std::string>();
    } else if (!trim(body).empty()) {
        message = body;
    } else {
        message = "Request failed with status " + std::to_string(status);
    }

    error_ = message;
    ++metrics_.error_count;
    streaming_.reset();

    if (!messages_.empty() && messages_.back().role == Role::Assistant) {
        auto& last = messages_.back();
        last.content = message;
        last.metadata["error"] = true;
    } else {
        messages_.push_back({Role::Assistant, message, timestamp_now(), {{"error", true}}});
    }
    set_status_locked(ConnectionStatus::Error, outbox);

    outbox.push_back([message](EventBus& bus) {
        ChatErrorEvent ev;
        ev.message = message;
        bus.publish(ev);
    });
}

void ChatSession::finish_request(const HttpResponse& response, bool terminal_seen,
                                 const std::string& token) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A cancelled stream may return after a newer dispatch took over.
        if (request_token_ != token) return;
        in_flight_ = false;

        if (!cancelled_ && !terminal_seen) {
            long code = response.status_code;
            if (code != 0 && (code < 200 || code >= 300)) {
                fail_status_locked(code, response.body, outbox);
            } else if (!response.error.empty()) {
                fail_request_locked(response.error, outbox);
            } else if (code == 0) {
                fail_request_locked("No response from " + options_.api_url, outbox);
            } else {
                fail_request_locked("Stream ended before completion", outbox);
            }
        }
        streaming_.reset();
    }
    publish(outbox);
}

// ── Frames ──────────────────────────────────────────────────────

void ChatSession::on_metadata(const MetadataFrame& meta, const std::string& stream_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_active_locked(stream_token)) return;
    metrics_.request_id = meta.request_id;
    auto& m = messages_[streaming_->index];
    m.metadata["requestId"] = meta.request_id;
    if (!meta.model.empty()) m.metadata["model"] = meta.model;
    if (!meta.provider.empty()) m.metadata["provider"] = meta.provider;
}

void ChatSession::on_content(const std::string& text, const std::string& stream_token) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_active_locked(stream_token)) {
            std::cerr << "[client] Dropping stale content frame\n";
            return;
        }
        size_t index = streaming_->index;
        messages_[index].content += text;

        ++metrics_.message_count;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - opened_at_).count();
        metrics_.latency_ms.push_back(static_cast<uint64_t>(elapsed));
        if (metrics_.latency_ms.size() > kLatencyWindow) {
            metrics_.latency_ms.erase(metrics_.latency_ms.begin());
        }

        outbox.push_back([index, text](EventBus& bus) {
            ChatDeltaEvent ev;
            ev.message_index = index;
            ev.delta = text;
            bus.publish(ev);
        });
    }
    publish(outbox);
}

void ChatSession::on_done(const std::string& stream_token) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_active_locked(stream_token)) return;
        size_t index = streaming_->index;
        streaming_.reset();
        retry_count_ = 0;
        set_status_locked(ConnectionStatus::Disconnected, outbox);

        std::string content = messages_[index].content;
        std::string request_id = metrics_.request_id;
        outbox.push_back([index, content, request_id](EventBus& bus) {
            ChatCompleteEvent ev;
            ev.message_index = index;
            ev.content = content;
            ev.request_id = request_id;
            bus.publish(ev);
        });
    }
    publish(outbox);
}

void ChatSession::on_error(const std::string& message, const std::string& stream_token) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_active_locked(stream_token)) return;
        auto& m = messages_[streaming_->index];
        m.metadata["error"] = true;
        if (m.content.empty()) m.content = message;
        error_ = message;
        ++metrics_.error_count;
        streaming_.reset();
        set_status_locked(ConnectionStatus::Error, outbox);

        outbox.push_back([message](EventBus& bus) {
            ChatErrorEvent ev;
            ev.message = message;
            bus.publish(ev);
        });
    }
    publish(outbox);
}

} // namespace chatrelay
