#pragma once
#include "frame.hpp"
#include "providers/sse.hpp"
#include <string>
#include <cstddef>

namespace chatrelay {

enum class ConnectionStatus { Disconnected, Connecting, Connected, Error };

const char* connection_status_name(ConnectionStatus status);

// Allowed client connection transitions:
//   disconnected -> connecting          request dispatched
//   connecting   -> connected           2xx response head
//   connected    -> disconnected        done frame
//   connecting/connected -> error       error frame, transport failure, non-2xx
//   error        -> connecting          next send or retry
//   connecting/connected -> disconnected   local cancellation
bool can_transition(ConnectionStatus from, ConnectionStatus to);

// Receiver of decoded frames. Every call carries the token of the reader
// that produced it so the receiver can drop frames of abandoned streams.
class StreamTarget {
public:
    virtual ~StreamTarget() = default;

    virtual void on_metadata(const MetadataFrame& meta, const std::string& stream_token) = 0;
    virtual void on_content(const std::string& text, const std::string& stream_token) = 0;
    virtual void on_done(const std::string& stream_token) = 0;
    virtual void on_error(const std::string& message, const std::string& stream_token) = 0;
};

// Turns the raw relay response body into frames for a StreamTarget.
// Input may be split at any byte boundary.
class ClientStreamReader {
public:
    ClientStreamReader(StreamTarget& target, std::string stream_token);

    // Feed raw response bytes. Returns false once a terminal frame was
    // handled; the caller should stop reading then.
    bool feed(const char* data, size_t len);

    bool finished() const { return finished_; }

    // Request id from the metadata frame, empty until one arrived.
    const std::string& request_id() const { return request_id_; }

    const std::string& stream_token() const { return stream_token_; }

    // Records skipped as malformed or not belonging to this request.
    size_t dropped() const { return dropped_; }

private:
    bool handle_record(const SSEEvent& event);
    bool belongs_to_request(const std::string& frame_id) const;

    StreamTarget& target_;
    std::string stream_token_;
    SSEParser parser_;
    std::string request_id_;
    bool finished_ = false;
    size_t dropped_ = 0;
};

} // namespace chatrelay
