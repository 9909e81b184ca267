#pragma once
#include <string>
#include <functional>

namespace chatrelay {

struct SSEEvent {
    std::string event; // event type, empty for unnamed events
    std::string data;  // payload (multi-line data joined with '\n')
    std::string id;    // last "id:" field of the event, if any
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Parse a stream of SSE data, calling the callback for each complete event
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    std::string buffer_;
};

} // namespace chatrelay
