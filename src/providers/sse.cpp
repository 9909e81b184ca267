#include "sse.hpp"

namespace chatrelay {

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    // Scan from the start of the oldest incomplete event so that an event
    // split across chunks is reassembled with all of its fields.
    SSEEvent current;

    size_t pos = 0;
    size_t event_start = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            break;
        }

        std::string line = buffer_.substr(pos, newline - pos);
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (!current.data.empty()) {
                if (!callback(current)) {
                    buffer_ = buffer_.substr(pos);
                    return false;
                }
            }
            current = SSEEvent{};
            event_start = pos;
        } else if (line.rfind("event:", 0) == 0) {
            current.event = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (!current.data.empty()) {
                current.data += '\n';
            }
            // Handle both "data: payload" (with space) and "data:payload" (without)
            current.data += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        } else if (line.rfind("id:", 0) == 0) {
            current.id = line.substr(line.size() > 3 && line[3] == ' ' ? 4 : 3);
        }
        // Ignore other lines (comments starting with :, retry:, etc.)
    }

    // Keep the unfinished event (and any partial line) for the next feed
    buffer_ = buffer_.substr(event_start);
    return true;
}

void SSEParser::reset() {
    buffer_.clear();
}

} // namespace chatrelay
