#pragma once
#include <string>
#include <variant>
#include <optional>

namespace chatrelay {

// First frame of every opened stream.
struct MetadataFrame {
    std::string request_id;
    std::string timestamp;
    std::string model;
    std::string provider;
};

// One text fragment.
struct ContentFrame {
    std::string text;
};

// Terminal success.
struct DoneFrame {};

// Terminal failure.
struct ErrorFrame {
    std::string message;
};

using FramePayload = std::variant<MetadataFrame, ContentFrame, DoneFrame, ErrorFrame>;

// A wire frame: payload plus correlation id ("<rid>", "<rid>-<n>",
// "<rid>-done", "<rid>-error").
struct Frame {
    FramePayload payload;
    std::string id;

    bool is_terminal() const {
        return std::holds_alternative<DoneFrame>(payload) ||
               std::holds_alternative<ErrorFrame>(payload);
    }
};

// Frame type names on the wire
const char* frame_type(const Frame& frame);

Frame make_metadata_frame(const std::string& request_id, const std::string& timestamp,
                          const std::string& model, const std::string& provider);
Frame make_content_frame(const std::string& request_id, size_t sequence,
                         const std::string& text);
Frame make_done_frame(const std::string& request_id);
Frame make_error_frame(const std::string& request_id, const std::string& message);

// Serialize to one SSE record: `data: {"type","data","id"}\n\n`.
// Invalid UTF-8 is replaced with U+FFFD.
std::string encode_frame(const Frame& frame);

// Parse the data field of one SSE record. nullopt when malformed.
std::optional<Frame> decode_frame(const std::string& data);

} // namespace chatrelay
