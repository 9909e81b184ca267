#include "stream_reader.hpp"
#include <iostream>
#include <type_traits>

namespace chatrelay {

const char* connection_status_name(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Error:        return "error";
    }
    return "disconnected";
}

bool can_transition(ConnectionStatus from, ConnectionStatus to) {
    switch (from) {
        case ConnectionStatus::Disconnected:
            return to == ConnectionStatus::Connecting;
        case ConnectionStatus::Connecting:
            return to == ConnectionStatus::Connected ||
                   to == ConnectionStatus::Error ||
                   to == ConnectionStatus::Disconnected;
        case ConnectionStatus::Connected:
            return to == ConnectionStatus::Disconnected ||
                   to == ConnectionStatus::Error;
        case ConnectionStatus::Error:
            return to == ConnectionStatus::Connecting;
    }
    return false;
}

ClientStreamReader::ClientStreamReader(StreamTarget& target, std::string stream_token)
    : target_(target), stream_token_(std::move(stream_token)) {}

bool ClientStreamReader::feed(const char* data, size_t len) {
    if (finished_) return false;
    parser_.feed(std::string(data, len), [this](const SSEEvent& event) {
        return handle_record(event);
    });
    return !finished_;
}

// Frames without an id are accepted; only a foreign id is dropped.
bool ClientStreamReader::belongs_to_request(const std::string& frame_id) const {
    if (request_id_.empty() || frame_id.empty()) return true;
    return frame_id.size() > request_id_.size() &&
           frame_id.compare(0, request_id_.size(), request_id_) == 0 &&
           frame_id[request_id_.size()] == '-';
}

bool ClientStreamReader::handle_record(const SSEEvent& event) {
    if (event.data.empty()) return true;

    auto frame = decode_frame(event.data);
    if (!frame) {
        std::cerr << "[client] Failed to parse frame: " << event.data << '\n';
        ++dropped_;
        return true;
    }

    if (std::holds_alternative<MetadataFrame>(frame->payload)) {
        const auto& meta = std::get<MetadataFrame>(frame->payload);
        if (!request_id_.empty()) {
            std::cerr << "[client] Ignoring repeated metadata for " << meta.request_id << '\n';
            ++dropped_;
            return true;
        }
        request_id_ = meta.request_id.empty() ? frame->id : meta.request_id;
        target_.on_metadata(meta, stream_token_);
        return true;
    }

    if (!belongs_to_request(frame->id)) {
        std::cerr << "[client] Dropping frame " << frame->id
                  << " from another request\n";
        ++dropped_;
        return true;
    }

    return std::visit([this](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ContentFrame>) {
            target_.on_content(p.text, stream_token_);
            return true;
        } else if constexpr (std::is_same_v<T, DoneFrame>) {
            finished_ = true;
            target_.on_done(stream_token_);
            return false;
        } else if constexpr (std::is_same_v<T, ErrorFrame>) {
            finished_ = true;
            target_.on_error(p.message, stream_token_);
            return false;
        } else {
            return true;
        }
    }, frame->payload);
}

} // namespace chatrelay
