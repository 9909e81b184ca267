#include "frame.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>

using json = nlohmann::json;

namespace chatrelay {

namespace {

template<class T> struct always_false : std::false_type {};

std::string dump_json(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

const char* frame_type(const Frame& frame) {
    return std::visit([](const auto& p) -> const char* {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, MetadataFrame>) return "metadata";
        else if constexpr (std::is_same_v<T, ContentFrame>) return "content";
        else if constexpr (std::is_same_v<T, DoneFrame>) return "done";
        else if constexpr (std::is_same_v<T, ErrorFrame>) return "error";
        else static_assert(always_false<T>::value, "unhandled frame type");
    }, frame.payload);
}

Frame make_metadata_frame(const std::string& request_id, const std::string& timestamp,
                          const std::string& model, const std::string& provider) {
    return {MetadataFrame{request_id, timestamp, model, provider}, request_id};
}

Frame make_content_frame(const std::string& request_id, size_t sequence,
                         const std::string& text) {
    return {ContentFrame{text}, request_id + "-" + std::to_string(sequence)};
}

Frame make_done_frame(const std::string& request_id) {
    return {DoneFrame{}, request_id + "-done"};
}

Frame make_error_frame(const std::string& request_id, const std::string& message) {
    return {ErrorFrame{message}, request_id + "-error"};
}

std::string encode_frame(const Frame& frame) {
    std::string data = std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, MetadataFrame>) {
            return dump_json({
                {"requestId", p.request_id},
                {"timestamp", p.timestamp},
                {"model", p.model},
                {"provider", p.provider}
            });
        } else if constexpr (std::is_same_v<T, ContentFrame>) {
            return p.text;
        } else if constexpr (std::is_same_v<T, DoneFrame>) {
            return "";
        } else if constexpr (std::is_same_v<T, ErrorFrame>) {
            return p.message;
        } else {
            static_assert(always_false<T>::value, "unhandled frame type");
        }
    }, frame.payload);

    json record = {
        {"type", frame_type(frame)},
        {"data", std::move(data)},
        {"id", frame.id}
    };
    return "data: " + dump_json(record) + "\n\n";
}

std::optional<Frame> decode_frame(const std::string& data) {
    json record = json::parse(data, nullptr, false);
    if (record.is_discarded() || !record.is_object()) return std::nullopt;
    if (!record.contains("type") || !record["type"].is_string()) return std::nullopt;

    std::string type = record["type"].get<std::string>();
    std::string payload;
    if (record.contains("data")) {
        if (record["data"].is_string()) payload = record["data"].get<std::string>();
        else if (!record["data"].is_null()) return std::nullopt;
    }
    std::string id = string_field(record, "id");

    if (type == "metadata") {
        json meta = json::parse(payload, nullptr, false);
        if (meta.is_discarded() || !meta.is_object()) return std::nullopt;
        MetadataFrame m;
        m.request_id = string_field(meta, "requestId");
        m.timestamp = string_field(meta, "timestamp");
        m.model = string_field(meta, "model");
        m.provider = string_field(meta, "provider");
        return Frame{std::move(m), std::move(id)};
    }
    if (type == "content") return Frame{ContentFrame{std::move(payload)}, std::move(id)};
    if (type == "done") return Frame{DoneFrame{}, std::move(id)};
    if (type == "error") return Frame{ErrorFrame{std::move(payload)}, std::move(id)};
    return std::nullopt;
}

} // namespace chatrelay
