#include <catch2/catch.hpp>
#include "stream_reader.hpp"
#include "frame.hpp"

using namespace chatrelay;

namespace {

struct RecordingTarget : StreamTarget {
    std::vector<std::string> calls;
    std::string last_token;
    std::string content;

    void on_metadata(const MetadataFrame& meta, const std::string& token) override {
        calls.push_back("metadata:" + meta.request_id);
        last_token = token;
    }
    void on_content(const std::string& text, const std::string& token) override {
        calls.push_back("content:" + text);
        content += text;
        last_token = token;
    }
    void on_done(const std::string& token) override {
        calls.push_back("done");
        last_token = token;
    }
    void on_error(const std::string& message, const std::string& token) override {
        calls.push_back("error:" + message);
        last_token = token;
    }
};

bool feed(ClientStreamReader& reader, const std::string& data) {
    return reader.feed(data.data(), data.size());
}

std::string hello_stream(const std::string& rid) {
    return encode_frame(make_metadata_frame(rid, "ts", "m", "openai")) +
           encode_frame(make_content_frame(rid, 1, "Hel")) +
           encode_frame(make_content_frame(rid, 2, "lo!")) +
           encode_frame(make_done_frame(rid));
}

} // namespace

// ── Connection status ────────────────────────────────────────────

TEST_CASE("can_transition: allowed moves", "[stream_reader]") {
    using S = ConnectionStatus;
    REQUIRE(can_transition(S::Disconnected, S::Connecting));
    REQUIRE(can_transition(S::Connecting, S::Connected));
    REQUIRE(can_transition(S::Connecting, S::Error));
    REQUIRE(can_transition(S::Connecting, S::Disconnected));
    REQUIRE(can_transition(S::Connected, S::Disconnected));
    REQUIRE(can_transition(S::Connected, S::Error));
    REQUIRE(can_transition(S::Error, S::Connecting));
}

TEST_CASE("can_transition: forbidden moves", "[stream_reader]") {
    using S = ConnectionStatus;
    REQUIRE_FALSE(can_transition(S::Disconnected, S::Connected));
    REQUIRE_FALSE(can_transition(S::Disconnected, S::Error));
    REQUIRE_FALSE(can_transition(S::Connected, S::Connecting));
    REQUIRE_FALSE(can_transition(S::Error, S::Connected));
    REQUIRE_FALSE(can_transition(S::Error, S::Disconnected));
    REQUIRE_FALSE(can_transition(S::Connected, S::Connected));
}

TEST_CASE("connection_status_name", "[stream_reader]") {
    REQUIRE(std::string(connection_status_name(ConnectionStatus::Connecting)) == "connecting");
    REQUIRE(std::string(connection_status_name(ConnectionStatus::Error)) == "error");
}

// ── Frame dispatch ───────────────────────────────────────────────

TEST_CASE("ClientStreamReader: full reply in one chunk", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok-1");

    REQUIRE_FALSE(feed(reader, hello_stream("rid")));
    REQUIRE(reader.finished());
    REQUIRE(reader.request_id() == "rid");
    REQUIRE(target.calls == std::vector<std::string>{
        "metadata:rid", "content:Hel", "content:lo!", "done"});
    REQUIRE(target.last_token == "tok-1");
}

TEST_CASE("ClientStreamReader: byte-at-a-time delivery", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    std::string all = hello_stream("rid");
    for (char c : all) reader.feed(&c, 1);

    REQUIRE(reader.finished());
    REQUIRE(target.content == "Hello!");
    REQUIRE(target.calls.back() == "done");
}

TEST_CASE("ClientStreamReader: nothing after a terminal frame", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    std::string data = encode_frame(make_metadata_frame("rid", "ts", "m", "p")) +
                       encode_frame(make_error_frame("rid", "upstream failed")) +
                       encode_frame(make_content_frame("rid", 1, "late"));
    REQUIRE_FALSE(feed(reader, data));
    REQUIRE_FALSE(feed(reader, encode_frame(make_content_frame("rid", 2, "later"))));

    REQUIRE(target.calls == std::vector<std::string>{"metadata:rid", "error:upstream failed"});
}

TEST_CASE("ClientStreamReader: malformed records are dropped", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    REQUIRE(feed(reader, "data: {broken\n\n"));
    REQUIRE(feed(reader, "data: {\"type\":\"mystery\",\"data\":\"x\"}\n\n"));
    REQUIRE(feed(reader, encode_frame(make_content_frame("rid", 1, "ok"))));

    REQUIRE(reader.dropped() == 2);
    REQUIRE(target.content == "ok");
}

TEST_CASE("ClientStreamReader: frames of another request are dropped", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    feed(reader, encode_frame(make_metadata_frame("rid", "ts", "m", "p")));
    feed(reader, encode_frame(make_content_frame("other", 1, "stale")));
    feed(reader, encode_frame(make_done_frame("other")));
    feed(reader, encode_frame(make_content_frame("rid", 1, "fresh")));

    REQUIRE(reader.dropped() == 2);
    REQUIRE(target.content == "fresh");
    REQUIRE_FALSE(reader.finished());
}

TEST_CASE("ClientStreamReader: frames without an id are accepted", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    std::string data = encode_frame(make_metadata_frame("r1", "ts", "m", "p")) +
                       "data: {\"type\":\"content\",\"data\":\"Hello\"}\n\n" +
                       "data: {\"type\":\"done\",\"data\":\"\"}\n\n";
    REQUIRE_FALSE(feed(reader, data));

    REQUIRE(reader.finished());
    REQUIRE(reader.dropped() == 0);
    REQUIRE(target.calls == std::vector<std::string>{"metadata:r1", "content:Hello", "done"});
}

TEST_CASE("ClientStreamReader: error frame without an id ends the stream", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    feed(reader, encode_frame(make_metadata_frame("r1", "ts", "m", "p")));
    REQUIRE_FALSE(feed(reader, "data: {\"type\":\"error\",\"data\":\"boom\"}\n\n"));

    REQUIRE(reader.finished());
    REQUIRE(target.calls.back() == "error:boom");
}

TEST_CASE("ClientStreamReader: repeated metadata is ignored", "[stream_reader]") {
    RecordingTarget target;
    ClientStreamReader reader(target, "tok");

    feed(reader, encode_frame(make_metadata_frame("rid", "ts", "m", "p")));
    feed(reader, encode_frame(make_metadata_frame("rid2", "ts", "m", "p")));

    REQUIRE(reader.request_id() == "rid");
    REQUIRE(reader.dropped() == 1);
    REQUIRE(target.calls == std::vector<std::string>{"metadata:rid"});
}
