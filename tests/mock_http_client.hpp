#pragma once
#include "http.hpp"
#include <functional>
#include <string>
#include <vector>

namespace chatrelay {

// One scripted reply to stream_post().
struct ScriptedStream {
    long status = 200;                   // 0 = no response at all
    std::vector<std::string> chunks;     // body pieces for a 2xx reply
    std::string body;                    // collected body for a non-2xx reply
    std::string error;                   // transport error reported after the chunks
};

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    ScriptedStream next_stream;
    std::vector<ScriptedStream> stream_queue;

    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    long last_idle_timeout = 0;
    std::vector<std::string> bodies;     // every stream_post body, in order
    int call_count = 0;

    size_t chunks_delivered = 0;         // across all calls
    bool stopped_early = false;          // a callback asked to stop

    // Runs before chunk `index` of the current stream is delivered.
    std::function<void(size_t index)> before_chunk;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long /*timeout_seconds*/) override {
        call_count++;
        last_url = url;
        last_headers = headers;
        return next_response;
    }

    HttpResponse stream_post(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             RawChunkCallback callback,
                             long idle_timeout_seconds,
                             StatusCallback on_status) override {
        call_count++;
        last_url = url;
        last_body = body;
        last_headers = headers;
        last_idle_timeout = idle_timeout_seconds;
        bodies.push_back(body);
        stopped_early = false;

        ScriptedStream script = next_stream;
        if (!stream_queue.empty()) {
            script = stream_queue.front();
            stream_queue.erase(stream_queue.begin());
        }

        HttpResponse resp;
        resp.status_code = script.status;
        if (script.status == 0) {
            resp.error = script.error.empty() ? "Connection refused" : script.error;
            return resp;
        }
        if (on_status && !on_status(script.status)) {
            stopped_early = true;
            return resp;
        }
        if (script.status < 200 || script.status >= 300) {
            resp.body = script.body;
            return resp;
        }
        for (size_t i = 0; i < script.chunks.size(); ++i) {
            if (before_chunk) before_chunk(i);
            chunks_delivered++;
            const auto& chunk = script.chunks[i];
            if (!callback(chunk.data(), chunk.size())) {
                stopped_early = true;
                return resp;
            }
        }
        resp.error = script.error;
        return resp;
    }

    std::string header_value(const std::string& name) const {
        for (const auto& [k, v] : last_headers) {
            if (k == name) return v;
        }
        return "";
    }
};

} // namespace chatrelay
