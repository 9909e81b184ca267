#pragma once
#include "http_server.hpp"
#include <string>
#include <vector>

namespace chatrelay {

// In-memory ResponseWriter. fail_on_write = N makes the Nth write() (1-based)
// and everything after it fail, as if the peer disconnected.
class RecordingWriter : public ResponseWriter {
public:
    int status = 0;
    std::vector<Header> headers;
    std::string body;
    std::vector<std::string> chunks;
    bool streaming = false;
    bool ended = false;
    int writes = 0;
    int fail_on_write = 0;

    bool send(int s, const std::vector<Header>& h, const std::string& b) override {
        if (head_) return false;
        head_ = true;
        status = s;
        headers = h;
        body = b;
        return true;
    }

    bool begin_stream(int s, const std::vector<Header>& h) override {
        if (head_) return false;
        head_ = true;
        streaming = true;
        status = s;
        headers = h;
        return true;
    }

    bool write(const std::string& data) override {
        ++writes;
        if (fail_on_write > 0 && writes >= fail_on_write) return false;
        chunks.push_back(data);
        return true;
    }

    bool end_stream() override {
        if (fail_on_write > 0 && writes >= fail_on_write) return false;
        ended = true;
        return true;
    }

    bool head_sent() const override { return head_; }

    std::string header(const std::string& name) const {
        for (const auto& [k, v] : headers) {
            if (k == name) return v;
        }
        return "";
    }

private:
    bool head_ = false;
};

} // namespace chatrelay
