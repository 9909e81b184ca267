#pragma once
#include "http.hpp"
#include <string>
#include <vector>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace chatrelay {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // e.g. "POST"
    std::string path;     // e.g. "/api/chat", query string removed
    std::map<std::string, std::string> headers;   // header names lowercased
    std::string body;

    // Header value by case-insensitive name, or "" if absent.
    std::string header(const std::string& name) const;
};

// Response side of one request. A handler either sends a complete response
// with send(), or opens a chunked stream with begin_stream() and feeds it
// with write() until end_stream(). Every call returns false once the peer
// is gone; nothing is written after that.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual bool send(int status, const std::vector<Header>& headers,
                      const std::string& body) = 0;

    virtual bool begin_stream(int status, const std::vector<Header>& headers) = 0;

    // Write one chunk and flush it.
    virtual bool write(const std::string& data) = 0;

    virtual bool end_stream() = 0;

    // True once a response head went out.
    virtual bool head_sent() const = 0;
};

// Reason phrase for the status codes this server produces.
const char* status_reason(int status);

// Minimal threaded HTTP/1.1 server: one request per connection, each
// connection served on its own worker thread. The accept loop runs in a
// background thread.
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    // listen_addr:     "host:port", e.g. "127.0.0.1:3000" (port 0 = ephemeral)
    // max_body:        maximum request body size in bytes; larger bodies get 413
    // max_connections: concurrent workers; connections beyond that get 503
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t max_connections,
               Handler handler);
    ~HttpServer();

    // Bind and start the accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-flight workers to finish.
    void stop();

    // Bound port (useful with port 0); 0 before start().
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd);
    void serve(int client_fd);

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    size_t active_workers_ = 0;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace chatrelay
