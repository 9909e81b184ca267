#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chatrelay {

static constexpr size_t kMaxHeadBytes = 16384;

// ── HttpRequest ───────────────────────────────────────────────────────────────

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        int p = std::stoi(digits);
        if (p < 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// ── Response writing ──────────────────────────────────────────────────────────

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "OK";
    }
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

static std::string build_head(int status, const std::vector<Header>& headers) {
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + status_reason(status) + "\r\n";
    for (const auto& [name, value] : headers) {
        head += name + ": " + value + "\r\n";
    }
    return head;
}

static void send_http_response(int fd, int status, const std::string& content_type,
                               const std::string& body) {
    std::string resp = build_head(status, {{"Content-Type", content_type}}) +
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + body;
    send_all(fd, resp);
}

namespace {

// Writes straight to the client socket. Streams use chunked encoding, so
// the client can tell a finished stream from a dropped one.
class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    bool send(int status, const std::vector<Header>& headers,
              const std::string& body) override {
        if (!usable()) return false;
        head_sent_ = true;
        finished_ = true;
        std::string resp = build_head(status, headers);
        if (status != 204) resp += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        resp += "Connection: close\r\n\r\n";
        if (status != 204) resp += body;
        return transmit(resp);
    }

    bool begin_stream(int status, const std::vector<Header>& headers) override {
        if (!usable()) return false;
        head_sent_ = true;
        streaming_ = true;
        return transmit(build_head(status, headers) + "Transfer-Encoding: chunked\r\n\r\n");
    }

    bool write(const std::string& data) override {
        if (!streaming_ || finished_ || failed_) return false;
        if (data.empty()) return true;
        std::ostringstream chunk;
        chunk << std::hex << data.size() << "\r\n" << data << "\r\n";
        return transmit(chunk.str());
    }

    bool end_stream() override {
        if (!streaming_ || finished_ || failed_) return false;
        finished_ = true;
        return transmit("0\r\n\r\n");
    }

    bool head_sent() const override { return head_sent_; }

private:
    bool usable() const { return !head_sent_ && !failed_; }

    bool transmit(const std::string& data) {
        if (!send_all(fd_, data)) failed_ = true;
        return !failed_;
    }

    int fd_;
    bool head_sent_ = false;
    bool streaming_ = false;
    bool finished_ = false;
    bool failed_ = false;
};

} // namespace

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr,
                       uint32_t max_body,
                       uint32_t max_connections,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , max_connections_(max_connections == 0 ? 1 : max_connections)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); ::close(shutdown_pipe_[1]);
        shutdown_pipe_[0] = shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1)
        return fail("Invalid bind address: " + host);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0)
        return fail(std::string("bind failed: ") + std::strerror(errno));

    if (::listen(server_fd_, 64) != 0)
        return fail("listen failed");

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
        bound_port_ = ntohs(bound.sin_port);

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] Failed to signal shutdown: " << std::strerror(errno) << '\n';
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }

    std::unique_lock<std::mutex> lock(workers_mutex_);
    workers_cv_.wait(lock, [this] { return active_workers_ == 0; });
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv/send timeout
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(cfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            if (active_workers_ >= max_connections_) {
                send_http_response(cfd, 503, "application/json",
                                   R"({"error":"Server busy"})");
                ::close(cfd);
                continue;
            }
            ++active_workers_;
        }

        try {
            std::thread([this, cfd]() { handle_connection(cfd); }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[server] Failed to spawn worker: " << e.what() << '\n';
            send_http_response(cfd, 503, "application/json", R"({"error":"Server busy"})");
            ::close(cfd);
            std::lock_guard<std::mutex> lock(workers_mutex_);
            --active_workers_;
        }
    }
}

void HttpServer::handle_connection(int fd) {
    serve(fd);
    ::close(fd);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    --active_workers_;
    workers_cv_.notify_all();
}

void HttpServer::serve(int fd) {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > kMaxHeadBytes) {
            send_http_response(fd, 400, "text/plain", "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_http_response(fd, 400, "text/plain", "Malformed request line");
            return;
        }
        // Routing ignores the query string.
        req.path = pq.substr(0, pq.find('?'));
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read the body when one is announced.
    size_t content_len = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        if (cl.find_first_not_of("0123456789") != std::string::npos) {
            send_http_response(fd, 400, "text/plain", "Invalid Content-Length");
            return;
        }
        try {
            content_len = std::stoul(cl);
        } catch (const std::out_of_range&) {
            content_len = SIZE_MAX;
        }
    }

    if (content_len > max_body_) {
        send_http_response(fd, 413, "text/plain", "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    SocketResponseWriter writer(fd);
    try {
        handler_(req, writer);
    } catch (const std::exception& e) {
        std::cerr << "[server] " << req.method << " " << req.path
                  << " failed: " << e.what() << '\n';
        if (!writer.head_sent()) {
            writer.send(500, {{"Content-Type", "application/json"}},
                        R"({"error":"Internal server error"})");
        }
    }
}

} // namespace chatrelay
