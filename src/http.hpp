#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

#ifdef __linux__
struct ssl_st;
#endif

namespace chatrelay {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = no response head was received
    std::string body;
    std::string error;      // transport failure description, empty otherwise
};

// Raw-chunk streaming callback: receives raw (de-chunked) body bytes.
// Return false to stop reading; the connection is closed.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Called once with the status code as soon as the response head is parsed,
// before any body byte. Return false to abort.
using StatusCallback = std::function<bool(long status)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    // POST and stream the response. A 2xx body is delivered to callback as it
    // arrives and HttpResponse::body stays empty; any other status collects the
    // body into HttpResponse::body instead. idle_timeout_seconds bounds the gap
    // between two received bytes. A transfer that dies before the body is
    // complete (reset, idle timeout, truncated chunked stream) sets error.
    virtual HttpResponse stream_post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     RawChunkCallback callback,
                                     long idle_timeout_seconds = 300,
                                     StatusCallback on_status = nullptr) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse stream_post(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             RawChunkCallback callback,
                             long idle_timeout_seconds = 300,
                             StatusCallback on_status = nullptr) override;
};
using PlatformHttpClient = SocketHttpClient;

// Set SNI and require the peer certificate to match host.
// Returns false when OpenSSL refuses the host name.
bool configure_tls_peer(ssl_st* ssl, const std::string& host);

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse stream_post(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             RawChunkCallback callback,
                             long idle_timeout_seconds = 300,
                             StatusCallback on_status = nullptr) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace chatrelay
