#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace chatrelay {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

struct StreamContext {
    CURL* curl = nullptr;
    const RawChunkCallback* callback = nullptr;
    const StatusCallback* on_status = nullptr;
    HttpResponse* response = nullptr;
    bool status_seen = false;
    bool stopped = false;
};

// The response code is known once the first body byte arrives, so the
// status callback fires lazily from here.
static size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->stopped) return 0;

    if (!ctx->status_seen) {
        ctx->status_seen = true;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->response->status_code);
        if (*ctx->on_status && !(*ctx->on_status)(ctx->response->status_code)) {
            ctx->stopped = true;
            return 0;
        }
    }

    long status = ctx->response->status_code;
    if (status < 200 || status >= 300) {
        ctx->response->body.append(ptr, total);
        return total;
    }

    if (!(*ctx->callback)(ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

// idle_timeout bounds the time without any received byte rather than the
// whole transfer, so long-running streams stay alive while tokens flow.
static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers, long idle_timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, 30L);
    if (idle_timeout > 0) {
        curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, idle_timeout);
    }
    apply_abort_hook(req.curl);
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res != CURLE_OK) response.error = curl_easy_strerror(res);
    return response;
}

HttpResponse CurlHttpClient::stream_post(const std::string& url,
                                          const std::string& body,
                                          const std::vector<Header>& headers,
                                          RawChunkCallback callback,
                                          long idle_timeout_seconds,
                                          StatusCallback on_status) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }
    setup_request(req, url, headers, idle_timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    StreamContext ctx;
    ctx.curl = req.curl;
    ctx.callback = &callback;
    ctx.on_status = &on_status;
    ctx.response = &response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    // A response without a body never reaches the write callback.
    if (!ctx.status_seen && response.status_code != 0 && on_status) {
        on_status(response.status_code);
    }
    if (res != CURLE_OK && !ctx.stopped) {
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace chatrelay
