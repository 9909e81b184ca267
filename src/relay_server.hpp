#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "http_server.hpp"
#include "provider.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

struct Identity {
    std::string user_id;
    std::string tenant_id;
};

// Caller identity from X-Internal-User-Id / X-Tenant-Id. Outside production
// missing values fall back to the configured defaults; in production both
// headers are required. nullopt = unauthenticated.
std::optional<Identity> resolve_identity(const HttpRequest& req,
                                         const AdmissionConfig& admission);

// https://intranet.bank.local, then configured origins, then (outside
// production) the local dev origins. Duplicates removed, order kept.
std::vector<std::string> build_allowed_origins(const AdmissionConfig& admission);

// Per-request bookkeeping, created when a request passed admission.
struct RequestContext {
    std::string request_id;
    std::chrono::steady_clock::time_point start;
    std::string provider;
    size_t fragment_count = 0;
    size_t error_count = 0;
    std::string error;

    RequestContext();

    uint64_t elapsed_ms() const;

    void fail(const std::string& message) {
        ++error_count;
        error = message;
    }
};

// {"type":"performance_metrics", ...} record for one request
nlohmann::json metrics_record(const RequestContext& ctx);

// Request controller for the chat relay endpoint.
class RelayServer {
public:
    // Throws std::invalid_argument when config.provider names no registered provider.
    RelayServer(const Config& config, ProviderCache& providers, EventBus* bus = nullptr);

    // Route one request: /api/chat (POST, OPTIONS) and /health (GET).
    void handle(const HttpRequest& req, ResponseWriter& out);

    const std::vector<std::string>& allowed_origins() const { return allowed_origins_; }

private:
    void handle_chat(const HttpRequest& req, ResponseWriter& out);
    void handle_preflight(const HttpRequest& req, ResponseWriter& out);

    // Returns false (and answers 403) for a non-empty origin outside the
    // allow-list; otherwise sets the origin to echo back.
    bool admit_origin(const HttpRequest& req, ResponseWriter& out,
                      std::string& effective_origin) const;

    std::vector<Header> cors_headers(const std::string& origin) const;
    void send_json(ResponseWriter& out, int status, const nlohmann::json& body,
                   const std::string& origin) const;
    void report(const RequestContext& ctx) const;

    const Config& config_;
    ProviderCache& providers_;
    EventBus* bus_;
    std::vector<std::string> allowed_origins_;
};

} // namespace chatrelay
