#include "relay_server.hpp"
#include "event.hpp"
#include "frame.hpp"
#include "plugin.hpp"
#include "prompt.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace chatrelay {

static const char* const kBaseOrigin = "https://intranet.bank.local";
static const char* const kInvalidRequest = "Invalid request: missing messages or content";

std::optional<Identity> resolve_identity(const HttpRequest& req,
                                         const AdmissionConfig& admission) {
    std::string user_id = req.header("x-internal-user-id");
    std::string tenant_id = req.header("x-tenant-id");

    if (!admission.production) {
        if (user_id.empty()) user_id = admission.default_user_id;
        if (tenant_id.empty()) tenant_id = admission.default_tenant_id;
    }
    if (user_id.empty() || tenant_id.empty()) return std::nullopt;
    return Identity{user_id, tenant_id};
}

std::vector<std::string> build_allowed_origins(const AdmissionConfig& admission) {
    std::vector<std::string> candidates{kBaseOrigin};
    for (const auto& o : admission.allowed_origins) {
        std::string origin = trim(o);
        if (!origin.empty()) candidates.push_back(origin);
    }
    if (!admission.production) {
        candidates.insert(candidates.end(), {
            "http://localhost:3000", "http://127.0.0.1:3000",
            "http://localhost:3001", "http://127.0.0.1:3001"
        });
    }

    std::vector<std::string> result;
    for (auto& origin : candidates) {
        if (std::find(result.begin(), result.end(), origin) == result.end())
            result.push_back(std::move(origin));
    }
    return result;
}

RequestContext::RequestContext()
    : request_id(generate_uuid()), start(std::chrono::steady_clock::now()) {}

uint64_t RequestContext::elapsed_ms() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

json metrics_record(const RequestContext& ctx) {
    return {
        {"type", "performance_metrics"},
        {"requestId", ctx.request_id},
        {"duration", ctx.elapsed_ms()},
        {"messageCount", ctx.fragment_count},
        {"errorCount", ctx.error_count},
        {"error", ctx.error.empty() ? json(nullptr) : json(ctx.error)},
        {"timestamp", timestamp_now()}
    };
}

RelayServer::RelayServer(const Config& config, ProviderCache& providers, EventBus* bus)
    : config_(config), providers_(providers), bus_(bus),
      allowed_origins_(build_allowed_origins(config.admission)) {
    std::string name = normalize_provider_name(config.provider);
    if (!name.empty() && !PluginRegistry::instance().has_provider(name)) {
        throw std::invalid_argument("Unknown default provider: " + trim(config.provider));
    }
}

void RelayServer::handle(const HttpRequest& req, ResponseWriter& out) {
    if (req.path == "/health") {
        if (req.method == "GET") {
            out.send(200, {{"Content-Type", "text/plain"}}, "ok");
        } else {
            out.send(405, {{"Content-Type", "application/json"}, {"Allow", "GET"}},
                     R"({"error":"Method not allowed"})");
        }
        return;
    }

    if (req.path != "/api/chat") {
        out.send(404, {{"Content-Type", "application/json"}}, R"({"error":"Not found"})");
        return;
    }

    if (req.method == "POST") {
        handle_chat(req, out);
    } else if (req.method == "OPTIONS") {
        handle_preflight(req, out);
    } else {
        auto headers = cors_headers(allowed_origins_.front());
        headers.emplace_back("Content-Type", "application/json");
        headers.emplace_back("Allow", "POST, OPTIONS");
        out.send(405, headers, R"({"error":"Method not allowed"})");
    }
}

std::vector<Header> RelayServer::cors_headers(const std::string& origin) const {
    return {
        {"Access-Control-Allow-Origin", origin},
        {"Access-Control-Allow-Methods", "POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, X-Internal-User-Id, X-Tenant-Id"},
        {"Vary", "Origin"}
    };
}

void RelayServer::send_json(ResponseWriter& out, int status, const json& body,
                            const std::string& origin) const {
    auto headers = cors_headers(origin);
    headers.emplace_back("Content-Type", "application/json");
    if (!out.send(status, headers, body.dump(-1, ' ', false, json::error_handler_t::replace))) {
        std::cerr << "[relay] Client went away before the " << status << " response\n";
    }
}

bool RelayServer::admit_origin(const HttpRequest& req, ResponseWriter& out,
                               std::string& effective_origin) const {
    std::string origin = req.header("origin");
    if (origin.empty()) {
        effective_origin = allowed_origins_.front();
        return true;
    }
    if (std::find(allowed_origins_.begin(), allowed_origins_.end(), origin) ==
        allowed_origins_.end()) {
        send_json(out, 403, {{"error", "Origin not allowed."}}, allowed_origins_.front());
        return false;
    }
    effective_origin = origin;
    return true;
}

void RelayServer::handle_preflight(const HttpRequest& req, ResponseWriter& out) {
    std::string origin;
    if (!admit_origin(req, out, origin)) return;
    out.send(204, cors_headers(origin), "");
}

void RelayServer::report(const RequestContext& ctx) const {
    std::cerr << "[relay] " << metrics_record(ctx).dump(-1, ' ', false,
                                                         json::error_handler_t::replace)
              << '\n';
    if (bus_) {
        RelayCompletedEvent ev;
        ev.request_id = ctx.request_id;
        ev.provider = ctx.provider;
        ev.duration_ms = ctx.elapsed_ms();
        ev.fragment_count = ctx.fragment_count;
        ev.error_count = ctx.error_count;
        ev.error = ctx.error;
        bus_->publish(ev);
    }
}

// Validates the conversation and fills `conversation`. Returns false when
// the request must be rejected with kInvalidRequest.
static bool parse_conversation(const json& body, std::vector<ProviderMessage>& conversation) {
    if (!body.contains("messages") || !body["messages"].is_array() || body["messages"].empty())
        return false;

    for (const auto& m : body["messages"]) {
        if (!m.is_object()) return false;
        std::string role_name = "user";
        if (m.contains("role")) {
            if (!m["role"].is_string()) return false;
            role_name = m["role"].get<std::string>();
        }
        auto role = role_from_string(role_name);
        if (!role) return false;

        std::string content;
        if (m.contains("content") && !m["content"].is_null()) {
            if (!m["content"].is_string()) return false;
            content = m["content"].get<std::string>();
        }
        conversation.push_back({*role, std::move(content)});
    }
    return !trim(conversation.back().content).empty();
}

void RelayServer::handle_chat(const HttpRequest& req, ResponseWriter& out) {
    std::string origin;
    if (!admit_origin(req, out, origin)) return;

    auto identity = resolve_identity(req, config_.admission);
    if (!identity) {
        send_json(out, 401, {{"error", "Missing authentication context."}}, origin);
        return;
    }

    RequestContext ctx;

    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        ctx.fail("Invalid JSON body");
        send_json(out, 400, {{"error", ctx.error}}, origin);
        report(ctx);
        return;
    }

    std::vector<ProviderMessage> conversation;
    if (!parse_conversation(body, conversation)) {
        ctx.fail(kInvalidRequest);
        send_json(out, 400, {{"error", kInvalidRequest}}, origin);
        report(ctx);
        return;
    }

    std::string question = conversation.back().content;
    conversation.pop_back();
    auto messages = build_provider_messages(question, format_history(conversation),
                                            kChatInstructions);
    trace_prompt(config_.prompt.trace, "chat.prompt", ctx.request_id, messages,
                 config_.prompt.trace_preview_length);

    std::string requested;
    if (body.contains("provider") && body["provider"].is_string())
        requested = body["provider"].get<std::string>();
    try {
        ctx.provider = resolve_provider(requested, config_.provider);
    } catch (const std::invalid_argument& e) {
        ctx.fail(e.what());
        send_json(out, 400, {{"error", ctx.error}}, origin);
        report(ctx);
        return;
    }

    std::cerr << "[relay] " << ctx.request_id << " user=" << identity->user_id
              << " tenant=" << identity->tenant_id << " provider=" << ctx.provider << '\n';

    bool opened = false;
    bool client_gone = false;
    try {
        std::shared_ptr<Provider> provider = providers_.get(ctx.provider);
        std::string model = provider->default_model();

        auto headers = cors_headers(origin);
        headers.insert(headers.begin(), {
            {"Content-Type", "text/event-stream"},
            {"Cache-Control", "no-cache"},
            {"Connection", "keep-alive"},
            {"X-Accel-Buffering", "no"}
        });

        provider->chat_stream(messages, model, config_.temperature,
            [&]() -> bool {
                opened = true;
                Frame meta = make_metadata_frame(ctx.request_id, timestamp_now(),
                                                 model, ctx.provider);
                if (!out.begin_stream(200, headers) || !out.write(encode_frame(meta))) {
                    client_gone = true;
                    return false;
                }
                return true;
            },
            [&](const std::string& text) -> bool {
                ++ctx.fragment_count;
                Frame frame = make_content_frame(ctx.request_id, ctx.fragment_count, text);
                if (!out.write(encode_frame(frame))) {
                    client_gone = true;
                    return false;
                }
                return true;
            });
    } catch (const std::exception& e) {
        ctx.fail(e.what());
        if (!opened) {
            send_json(out, 500, {{"error", ctx.error}, {"requestId", ctx.request_id}}, origin);
        } else if (!client_gone) {
            if (!out.write(encode_frame(make_error_frame(ctx.request_id, ctx.error))) ||
                !out.end_stream()) {
                std::cerr << "[relay] " << ctx.request_id
                          << " client went away before the error frame\n";
            }
        }
        report(ctx);
        return;
    }

    if (client_gone) {
        ctx.fail("Client disconnected");
    } else if (!opened) {
        ctx.fail("Upstream stream closed before opening");
        send_json(out, 500, {{"error", ctx.error}, {"requestId", ctx.request_id}}, origin);
    } else if (!out.write(encode_frame(make_done_frame(ctx.request_id))) || !out.end_stream()) {
        ctx.fail("Client disconnected");
    }
    report(ctx);
}

} // namespace chatrelay
