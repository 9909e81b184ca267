#include <catch2/catch.hpp>
#include "http_server.hpp"
#include "relay_server.hpp"
#include "chat_session.hpp"
#include "stub_provider.hpp"
#include "plugin.hpp"
#include "http.hpp"
#include <nlohmann/json.hpp>

#ifdef __linux__
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#endif

using namespace chatrelay;

// ── parse_listen_addr ─────────────────────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[http_server]") {
    std::string host; uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:8080", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8080);
}

TEST_CASE("parse_listen_addr: port 0 asks for an ephemeral port", "[http_server]") {
    std::string host; uint16_t port = 1;
    REQUIRE(parse_listen_addr("127.0.0.1:0", host, port));
    REQUIRE(port == 0);
}

TEST_CASE("parse_listen_addr: malformed addresses", "[http_server]") {
    std::string host; uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:notaport", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:-1", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:70000", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8080", host, port));
    REQUIRE_FALSE(parse_listen_addr("", host, port));
}

// ── HttpRequest ───────────────────────────────────────────────────────────────

TEST_CASE("HttpRequest: header lookup is case-insensitive", "[http_server]") {
    HttpRequest req;
    req.headers["x-tenant-id"] = "bank";
    REQUIRE(req.header("X-Tenant-Id") == "bank");
    REQUIRE(req.header("missing").empty());
}

TEST_CASE("status_reason: known codes", "[http_server]") {
    REQUIRE(std::string(status_reason(204)) == "No Content");
    REQUIRE(std::string(status_reason(413)) == "Payload Too Large");
    REQUIRE(std::string(status_reason(503)) == "Service Unavailable");
}

TEST_CASE("HttpServer: invalid listen address fails to start", "[http_server]") {
    HttpServer server("nowhere", 1024, 4, [](const HttpRequest&, ResponseWriter&) {});
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid listen address") != std::string::npos);
}

// ── Loopback ──────────────────────────────────────────────────────────────────

#ifdef __linux__

namespace {

// HttpServer on an ephemeral loopback port serving a RelayServer backed by a
// stub provider registered as "_loopback_stub".
struct LoopbackRelay {
    StubProvider stub;
    Config config;
    SocketHttpClient upstream;  // never used by the stub
    std::unique_ptr<ProviderCache> cache;
    std::unique_ptr<RelayServer> relay;
    std::unique_ptr<HttpServer> server;

    LoopbackRelay() {
        config.provider = "_loopback_stub";
        config.server.max_body = 4096;
        PluginRegistry::instance().register_provider("_loopback_stub",
            [this](const ProviderEntry&, HttpClient&, long) {
                return std::make_unique<Forwarder>(stub);
            });
        cache = std::make_unique<ProviderCache>(config, upstream);
        relay = std::make_unique<RelayServer>(config, *cache);
        server = std::make_unique<HttpServer>("127.0.0.1:0", config.server.max_body, 8,
            [this](const HttpRequest& req, ResponseWriter& out) { relay->handle(req, out); });
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(server->port()) + path;
    }

    class Forwarder : public Provider {
    public:
        explicit Forwarder(StubProvider& t) : t_(t) {}
        void chat_stream(const std::vector<ProviderMessage>& m, const std::string& model,
                         double temperature, const StreamOpenCallback& on_open,
                         const TextDeltaCallback& on_delta) override {
            t_.chat_stream(m, model, temperature, on_open, on_delta);
        }
        std::string provider_name() const override { return t_.provider_name(); }
        std::string default_model() const override { return t_.default_model(); }
    private:
        StubProvider& t_;
    };
};

} // namespace

TEST_CASE("configure_tls_peer: certificate must match the host", "[http_server]") {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    REQUIRE(ctx != nullptr);
    SSL* ssl = SSL_new(ctx);
    REQUIRE(ssl != nullptr);

    REQUIRE(configure_tls_peer(ssl, "api.openai.com"));
    const char* pinned = X509_VERIFY_PARAM_get0_host(SSL_get0_param(ssl), 0);
    REQUIRE(pinned != nullptr);
    REQUIRE(std::string(pinned) == "api.openai.com");
    REQUIRE(std::string(SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name)) ==
            "api.openai.com");

    SSL_free(ssl);
    SSL_CTX_free(ctx);
}

TEST_CASE("HttpServer: health check over loopback", "[http_server]") {
    LoopbackRelay r;
    std::string error;
    REQUIRE(r.server->start(error));
    REQUIRE(r.server->port() != 0);

    SocketHttpClient client;
    auto resp = client.get(r.url("/health"), {}, 5);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "ok");

    auto with_query = client.get(r.url("/health?verbose=1"), {}, 5);
    REQUIRE(with_query.status_code == 200);

    auto missing = client.get(r.url("/nope"), {}, 5);
    REQUIRE(missing.status_code == 404);
}

TEST_CASE("HttpServer: chat session streams a reply end to end", "[http_server]") {
    LoopbackRelay r;
    r.stub.fragments = {"Hel", "lo", "!"};
    std::string error;
    REQUIRE(r.server->start(error));

    SocketHttpClient client;
    SessionOptions options;
    options.api_url = r.url("/api/chat");
    options.headers = {{"Origin", "http://localhost:3000"}};
    ChatSession session(client, options);

    REQUIRE(session.send_message("Hi"));
    auto msgs = session.messages();
    REQUIRE(msgs.size() == 2);
    REQUIRE(msgs[1].content == "Hello!");
    REQUIRE_FALSE(msgs[1].is_error());
    REQUIRE(session.status() == ConnectionStatus::Disconnected);
    REQUIRE(session.metrics().message_count == 3);
}

TEST_CASE("HttpServer: rejected origin reaches the session as an error", "[http_server]") {
    LoopbackRelay r;
    std::string error;
    REQUIRE(r.server->start(error));

    SocketHttpClient client;
    SessionOptions options;
    options.api_url = r.url("/api/chat");
    options.headers = {{"Origin", "https://evil.example"}};
    ChatSession session(client, options);

    session.send_message("Hi");
    REQUIRE(session.status() == ConnectionStatus::Error);
    REQUIRE(session.error() == "Origin not allowed.");
    REQUIRE(r.stub.calls == 0);
}

TEST_CASE("HttpServer: upstream failure mid-stream reaches the session", "[http_server]") {
    LoopbackRelay r;
    r.stub.fragments = {"partial"};
    r.stub.throw_after = "upstream reset";
    std::string error;
    REQUIRE(r.server->start(error));

    SocketHttpClient client;
    SessionOptions options;
    options.api_url = r.url("/api/chat");
    ChatSession session(client, options);

    session.send_message("Hi");
    auto msgs = session.messages();
    REQUIRE(msgs.back().content == "partial");
    REQUIRE(msgs.back().is_error());
    REQUIRE(session.error() == "upstream reset");
}

#endif
