#include "config.hpp"
#include "provider.hpp"
#include "http.hpp"
#include "http_server.hpp"
#include "relay_server.hpp"
#include "chat_session.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: chatrelay [serve|chat] [options]\n"
              << "\n"
              << "serve (default)        Run the streaming chat relay\n"
              << "  --listen HOST:PORT   Listen address (default: 127.0.0.1:3000)\n"
              << "  --provider NAME      Default provider (openai, qwen)\n"
              << "\n"
              << "chat                   Interactive terminal client for a relay\n"
              << "  --url URL            Relay endpoint (default: http://127.0.0.1:3000/api/chat)\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --provider NAME      Ask the relay for a specific provider\n"
              << "  --user ID            X-Internal-User-Id header\n"
              << "  --tenant ID          X-Tenant-Id header\n"
              << "  --origin URL         Origin header\n"
              << "\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands (chat):\n"
              << "  /retry               Resend the last failed message\n"
              << "  /clear               Clear conversation history\n"
              << "  /status              Show connection status and metrics\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  PROVIDER             Default provider (openai)\n"
              << "  OPENAI_API_KEY       API key for OpenAI (also OPENAI_API_URL, OPENAI_MODEL)\n"
              << "  QWEN_API_KEY         API key for Qwen (also QWEN_API_URL, QWEN_MODEL)\n"
              << "  ALLOWED_ORIGINS      Extra allowed origins, comma separated\n"
              << "  CHATRELAY_ENV        'production' requires identity headers\n"
              << "  CHATRELAY_LISTEN     Listen address\n"
              << "  CHATRELAY_CONFIG     Config file (default: ~/.chatrelay/config.json)\n"
              << "  PROMPT_TRACE         Log assembled prompts (1/true/yes)\n";
}

static int run_server(const chatrelay::Config& config) {
    chatrelay::PlatformHttpClient http_client;
    chatrelay::ProviderCache providers(config, http_client);
    chatrelay::EventBus bus;

    auto failures = chatrelay::subscribe_scoped<chatrelay::RelayCompletedEvent>(bus,
        [](const chatrelay::RelayCompletedEvent& ev) {
            if (!ev.error.empty() && ev.fragment_count > 0) {
                std::cerr << "[server] " << ev.request_id << " failed after "
                          << ev.fragment_count << " fragments\n";
            }
        });

    chatrelay::RelayServer relay(config, providers, &bus);
    chatrelay::HttpServer server(
        config.server.listen, config.server.max_body, config.server.max_connections,
        [&relay](const chatrelay::HttpRequest& req, chatrelay::ResponseWriter& out) {
            relay.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[server] Listening on " << config.server.listen
              << " (provider: " << config.provider << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

static void print_status(const chatrelay::ChatSession& session) {
    auto metrics = session.metrics();
    std::cout << "Status: " << chatrelay::connection_status_name(session.status()) << "\n"
              << "Messages: " << session.messages().size() << "\n"
              << "Retries: " << session.retry_count() << "\n";
    if (!session.error().empty()) {
        std::cout << "Last error: " << session.error() << "\n";
    }
    if (!metrics.request_id.empty()) {
        std::cout << "Request: " << metrics.request_id
                  << " (" << metrics.message_count << " fragments, "
                  << metrics.error_count << " errors)\n";
    }
}

static int run_chat(const chatrelay::SessionOptions& options,
                    const nlohmann::json& payload,
                    const std::string& message) {
    chatrelay::PlatformHttpClient http_client;
    chatrelay::EventBus bus;
    chatrelay::ChatSession session(http_client, options, &bus);

    std::vector<chatrelay::ScopedSubscription> subs;
    subs.push_back(chatrelay::subscribe_scoped<chatrelay::ChatDeltaEvent>(bus,
        [](const chatrelay::ChatDeltaEvent& ev) {
            std::cout << ev.delta << std::flush;
        }));
    subs.push_back(chatrelay::subscribe_scoped<chatrelay::ChatErrorEvent>(bus,
        [](const chatrelay::ChatErrorEvent& ev) {
            std::cout << "\n[error] " << ev.message << std::flush;
        }));
    subs.push_back(chatrelay::subscribe_scoped<chatrelay::RetryExhaustedEvent>(bus,
        [](const chatrelay::RetryExhaustedEvent& ev) {
            std::cout << "Maximum retry attempts reached (" << ev.attempts << ")\n";
        }));

    if (!message.empty()) {
        session.send_message(message, payload);
        std::cout << "\n";
        return session.status() == chatrelay::ConnectionStatus::Error ? 1 : 0;
    }

    std::cout << "chatrelay client\n"
              << "Relay: " << options.api_url << "\n"
              << "Type /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "you> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/retry") {
                switch (session.retry()) {
                    case chatrelay::RetryResult::Dispatched:
                        std::cout << "\n\n";
                        break;
                    case chatrelay::RetryResult::NothingToRetry:
                        std::cout << "Nothing to retry.\n";
                        break;
                    case chatrelay::RetryResult::Busy:
                        std::cout << "A request is still running.\n";
                        break;
                    case chatrelay::RetryResult::Exhausted:
                        break;
                }
            } else if (line == "/clear") {
                if (session.clear()) std::cout << "History cleared.\n";
            } else if (line == "/status") {
                print_status(session);
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        std::cout << "\n";
        session.send_message(line, payload);
        std::cout << "\n\n";
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string mode = "serve";
    int first = 1;
    if (argc > 1 && (std::strcmp(argv[1], "serve") == 0 || std::strcmp(argv[1], "chat") == 0)) {
        mode = argv[1];
        first = 2;
    }

    std::string listen;
    std::string provider_name;
    std::string url;
    std::string message;
    std::string user_id;
    std::string tenant_id;
    std::string origin;

    for (int i = first; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user_id = argv[++i];
        } else if (std::strcmp(argv[i], "--tenant") == 0 && i + 1 < argc) {
            tenant_id = argv[++i];
        } else if (std::strcmp(argv[i], "--origin") == 0 && i + 1 < argc) {
            origin = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    chatrelay::http_init();
    auto config = chatrelay::Config::load();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    chatrelay::http_set_abort_flag(&g_shutdown);

    int rc = 0;
    if (mode == "serve") {
        if (!listen.empty()) config.server.listen = listen;
        if (!provider_name.empty()) config.provider = provider_name;
        rc = run_server(config);
    } else {
        chatrelay::SessionOptions options;
        options.api_url = url.empty() ? config.client.api_url : url;
        options.max_retries = config.client.max_retries;
        options.idle_timeout_seconds = static_cast<long>(config.idle_timeout_seconds);
        if (!user_id.empty()) options.headers.emplace_back("X-Internal-User-Id", user_id);
        if (!tenant_id.empty()) options.headers.emplace_back("X-Tenant-Id", tenant_id);
        if (!origin.empty()) options.headers.emplace_back("Origin", origin);

        nlohmann::json payload = nlohmann::json::object();
        if (!provider_name.empty()) payload["provider"] = provider_name;
        rc = run_chat(options, payload, message);
    }

    chatrelay::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
