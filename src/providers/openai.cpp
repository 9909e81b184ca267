#include "openai.hpp"
#include "sse.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static chatrelay::ProviderRegistrar reg_openai("openai",
    [](const chatrelay::ProviderEntry& entry, chatrelay::HttpClient& http,
       long idle_timeout_seconds) {
        chatrelay::require_api_key(entry.api_key, "OpenAI", "OPENAI_API_KEY");
        return std::make_unique<chatrelay::OpenAIProvider>(
            entry.api_key, http, entry.base_url, entry.model, idle_timeout_seconds);
    });

using json = nlohmann::json;

namespace chatrelay {

void require_api_key(const std::string& api_key,
                     const std::string& display_name,
                     const std::string& env_var) {
    if (trim(api_key).empty()) {
        throw std::runtime_error(display_name + " API key not configured. Please set " +
                                 env_var + " in your environment.");
    }
}

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url,
                               const std::string& model,
                               long idle_timeout_seconds)
    : OpenAIProvider(api_key, http, base_url, model, idle_timeout_seconds,
                     "https://api.openai.com/v1", "gpt-4o-mini") {}

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url,
                               const std::string& model,
                               long idle_timeout_seconds,
                               const std::string& fallback_base_url,
                               const std::string& fallback_model)
    : api_key_(api_key), http_(http),
      base_url_(strip_trailing_slashes(base_url.empty() ? fallback_base_url : base_url)),
      model_(model.empty() ? fallback_model : model),
      idle_timeout_seconds_(idle_timeout_seconds) {}

json OpenAIProvider::build_request(const std::vector<ProviderMessage>& messages,
                                    const std::string& model,
                                    double temperature) const {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;
    request["stream"] = true;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };
}

static std::string error_payload_message(const json& err) {
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    return err.dump();
}

void OpenAIProvider::chat_stream(const std::vector<ProviderMessage>& messages,
                                 const std::string& model,
                                 double temperature,
                                 const StreamOpenCallback& on_open,
                                 const TextDeltaCallback& on_delta) {
    const std::string& use_model = model.empty() ? model_ : model;
    json request = build_request(messages, use_model, temperature);
    std::string url = base_url_ + "/chat/completions";

    bool finished = false;      // [DONE] or a finish_reason was seen
    bool stopped = false;       // a caller callback asked to stop
    std::string stream_error;
    SSEParser parser;

    auto http_response = http_.stream_post(
        url, request.dump(), build_headers(),
        [&](const char* data, size_t len) -> bool {
            return parser.feed(std::string(data, len), [&](const SSEEvent& sse) -> bool {
                if (sse.data.empty()) return true;
                if (sse.data == "[DONE]") {
                    finished = true;
                    return false;
                }

                json payload;
                try {
                    payload = json::parse(sse.data);
                } catch (const json::parse_error&) {
                    // keep-alive comments and partial vendor records
                    return true;
                }

                if (payload.contains("error") && !payload["error"].is_null()) {
                    stream_error = error_payload_message(payload["error"]);
                    return false;
                }

                if (!payload.contains("choices") || !payload["choices"].is_array() ||
                    payload["choices"].empty()) {
                    return true;
                }
                const auto& choice = payload["choices"][0];
                if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
                    finished = true;
                }
                if (choice.contains("delta") && choice["delta"].is_object()) {
                    const auto& delta = choice["delta"];
                    if (delta.contains("content") && delta["content"].is_string()) {
                        std::string text = delta["content"].get<std::string>();
                        if (!text.empty() && !on_delta(text)) {
                            stopped = true;
                            return false;
                        }
                    }
                }
                return true;
            });
        },
        idle_timeout_seconds_,
        [&](long status) -> bool {
            if (status < 200 || status >= 300) return true;
            if (!on_open()) {
                stopped = true;
                return false;
            }
            return true;
        });

    if (stopped) return;

    if (!stream_error.empty()) {
        throw std::runtime_error(provider_name() + " stream error: " + stream_error);
    }

    if (http_response.status_code != 0 &&
        (http_response.status_code < 200 || http_response.status_code >= 300)) {
        throw std::runtime_error(provider_name() + " API error (HTTP " +
            std::to_string(http_response.status_code) + "): " + http_response.body);
    }

    if (finished) return;

    if (!http_response.error.empty()) {
        throw std::runtime_error(provider_name() + " request failed: " + http_response.error);
    }
    throw std::runtime_error(provider_name() + " stream ended before completion");
}

} // namespace chatrelay
