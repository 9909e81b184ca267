#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace chatrelay {

// Throws "<display_name> API key not configured. Please set <env_var> in
// your environment." when api_key is empty.
void require_api_key(const std::string& api_key,
                     const std::string& display_name,
                     const std::string& env_var);

// Streaming chat-completions client for OpenAI and OpenAI-compatible APIs.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url = "",
                   const std::string& model = "",
                   long idle_timeout_seconds = 60);

    void chat_stream(const std::vector<ProviderMessage>& messages,
                     const std::string& model,
                     double temperature,
                     const StreamOpenCallback& on_open,
                     const TextDeltaCallback& on_delta) override;

    std::string provider_name() const override { return "openai"; }
    std::string default_model() const override { return model_; }

    const std::string& base_url() const { return base_url_; }

protected:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url, const std::string& model,
                   long idle_timeout_seconds,
                   const std::string& fallback_base_url,
                   const std::string& fallback_model);

    nlohmann::json build_request(const std::vector<ProviderMessage>& messages,
                                 const std::string& model,
                                 double temperature) const;
    std::vector<Header> build_headers() const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    long idle_timeout_seconds_;
};

} // namespace chatrelay
