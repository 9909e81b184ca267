#pragma once
#include "openai.hpp"
#include <string>

namespace chatrelay {

// Qwen through DashScope's OpenAI-compatible endpoint
class QwenProvider : public OpenAIProvider {
public:
    QwenProvider(const std::string& api_key, HttpClient& http,
                 const std::string& base_url = "",
                 const std::string& model = "",
                 long idle_timeout_seconds = 60);

    std::string provider_name() const override { return "qwen"; }
};

} // namespace chatrelay
