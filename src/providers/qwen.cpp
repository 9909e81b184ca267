#include "qwen.hpp"
#include "../plugin.hpp"

static chatrelay::ProviderRegistrar reg_qwen("qwen",
    [](const chatrelay::ProviderEntry& entry, chatrelay::HttpClient& http,
       long idle_timeout_seconds) {
        chatrelay::require_api_key(entry.api_key, "Qwen", "QWEN_API_KEY");
        return std::make_unique<chatrelay::QwenProvider>(
            entry.api_key, http, entry.base_url, entry.model, idle_timeout_seconds);
    },
    {"dashscope", "tongyi"});

namespace chatrelay {

QwenProvider::QwenProvider(const std::string& api_key, HttpClient& http,
                           const std::string& base_url,
                           const std::string& model,
                           long idle_timeout_seconds)
    : OpenAIProvider(api_key, http, base_url, model, idle_timeout_seconds,
                     "https://dashscope.aliyuncs.com/compatible-mode/v1", "qwen-max") {}

} // namespace chatrelay
