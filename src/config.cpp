#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chatrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "openai"},
        {"temperature", 0.4},
        {"idle_timeout_seconds", 60},
        {"providers", {
            {"openai", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}},
            {"qwen", {{"api_key", ""}, {"base_url", ""}, {"model", ""}}}
        }},
        {"server", {
            {"listen", "127.0.0.1:3000"},
            {"max_body", 1048576},
            {"max_connections", 64}
        }},
        {"admission", {
            {"production", false},
            {"allowed_origins", nlohmann::json::array()},
            {"default_user_id", "dev-user"},
            {"default_tenant_id", "dev-tenant"}
        }},
        {"prompt", {
            {"trace", false},
            {"trace_preview_length", 2000}
        }},
        {"client", {
            {"api_url", "http://127.0.0.1:3000/api/chat"},
            {"max_retries", 3}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& input) {
    Config cfg;
    nlohmann::json j = input.is_object()
        ? merge_defaults(input, defaults_json())
        : defaults_json();

    if (j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j["idle_timeout_seconds"].is_number_unsigned())
        cfg.idle_timeout_seconds = j["idle_timeout_seconds"].get<uint32_t>();

    if (j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            if (obj.contains("model") && obj["model"].is_string())
                entry.model = obj["model"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        if (s.contains("max_body") && s["max_body"].is_number_unsigned())
            cfg.server.max_body = s["max_body"].get<uint32_t>();
        if (s.contains("max_connections") && s["max_connections"].is_number_unsigned())
            cfg.server.max_connections = s["max_connections"].get<uint32_t>();
    }

    if (j["admission"].is_object()) {
        auto& a = j["admission"];
        if (a.contains("production") && a["production"].is_boolean())
            cfg.admission.production = a["production"].get<bool>();
        if (a.contains("allowed_origins") && a["allowed_origins"].is_array()) {
            for (const auto& o : a["allowed_origins"]) {
                if (o.is_string()) cfg.admission.allowed_origins.push_back(o.get<std::string>());
            }
        }
        if (a.contains("default_user_id") && a["default_user_id"].is_string())
            cfg.admission.default_user_id = a["default_user_id"].get<std::string>();
        if (a.contains("default_tenant_id") && a["default_tenant_id"].is_string())
            cfg.admission.default_tenant_id = a["default_tenant_id"].get<std::string>();
    }

    if (j["prompt"].is_object()) {
        auto& p = j["prompt"];
        if (p.contains("trace") && p["trace"].is_boolean())
            cfg.prompt.trace = p["trace"].get<bool>();
        if (p.contains("trace_preview_length") && p["trace_preview_length"].is_number_integer())
            cfg.prompt.trace_preview_length = p["trace_preview_length"].get<int>();
    }

    if (j["client"].is_object()) {
        auto& c = j["client"];
        if (c.contains("api_url") && c["api_url"].is_string())
            cfg.client.api_url = c["api_url"].get<std::string>();
        if (c.contains("max_retries") && c["max_retries"].is_number_unsigned())
            cfg.client.max_retries = c["max_retries"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path;
    if (const char* v = std::getenv("CHATRELAY_CONFIG"))
        config_path = v;
    else
        config_path = expand_home("~/.chatrelay/config.json");

    nlohmann::json j = nlohmann::json::object();
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = nlohmann::json::object();
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("PROVIDER"))
        provider = v;

    if (const char* v = std::getenv("OPENAI_API_KEY"))
        providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENAI_API_URL"))
        providers["openai"].base_url = v;
    if (const char* v = std::getenv("OPENAI_MODEL"))
        providers["openai"].model = v;
    if (const char* v = std::getenv("QWEN_API_KEY"))
        providers["qwen"].api_key = v;
    if (const char* v = std::getenv("QWEN_API_URL"))
        providers["qwen"].base_url = v;
    if (const char* v = std::getenv("QWEN_MODEL"))
        providers["qwen"].model = v;

    if (const char* v = std::getenv("ALLOWED_ORIGINS")) {
        for (const auto& origin : split(v, ',')) {
            std::string o = trim(origin);
            if (!o.empty()) admission.allowed_origins.push_back(o);
        }
    }

    const char* env = std::getenv("CHATRELAY_ENV");
    if (!env) env = std::getenv("NODE_ENV");
    if (env) admission.production = (std::string(env) == "production");

    if (const char* v = std::getenv("DEFAULT_INTERNAL_USER_ID"))
        admission.default_user_id = v;
    if (const char* v = std::getenv("DEFAULT_TENANT_ID"))
        admission.default_tenant_id = v;
    if (const char* v = std::getenv("CHATRELAY_LISTEN"))
        server.listen = v;

    const char* trace = std::getenv("PROMPT_TRACE");
    if (!trace) trace = std::getenv("PROMPT_DEBUG");
    if (!trace) trace = std::getenv("LOG_PROMPTS");
    if (trace) prompt.trace = is_truthy(trace);

    if (const char* v = std::getenv("PROMPT_TRACE_PREVIEW_LENGTH")) {
        try {
            prompt.trace_preview_length = std::stoi(v);
        } catch (const std::exception&) {
            prompt.trace_preview_length = 0;
        }
    }
}

ProviderEntry Config::provider_entry(const std::string& name) const {
    auto it = providers.find(name);
    if (it != providers.end()) return it->second;
    return {};
}

} // namespace chatrelay
