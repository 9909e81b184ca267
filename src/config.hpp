#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace chatrelay {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;  // empty = provider default
    std::string model;     // empty = provider default
};

struct ServerConfig {
    std::string listen = "127.0.0.1:3000";
    uint32_t max_body = 1048576;       // bytes; larger bodies get 413
    uint32_t max_connections = 64;     // concurrent workers; beyond that 503
};

struct AdmissionConfig {
    bool production = false;                   // headers must carry identity
    std::vector<std::string> allowed_origins;  // extra origins beyond the built-ins
    std::string default_user_id = "dev-user";
    std::string default_tenant_id = "dev-tenant";
};

struct PromptConfig {
    bool trace = false;
    int trace_preview_length = 2000;   // <= 0 disables truncation
};

struct ClientConfig {
    std::string api_url = "http://127.0.0.1:3000/api/chat";
    uint32_t max_retries = 3;
};

struct Config {
    std::string provider = "openai";
    double temperature = 0.4;
    uint32_t idle_timeout_seconds = 60;

    std::unordered_map<std::string, ProviderEntry> providers;

    ServerConfig server;
    AdmissionConfig admission;
    PromptConfig prompt;
    ClientConfig client;

    // Load from $CHATRELAY_CONFIG or ~/.chatrelay/config.json, then env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document; missing keys keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Environment variables always override the config file
    void apply_env_overrides();

    // Provider settings by name (empty entry if absent)
    ProviderEntry provider_entry(const std::string& name) const;
};

} // namespace chatrelay
