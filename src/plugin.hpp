#pragma once
#include "provider.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <initializer_list>
#include <unordered_map>
#include <mutex>

namespace chatrelay {

// Builds a provider from its configured settings. Throws std::runtime_error
// when the settings are unusable (e.g. no API key).
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const ProviderEntry& entry, HttpClient& http, long idle_timeout_seconds)>;

// Central registry for self-registering providers.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    // Another accepted spelling of a registered provider ("dashscope" -> "qwen").
    void register_alias(const std::string& alias, const std::string& name);

    // Registered name for `name` after alias lookup; `name` itself when it
    // is not an alias.
    std::string canonical_name(const std::string& name) const;

    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const ProviderEntry& entry,
                                              HttpClient& http,
                                              long idle_timeout_seconds) const;

    std::vector<std::string> provider_names() const;
    bool has_provider(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, std::string> aliases_;
};

// Self-registrar helper (used at file scope in each provider .cpp)
struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory,
                      std::initializer_list<const char*> aliases = {}) {
        auto& registry = PluginRegistry::instance();
        registry.register_provider(name, std::move(factory));
        for (const char* alias : aliases) registry.register_alias(alias, name);
    }
};

} // namespace chatrelay
