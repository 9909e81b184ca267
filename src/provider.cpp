#include "provider.hpp"
#include "plugin.hpp"
#include "util.hpp"
#include <stdexcept>

namespace chatrelay {

std::optional<Role> role_from_string(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    return std::nullopt;
}

std::string normalize_provider_name(const std::string& name) {
    return PluginRegistry::instance().canonical_name(to_lower(trim(name)));
}

std::string resolve_provider(const std::string& requested,
                             const std::string& process_default) {
    std::string name = normalize_provider_name(requested);
    if (name.empty()) name = normalize_provider_name(process_default);
    if (name.empty()) name = "openai";

    if (!PluginRegistry::instance().has_provider(name)) {
        std::string shown = trim(requested).empty() ? trim(process_default) : trim(requested);
        throw std::invalid_argument("Unknown provider: " + shown);
    }
    return name;
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const Config& config,
                                          HttpClient& http) {
    return PluginRegistry::instance().create_provider(
        name, config.provider_entry(name), http,
        static_cast<long>(config.idle_timeout_seconds));
}

std::shared_ptr<Provider> ProviderCache::get(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it != providers_.end()) return it->second;
    }

    std::shared_ptr<Provider> created = create_provider(name, config_, http_);

    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.emplace(name, std::move(created)).first->second;
}

size_t ProviderCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

} // namespace chatrelay
