#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <mutex>
#include <unordered_map>
#include "http.hpp"
#include "config.hpp"

namespace chatrelay {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

// nullopt for anything but "system", "user" or "assistant"
std::optional<Role> role_from_string(const std::string& name);

// One role-tagged message as sent to a provider.
struct ProviderMessage {
    Role role;
    std::string content;
};

// Called once when the provider accepted the request, before any fragment.
// Return false to abort.
using StreamOpenCallback = std::function<bool()>;

// Callback for streaming text deltas. Return false to abort.
using TextDeltaCallback = std::function<bool(const std::string& delta)>;

// Abstract base class for LLM providers: a single streaming completion call.
class Provider {
public:
    virtual ~Provider() = default;

    // Streams the completion. Fragments reach on_delta in arrival order; when
    // either callback returns false consumption stops and the upstream
    // connection is closed before returning. Transport and provider failures
    // are thrown as std::runtime_error, at most once per call.
    virtual void chat_stream(const std::vector<ProviderMessage>& messages,
                             const std::string& model,
                             double temperature,
                             const StreamOpenCallback& on_open,
                             const TextDeltaCallback& on_delta) = 0;

    virtual std::string provider_name() const = 0;

    // Model used when the caller does not ask for one.
    virtual std::string default_model() const = 0;
};

// Canonical provider name: trimmed, lowercased, registered aliases resolved
// ("dashscope"/"tongyi" -> "qwen")
std::string normalize_provider_name(const std::string& name);

// Pick the provider for one request: the explicit selector when non-blank,
// else the process default, else "openai". Throws std::invalid_argument
// ("Unknown provider: <name>") when the chosen name is not registered.
std::string resolve_provider(const std::string& requested,
                             const std::string& process_default);

// Create a provider through the plugin registry using config settings
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const Config& config,
                                          HttpClient& http);

// Process-wide provider instances, created on first use and reused by every
// request. Thread-safe.
class ProviderCache {
public:
    ProviderCache(const Config& config, HttpClient& http)
        : config_(config), http_(http) {}

    // Returns the cached instance or builds one. Construction happens outside
    // the lock; when two threads race, the first inserted instance wins.
    // Throws std::runtime_error when the provider cannot be built.
    std::shared_ptr<Provider> get(const std::string& name);

    size_t size() const;

private:
    const Config& config_;
    HttpClient& http_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Provider>> providers_;
};

} // namespace chatrelay
