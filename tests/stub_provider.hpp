#pragma once
#include "provider.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace chatrelay {

// Scripted provider: opens (unless told not to), emits fragments, then
// optionally throws.
class StubProvider : public Provider {
public:
    std::string name = "stub";
    std::string model = "stub-model";
    bool open = true;
    std::vector<std::string> fragments;
    std::string throw_before_open;      // thrown instead of opening
    std::string throw_after;            // thrown after the fragments

    int calls = 0;
    size_t fragments_sent = 0;
    bool stopped = false;               // a callback returned false
    std::vector<ProviderMessage> last_messages;
    std::string last_model;
    double last_temperature = 0.0;

    void chat_stream(const std::vector<ProviderMessage>& messages,
                     const std::string& requested_model,
                     double temperature,
                     const StreamOpenCallback& on_open,
                     const TextDeltaCallback& on_delta) override {
        calls++;
        last_messages = messages;
        last_model = requested_model;
        last_temperature = temperature;

        if (!throw_before_open.empty()) throw std::runtime_error(throw_before_open);
        if (!open) return;
        if (!on_open()) {
            stopped = true;
            return;
        }
        for (const auto& f : fragments) {
            fragments_sent++;
            if (!on_delta(f)) {
                stopped = true;
                return;
            }
        }
        if (!throw_after.empty()) throw std::runtime_error(throw_after);
    }

    std::string provider_name() const override { return name; }
    std::string default_model() const override { return model; }
};

} // namespace chatrelay
