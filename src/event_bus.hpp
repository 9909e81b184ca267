#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace chatrelay {

using EventHandler = std::function<void(const Event&)>;

// Synchronous observer hub shared by the relay (one publisher per worker
// thread) and the chat session. Handlers run on the publishing thread with
// no bus lock held, so they may subscribe, unsubscribe or publish.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID (never 0).
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Call every handler for the event's tag in registration order. A handler
    // that throws is logged and skipped; the remaining handlers still run.
    // Returns the number of handlers that completed.
    size_t publish(const Event& event);

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
};

// Owns one subscription and drops it on destruction. Movable, not copyable.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
        other.id_ = 0;
    }

    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
        if (bus_ && id_ != 0) bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }

    uint64_t id() const { return id_; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Same as subscribe<E>(), but the subscription ends with the returned handle.
template<typename E>
ScopedSubscription subscribe_scoped(EventBus& bus, std::function<void(const E&)> handler) {
    return ScopedSubscription(bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace chatrelay
