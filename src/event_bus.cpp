#include "event_bus.hpp"
#include <iostream>
#include <stdexcept>

namespace chatrelay {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    tag_of_.emplace(id, tag);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tag_it = tag_of_.find(id);
    if (tag_it == tag_of_.end()) return false;

    auto& subs = handlers_[tag_it->second];
    for (auto it = subs.begin(); it != subs.end(); ++it) {
        if (it->id == id) {
            subs.erase(it);
            break;
        }
    }
    if (subs.empty()) handlers_.erase(tag_it->second);
    tag_of_.erase(tag_it);
    return true;
}

size_t EventBus::publish(const Event& event) {
    // Snapshot under lock; handlers run unlocked.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return 0;
        to_call.reserve(it->second.size());
        for (const auto& sub : it->second) {
            to_call.push_back(sub.handler);
        }
    }

    size_t delivered = 0;
    for (const auto& handler : to_call) {
        try {
            handler(event);
            ++delivered;
        } catch (const std::exception& e) {
            std::cerr << "[event_bus] " << event.type_tag << " handler failed: "
                      << e.what() << '\n';
        }
    }
    return delivered;
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace chatrelay
