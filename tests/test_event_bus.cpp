#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <stdexcept>
#include <vector>

using namespace chatrelay;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(RelayCompletedEvent::TAG, [&](const Event&) {
        count++;
    });

    RelayCompletedEvent ev;
    ev.request_id = "r1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(ChatDeltaEvent::TAG, [&](const Event&) { order.push_back(1); });
    bus.subscribe(ChatDeltaEvent::TAG, [&](const Event&) { order.push_back(2); });

    ChatDeltaEvent ev;
    bus.publish(ev);

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    ChatStartEvent ev;
    bus.publish(ev); // should not crash
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int delta_count = 0;
    int error_count = 0;

    bus.subscribe(ChatDeltaEvent::TAG, [&](const Event&) { delta_count++; });
    bus.subscribe(ChatErrorEvent::TAG, [&](const Event&) { error_count++; });

    ChatDeltaEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);
    ChatErrorEvent ev2;
    bus.publish(ev2);

    REQUIRE(delta_count == 2);
    REQUIRE(error_count == 1);
}

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = bus.subscribe(ChatCompleteEvent::TAG, [&](const Event&) { count++; });

    ChatCompleteEvent ev;
    bus.publish(ev);
    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);

    REQUIRE(count == 1);
    REQUIRE_FALSE(bus.unsubscribe(id));
}

TEST_CASE("EventBus: subscriber_count follows unsubscribe", "[event_bus]") {
    EventBus bus;
    uint64_t a = bus.subscribe(ChatStartEvent::TAG, [](const Event&) {});
    bus.subscribe(ChatStartEvent::TAG, [](const Event&) {});
    REQUIRE(bus.subscriber_count(ChatStartEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(RetryExhaustedEvent::TAG) == 0);

    REQUIRE(bus.unsubscribe(a));
    REQUIRE(bus.subscriber_count(ChatStartEvent::TAG) == 1);
}

TEST_CASE("EventBus: a throwing handler does not stop the others", "[event_bus]") {
    EventBus bus;
    int after = 0;

    bus.subscribe(RelayCompletedEvent::TAG, [](const Event&) {
        throw std::runtime_error("observer broke");
    });
    bus.subscribe(RelayCompletedEvent::TAG, [&](const Event&) { after++; });

    RelayCompletedEvent ev;
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(after == 1);
}

TEST_CASE("EventBus: publish reports delivered handlers", "[event_bus]") {
    EventBus bus;
    ChatErrorEvent ev;
    REQUIRE(bus.publish(ev) == 0);
    bus.subscribe(ChatErrorEvent::TAG, [](const Event&) {});
    REQUIRE(bus.publish(ev) == 1);
}

// ── Scoped subscriptions ────────────────────────────────────────

TEST_CASE("ScopedSubscription: unsubscribes when destroyed", "[event_bus]") {
    EventBus bus;
    int count = 0;
    {
        auto sub = subscribe_scoped<ChatDeltaEvent>(bus, [&](const ChatDeltaEvent&) {
            count++;
        });
        REQUIRE(sub.id() != 0);
        ChatDeltaEvent ev;
        bus.publish(ev);
    }
    ChatDeltaEvent ev;
    bus.publish(ev);

    REQUIRE(count == 1);
    REQUIRE(bus.subscriber_count(ChatDeltaEvent::TAG) == 0);
}

TEST_CASE("ScopedSubscription: move transfers ownership", "[event_bus]") {
    EventBus bus;
    ScopedSubscription outer;
    {
        auto inner = subscribe_scoped<ChatStartEvent>(bus, [](const ChatStartEvent&) {});
        outer = std::move(inner);
        REQUIRE(inner.id() == 0);
    }
    REQUIRE(bus.subscriber_count(ChatStartEvent::TAG) == 1);

    outer.reset();
    REQUIRE(bus.subscriber_count(ChatStartEvent::TAG) == 0);
}

// ── Typed helper ────────────────────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe carries event data", "[event_bus]") {
    EventBus bus;
    ConnectionStatus seen_from = ConnectionStatus::Error;
    ConnectionStatus seen_to = ConnectionStatus::Error;

    subscribe<ConnectionChangeEvent>(bus, [&](const ConnectionChangeEvent& ev) {
        seen_from = ev.from;
        seen_to = ev.to;
    });

    ConnectionChangeEvent ev;
    ev.from = ConnectionStatus::Connecting;
    ev.to = ConnectionStatus::Connected;
    bus.publish(ev);

    REQUIRE(seen_from == ConnectionStatus::Connecting);
    REQUIRE(seen_to == ConnectionStatus::Connected);
}

TEST_CASE("EventBus: handler may publish from inside a handler", "[event_bus]") {
    EventBus bus;
    int exhausted = 0;

    subscribe<RetryExhaustedEvent>(bus, [&](const RetryExhaustedEvent& ev) {
        REQUIRE(ev.attempts == 3);
        exhausted++;
    });
    subscribe<ChatErrorEvent>(bus, [&](const ChatErrorEvent&) {
        RetryExhaustedEvent inner;
        inner.attempts = 3;
        bus.publish(inner);
    });

    ChatErrorEvent ev;
    ev.message = "boom";
    bus.publish(ev);

    REQUIRE(exhausted == 1);
}
