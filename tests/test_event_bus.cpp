#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <stdexcept>

using namespace clipmind;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(ItemAddedEvent::TAG, [&](const Event&) {
        count++;
    });

    ItemAddedEvent ev;
    ev.item_id = "v1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(ItemRemovedEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(ItemRemovedEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    ItemRemovedEvent ev;
    bus.publish(ev);

    REQUIRE(order.size() == 2);
    REQUIRE(order[0] == 1);
    REQUIRE(order[1] == 2);
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    ItemAddedEvent ev;
    bus.publish(ev); // should not crash
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int received_count = 0;
    int ready_count = 0;

    bus.subscribe(ItemAddedEvent::TAG, [&](const Event&) {
        received_count++;
    });
    bus.subscribe(ItemRemovedEvent::TAG, [&](const Event&) {
        ready_count++;
    });

    ItemAddedEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);

    ItemRemovedEvent ev2;
    bus.publish(ev2);

    REQUIRE(received_count == 2);
    REQUIRE(ready_count == 1);
}

// ── Unsubscribe ─────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;

    uint64_t id = bus.subscribe(ItemAddedEvent::TAG, [&](const Event&) {
        count++;
    });

    ItemAddedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);

    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1); // not called again
}

TEST_CASE("EventBus: unsubscribe returns false for unknown id", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.unsubscribe(999));
}

// ── Clear ───────────────────────────────────────────────────────

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(ItemAddedEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe(ItemRemovedEvent::TAG, [&](const Event&) { count++; });

    bus.clear();

    ItemAddedEvent ev1;
    ItemRemovedEvent ev2;
    bus.publish(ev1);
    bus.publish(ev2);
    REQUIRE(count == 0);
}

// ── subscriber_count ────────────────────────────────────────────

TEST_CASE("EventBus: subscriber_count", "[event_bus]") {
    EventBus bus;
    REQUIRE(bus.subscriber_count(ItemAddedEvent::TAG) == 0);

    bus.subscribe(ItemAddedEvent::TAG, [](const Event&) {});
    bus.subscribe(ItemAddedEvent::TAG, [](const Event&) {});
    REQUIRE(bus.subscriber_count(ItemAddedEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(ItemRemovedEvent::TAG) == 0);
}

// ── Type-safe subscribe helper ──────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe template", "[event_bus]") {
    EventBus bus;
    std::string captured_item;

    subscribe<ItemAddedEvent>(bus, [&](const ItemAddedEvent& ev) {
        captured_item = ev.item_id;
    });

    ItemAddedEvent ev;
    ev.item_id = "test-item";
    bus.publish(ev);

    REQUIRE(captured_item == "test-item");
}

TEST_CASE("EventBus: type-safe subscribe for ClustersUpdated", "[event_bus]") {
    EventBus bus;
    size_t clusters = 0;
    double modularity = 0.0;

    subscribe<ClustersUpdatedEvent>(bus, [&](const ClustersUpdatedEvent& ev) {
        clusters = ev.cluster_count;
        modularity = ev.modularity;
    });

    ClustersUpdatedEvent ev;
    ev.cluster_count = 4;
    ev.modularity = 0.5;
    bus.publish(ev);

    REQUIRE(clusters == 4);
    REQUIRE(modularity == 0.5);
}

// ── Event data integrity ────────────────────────────────────────

TEST_CASE("EventBus: embed result passes through correctly", "[event_bus]") {
    EventBus bus;
    std::string item_id;
    bool success = true;
    std::string error;

    subscribe<ItemEmbeddedEvent>(bus, [&](const ItemEmbeddedEvent& ev) {
        item_id = ev.item_id;
        success = ev.success;
        error = ev.error;
    });

    ItemEmbeddedEvent ev;
    ev.item_id = "v9";
    ev.success = false;
    ev.error = "model unavailable";
    bus.publish(ev);

    REQUIRE(item_id == "v9");
    REQUIRE_FALSE(success);
    REQUIRE(error == "model unavailable");
}

TEST_CASE("EventBus: handler may publish a follow-up event", "[event_bus]") {
    EventBus bus;
    std::string updated_id;

    subscribe<ItemUpdatedEvent>(bus, [&](const ItemUpdatedEvent& ev) {
        updated_id = ev.item_id;
    });
    subscribe<ItemAddedEvent>(bus, [&](const ItemAddedEvent& ev) {
        ItemUpdatedEvent follow;
        follow.item_id = ev.item_id;
        bus.publish(follow);
    });

    ItemAddedEvent ev;
    ev.item_id = "abc";
    bus.publish(ev);

    REQUIRE(updated_id == "abc");
}

// ── Failure isolation and scoped subscriptions ──────────────────

TEST_CASE("EventBus: throwing handler does not stop the others", "[event_bus]") {
    EventBus bus;
    int after = 0;

    bus.subscribe(ItemAddedEvent::TAG, [](const Event&) {
        throw std::runtime_error("store unavailable");
    });
    bus.subscribe(ItemAddedEvent::TAG, [&](const Event&) { after++; });

    ItemAddedEvent ev;
    REQUIRE_NOTHROW(bus.publish(ev));
    REQUIRE(after == 1);
}

TEST_CASE("EventBus: handler may unsubscribe itself", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = 0;

    id = bus.subscribe(ItemRemovedEvent::TAG, [&](const Event&) {
        count++;
        bus.unsubscribe(id);
    });

    ItemRemovedEvent ev;
    bus.publish(ev);
    bus.publish(ev);
    REQUIRE(count == 1);
    REQUIRE(bus.subscriber_count(ItemRemovedEvent::TAG) == 0);
}

TEST_CASE("ScopedSubscription: unsubscribes when destroyed", "[event_bus]") {
    EventBus bus;
    int count = 0;
    {
        auto sub = subscribe_scoped<ItemAddedEvent>(bus, [&](const ItemAddedEvent&) { count++; });
        REQUIRE(sub.id() != 0);
        REQUIRE(bus.subscriber_count(ItemAddedEvent::TAG) == 1);

        ItemAddedEvent ev;
        bus.publish(ev);
    }
    REQUIRE(bus.subscriber_count(ItemAddedEvent::TAG) == 0);

    ItemAddedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);
}

TEST_CASE("ScopedSubscription: moved-from handle is inert", "[event_bus]") {
    EventBus bus;
    auto a = subscribe_scoped<ItemAddedEvent>(bus, [](const ItemAddedEvent&) {});
    uint64_t id = a.id();

    ScopedSubscription b = std::move(a);
    REQUIRE(b.id() == id);
    REQUIRE(a.id() == 0);
    a.reset();
    REQUIRE(bus.subscriber_count(ItemAddedEvent::TAG) == 1);

    b.reset();
    REQUIRE(bus.subscriber_count(ItemAddedEvent::TAG) == 0);
    REQUIRE_FALSE(bus.unsubscribe(id));
}
