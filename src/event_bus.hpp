#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace clipmind {

using EventHandler = std::function<void(const Event&)>;

// Synchronous in-process dispatch. Store notifications, embedding results
// and cluster updates all travel through one bus owned by the engine.
class EventBus {
public:
    // Returns a subscription id (never 0).
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Handlers run on the publishing thread in registration order, without
    // the bus lock held, so they may publish or unsubscribe. A handler that
    // throws is logged and skipped; the remaining handlers still run.
    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Slot {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Slot>> handlers_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
};

// Unsubscribes on destruction. The bus must outlive it.
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
        if (bus_ && id_) bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }
    uint64_t id() const { return id_; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Subscribe with the concrete event type; the tag comes from E::TAG.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

template<typename E>
ScopedSubscription subscribe_scoped(EventBus& bus, std::function<void(const E&)> handler) {
    return ScopedSubscription(bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace clipmind
