#include "event_bus.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace clipmind {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Slot{id, std::move(handler)});
    tag_of_[id] = tag;
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = tag_of_.find(id);
    if (owner == tag_of_.end()) return false;

    auto it = handlers_.find(owner->second);
    if (it != handlers_.end()) {
        auto& slots = it->second;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& s) { return s.id == id; }),
                    slots.end());
        if (slots.empty()) handlers_.erase(it);
    }
    tag_of_.erase(owner);
    return true;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        to_call.reserve(it->second.size());
        for (const auto& slot : it->second) to_call.push_back(slot.handler);
    }
    for (const auto& handler : to_call) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[events] " << event.type_tag << " handler failed: " << e.what() << "\n";
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    tag_of_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace clipmind
