#include "item_store.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "stores/memory_item_store.hpp"
#include "stores/sqlite_item_store.hpp"

#include <iostream>

namespace clipmind {

void ItemStore::notify_added(const ItemId& id) {
    if (!bus_) return;
    ItemAddedEvent ev;
    ev.item_id = id;
    bus_->publish(ev);
}

void ItemStore::notify_updated(const ItemId& id) {
    if (!bus_) return;
    ItemUpdatedEvent ev;
    ev.item_id = id;
    bus_->publish(ev);
}

void ItemStore::notify_removed(const ItemId& id) {
    if (!bus_) return;
    ItemRemovedEvent ev;
    ev.item_id = id;
    bus_->publish(ev);
}

std::unique_ptr<ItemStore> create_item_store(const Config& config) {
    const auto& backend = config.store.backend;
    if (backend == "sqlite") {
        return std::make_unique<SqliteItemStore>(config.store_path());
    }
    if (backend != "memory") {
        std::cerr << "[store] Unknown backend '" << backend << "', using memory\n";
    }
    return std::make_unique<MemoryItemStore>();
}

} // namespace clipmind
