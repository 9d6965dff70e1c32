#pragma once
#include "item.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipmind {

class EventBus;   // forward declaration
struct Config;    // forward declaration

// Persistence boundary for library items and clusters. The engine only
// reads and writes through this interface.
class ItemStore {
public:
    virtual ~ItemStore() = default;

    virtual std::string backend_name() const = 0;

    virtual std::vector<Item> all_items() = 0;
    virtual std::vector<Item> all_items_with_embeddings() = 0;
    virtual std::optional<Item> get_item(const ItemId& id) = 0;
    virtual uint32_t count() = 0;

    // Insert or replace. Publishes ItemAddedEvent for a new id and
    // ItemUpdatedEvent for an existing one.
    virtual void put_item(const Item& item) = 0;

    // Publishes ItemRemovedEvent. Returns false for an unknown id.
    virtual bool remove_item(const ItemId& id) = 0;

    // Store a computed embedding; marks the item as needing indexing.
    virtual bool update_embedding(const ItemId& id, const Embedding& embedding) = 0;

    virtual bool set_needs_indexing(const ItemId& id, bool needs_indexing) = 0;

    virtual bool update_cluster_assignment(const ItemId& id,
                                           const std::optional<ClusterId>& cluster) = 0;

    // Replace the cluster table. Item assignments are rewritten to match
    // the member lists; items in no cluster become unclustered.
    virtual void save_clusters(const std::vector<Cluster>& clusters) = 0;

    // Clusters with member_ids rebuilt from item assignments.
    virtual std::vector<Cluster> load_clusters() = 0;

    // Change notifications go to `bus` (may be nullptr). The bus must
    // outlive the store.
    void set_event_bus(EventBus* bus) { bus_ = bus; }

protected:
    // Call without holding the store's own lock: handlers read back.
    void notify_added(const ItemId& id);
    void notify_updated(const ItemId& id);
    void notify_removed(const ItemId& id);

    EventBus* bus_ = nullptr;
};

// "memory" or "sqlite" (path from config.store_path()). Unknown backends
// fall back to memory. Throws std::runtime_error if SQLite cannot open.
std::unique_ptr<ItemStore> create_item_store(const Config& config);

} // namespace clipmind
