#pragma once
#include "../item_store.hpp"
#include <map>
#include <mutex>

namespace clipmind {

// Process-local store for tests and host applications that keep their own
// persistence.
class MemoryItemStore : public ItemStore {
public:
    std::string backend_name() const override { return "memory"; }

    std::vector<Item> all_items() override;
    std::vector<Item> all_items_with_embeddings() override;
    std::optional<Item> get_item(const ItemId& id) override;
    uint32_t count() override;

    void put_item(const Item& item) override;
    bool remove_item(const ItemId& id) override;
    bool update_embedding(const ItemId& id, const Embedding& embedding) override;
    bool set_needs_indexing(const ItemId& id, bool needs_indexing) override;
    bool update_cluster_assignment(const ItemId& id,
                                   const std::optional<ClusterId>& cluster) override;

    void save_clusters(const std::vector<Cluster>& clusters) override;
    std::vector<Cluster> load_clusters() override;

private:
    std::mutex mutex_;
    std::map<ItemId, Item> items_;   // ordered: all_items() is stable
    std::vector<Cluster> clusters_;
};

} // namespace clipmind
