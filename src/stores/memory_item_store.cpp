#include "memory_item_store.hpp"

#include <unordered_map>

namespace clipmind {

std::vector<Item> MemoryItemStore::all_items() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Item> out;
    out.reserve(items_.size());
    for (const auto& [id, item] : items_) out.push_back(item);
    return out;
}

std::vector<Item> MemoryItemStore::all_items_with_embeddings() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Item> out;
    for (const auto& [id, item] : items_) {
        if (item.has_embedding()) out.push_back(item);
    }
    return out;
}

std::optional<Item> MemoryItemStore::get_item(const ItemId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

uint32_t MemoryItemStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(items_.size());
}

void MemoryItemStore::put_item(const Item& item) {
    bool existed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        existed = items_.count(item.id) > 0;
        items_[item.id] = item;
    }
    if (existed) notify_updated(item.id);
    else notify_added(item.id);
}

bool MemoryItemStore::remove_item(const ItemId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.erase(id) == 0) return false;
    }
    notify_removed(id);
    return true;
}

bool MemoryItemStore::update_embedding(const ItemId& id, const Embedding& embedding) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return false;
    it->second.embedding = embedding;
    it->second.needs_indexing = true;
    return true;
}

bool MemoryItemStore::set_needs_indexing(const ItemId& id, bool needs_indexing) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return false;
    it->second.needs_indexing = needs_indexing;
    return true;
}

bool MemoryItemStore::update_cluster_assignment(const ItemId& id,
                                                const std::optional<ClusterId>& cluster) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return false;
    it->second.cluster_id = cluster;
    return true;
}

void MemoryItemStore::save_clusters(const std::vector<Cluster>& clusters) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, item] : items_) item.cluster_id.reset();
    for (const auto& c : clusters) {
        for (const auto& member : c.member_ids) {
            auto it = items_.find(member);
            if (it != items_.end()) it->second.cluster_id = c.id;
        }
    }
    clusters_ = clusters;
}

std::vector<Cluster> MemoryItemStore::load_clusters() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cluster> out = clusters_;
    std::unordered_map<ClusterId, Cluster*> by_id;
    for (auto& c : out) {
        c.member_ids.clear();
        by_id[c.id] = &c;
    }
    for (const auto& [id, item] : items_) {
        if (!item.cluster_id) continue;
        auto it = by_id.find(*item.cluster_id);
        if (it != by_id.end()) it->second->member_ids.push_back(id);
    }
    for (auto& c : out) c.item_count = static_cast<uint32_t>(c.member_ids.size());
    return out;
}

} // namespace clipmind
