#pragma once
#include "../item.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace clipmind {

class HnswIndex;

// Weighted undirected graph over item ids. Nodes are addressed by a dense
// uint32_t slot; weights are cosine similarities in (0, 1].
class KnnGraph {
public:
    // Returns the node's slot, adding it if missing.
    uint32_t add_node(const ItemId& id);

    // Drops the node's edges. The slot stays (isolated) so other slots keep
    // their numbering; returns false for an unknown id.
    bool remove_node(const ItemId& id);

    // Undirected. A repeated edge keeps the larger weight; self loops and
    // non-positive weights are ignored.
    void add_edge(uint32_t a, uint32_t b, double weight);

    std::optional<uint32_t> node_of(const ItemId& id) const;
    const ItemId& id_of(uint32_t node) const { return ids_[node]; }
    bool is_removed(uint32_t node) const { return removed_[node]; }

    size_t node_count() const { return ids_.size(); }
    size_t live_node_count() const { return ids_.size() - removed_count_; }
    size_t edge_count() const { return edge_count_; }

    const std::unordered_map<uint32_t, double>& neighbors(uint32_t node) const { return adjacency_[node]; }
    std::optional<double> weight(const ItemId& a, const ItemId& b) const;

    // Sum of edge weights at a node.
    double degree(uint32_t node) const;

    // Sum of all edge weights (each undirected edge counted once).
    double total_weight() const;

private:
    std::vector<ItemId> ids_;
    std::unordered_map<ItemId, uint32_t> index_;
    std::vector<std::unordered_map<uint32_t, double>> adjacency_;
    std::vector<bool> removed_;
    size_t removed_count_ = 0;
    size_t edge_count_ = 0;
};

// One node per item with an embedding. Each node is linked to up to k of
// its nearest neighbours from `index`; neighbours outside `items` are skipped.
KnnGraph build_graph(const std::vector<Item>& items, const HnswIndex& index, uint32_t k = 10);

// Incremental insertion of one item and its edges to nodes already present.
// Returns false if the item has no embedding.
bool add_node(KnnGraph& graph, const Item& item, const HnswIndex& index, uint32_t k = 10);

bool remove_node(KnnGraph& graph, const ItemId& id);

} // namespace clipmind
