#include "knn_graph.hpp"
#include "../index/hnsw_index.hpp"

#include <iostream>

namespace clipmind {

uint32_t KnnGraph::add_node(const ItemId& id) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        uint32_t node = it->second;
        if (removed_[node]) {
            removed_[node] = false;
            removed_count_--;
        }
        return node;
    }
    uint32_t node = static_cast<uint32_t>(ids_.size());
    ids_.push_back(id);
    index_[id] = node;
    adjacency_.emplace_back();
    removed_.push_back(false);
    return node;
}

bool KnnGraph::remove_node(const ItemId& id) {
    auto it = index_.find(id);
    if (it == index_.end() || removed_[it->second]) return false;

    uint32_t node = it->second;
    for (const auto& [other, w] : adjacency_[node]) {
        adjacency_[other].erase(node);
        edge_count_--;
    }
    adjacency_[node].clear();
    removed_[node] = true;
    removed_count_++;
    return true;
}

void KnnGraph::add_edge(uint32_t a, uint32_t b, double weight) {
    if (a == b || !(weight > 0.0)) return;
    if (a >= ids_.size() || b >= ids_.size()) return;
    if (removed_[a] || removed_[b]) return;

    auto& edges = adjacency_[a];
    auto it = edges.find(b);
    if (it == edges.end()) {
        edges[b] = weight;
        adjacency_[b][a] = weight;
        edge_count_++;
    } else if (weight > it->second) {
        it->second = weight;
        adjacency_[b][a] = weight;
    }
}

std::optional<uint32_t> KnnGraph::node_of(const ItemId& id) const {
    auto it = index_.find(id);
    if (it == index_.end() || removed_[it->second]) return std::nullopt;
    return it->second;
}

std::optional<double> KnnGraph::weight(const ItemId& a, const ItemId& b) const {
    auto na = node_of(a);
    auto nb = node_of(b);
    if (!na || !nb) return std::nullopt;
    auto it = adjacency_[*na].find(*nb);
    if (it == adjacency_[*na].end()) return std::nullopt;
    return it->second;
}

double KnnGraph::degree(uint32_t node) const {
    double sum = 0.0;
    for (const auto& [other, w] : adjacency_[node]) sum += w;
    return sum;
}

double KnnGraph::total_weight() const {
    double sum = 0.0;
    for (uint32_t n = 0; n < adjacency_.size(); n++) sum += degree(n);
    return sum / 2.0;
}

// ── Builders ────────────────────────────────────────────────────

static void link_neighbors(KnnGraph& graph, uint32_t node, const Item& item,
                           const HnswIndex& index, uint32_t k) {
    // k + 1 because the item usually finds itself first
    auto neighbors = index.query(*item.embedding, static_cast<size_t>(k) + 1);
    uint32_t linked = 0;
    for (const auto& n : neighbors) {
        if (linked >= k) break;
        if (n.id == item.id) continue;
        auto other = graph.node_of(n.id);
        if (!other) {
            std::cerr << "[graph] Index returned " << n.id
                      << " which is not in the item set, skipping\n";
            continue;
        }
        linked++;
        graph.add_edge(node, *other, n.score);
    }
}

KnnGraph build_graph(const std::vector<Item>& items, const HnswIndex& index, uint32_t k) {
    KnnGraph graph;
    std::vector<const Item*> embedded;
    embedded.reserve(items.size());
    for (const auto& item : items) {
        if (!item.has_embedding()) continue;
        graph.add_node(item.id);
        embedded.push_back(&item);
    }

    for (const Item* item : embedded) {
        link_neighbors(graph, *graph.node_of(item->id), *item, index, k);
    }
    return graph;
}

bool add_node(KnnGraph& graph, const Item& item, const HnswIndex& index, uint32_t k) {
    if (!item.has_embedding()) return false;
    uint32_t node = graph.add_node(item.id);
    link_neighbors(graph, node, item, index, k);
    return true;
}

bool remove_node(KnnGraph& graph, const ItemId& id) {
    return graph.remove_node(id);
}

} // namespace clipmind
