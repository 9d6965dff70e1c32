#pragma once
#include "../item.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace clipmind {

enum class IndexStatus { Ok, DimensionMismatch, EmptyVector };

std::string index_status_to_string(IndexStatus status);

struct ScoredId {
    ItemId id;
    double score = 0.0;
};

struct HnswParams {
    uint32_t m = 16;                 // max links per node per layer (2*m on layer 0)
    uint32_t ef_construction = 200;  // beam width while inserting
    uint32_t ef_search = 100;        // beam width while querying (raised to k if smaller)
    uint64_t seed = 42;              // level assignment
};

// Hierarchical Navigable Small World index over cosine similarity.
//
// Thread-safety: any number of concurrent readers (query, size, serialize);
// insert/remove/compact/deserialize take the lock exclusively, so a query never
// observes a half-linked node.
//
// Removal tombstones the node and relinks its neighbours immediately; the
// slot itself is only reclaimed by compact().
class HnswIndex {
public:
    // dimensions == 0 lets the first insert fix the dimension.
    explicit HnswIndex(uint32_t dimensions = 0, HnswParams params = {});

    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    // Insert or replace. Replacing is remove-then-insert, never a duplicate node.
    IndexStatus insert(const ItemId& id, const Embedding& vector);

    // Returns false if the id is not indexed.
    bool remove(const ItemId& id);

    // Top-k by cosine similarity, best first, ties by ascending id.
    // Empty index, k == 0 or a wrong-length query vector yield an empty list.
    std::vector<ScoredId> query(const Embedding& vector, size_t k) const;

    // Drop tombstoned slots. Returns the number reclaimed.
    size_t compact();

    // Remove everything. Parameters are kept; the dimension returns to the
    // constructor's value.
    void clear();

    // Snapshot of the whole structure (compacted) as one binary blob.
    std::string serialize() const;

    // Replace the current state from a blob. On a corrupt blob the index is
    // left empty and false is returned.
    bool deserialize(const std::string& blob);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    size_t size() const;
    size_t tombstones() const;
    uint32_t dimensions() const;
    bool contains(const ItemId& id) const;
    std::vector<ItemId> ids() const;
    std::optional<Embedding> vector(const ItemId& id) const;
    HnswParams params() const;
    void set_ef_search(uint32_t ef);

private:
    static constexpr uint32_t kNone = std::numeric_limits<uint32_t>::max();
    static constexpr int kMaxLevel = 32;

    struct Node {
        ItemId id;
        Embedding vec;
        double inv_norm = 0.0;
        int level = 0;
        std::vector<std::vector<uint32_t>> links; // links[layer]
        bool deleted = false;
    };

    struct Candidate {
        double sim;
        uint32_t node;
    };

    int random_level();
    size_t max_degree(int layer) const { return layer == 0 ? 2 * params_.m : params_.m; }

    double similarity(const Embedding& q, double q_inv, uint32_t node) const;
    double node_similarity(uint32_t a, uint32_t b) const;

    std::vector<Candidate> search_layer(const Embedding& q, double q_inv,
                                        const std::vector<uint32_t>& entry_points,
                                        size_t ef, int layer) const;
    uint32_t descend(const Embedding& q, double q_inv, int target_layer) const;

    std::vector<uint32_t> select_neighbors(uint32_t base,
                                           const std::vector<Candidate>& candidates,
                                           size_t max_count) const;
    void shrink_links(uint32_t node, int layer);
    void connect(uint32_t from, uint32_t to, int layer);
    void repair_links(uint32_t node, int layer, const std::vector<uint32_t>& orphaned_from);

    bool remove_locked(const ItemId& id);
    void elect_entry_point();
    size_t compact_locked();
    void reset_locked();

    uint32_t initial_dim_;
    uint32_t dim_;
    HnswParams params_;
    double level_mult_;
    std::mt19937_64 rng_;

    std::vector<Node> nodes_;
    std::unordered_map<ItemId, uint32_t> id_to_node_; // live nodes only
    uint32_t entry_point_ = kNone;
    int max_level_ = -1;
    size_t tombstones_ = 0;

    mutable std::shared_mutex mutex_;
};

} // namespace clipmind
