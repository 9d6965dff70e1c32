#pragma once
#include "../config.hpp"
#include "../graph/knn_graph.hpp"
#include "../item.hpp"
#include "../task.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clipmind {

struct ClusterPassResult {
    bool ok = false;
    bool cancelled = false;
    std::string error;            // set when the pass was aborted
    size_t cluster_count = 0;
    size_t clustered_items = 0;
    size_t retained_ids = 0;      // clusters that kept an id from the previous pass
    double modularity = 0.0;
    uint32_t iterations = 0;
};

// Resolves an item id to its current state (text + embedding) for manual
// operations. Returns nullopt for unknown ids.
using ItemLookup = std::function<std::optional<Item>(const ItemId&)>;

// Owns the cluster table and the item -> cluster assignment. Passes compute
// off-lock and swap the result in, so readers never see a partial pass.
class ClusterEngine {
public:
    explicit ClusterEngine(ClusterConfig config = {});

    // Leiden over `graph`, then centroids, labels and id matching against
    // the current clusters. `items` supplies embeddings and text by id.
    // On cancel or error the current assignment is left untouched.
    ClusterPassResult run_pass(const std::vector<Item>& items, const KnnGraph& graph,
                               const TaskHandle& task = TaskHandle());

    // True before the first pass over a non-empty library, and once the
    // library has grown by more than recluster_growth since the last pass.
    bool should_recluster(size_t current_item_count) const;

    // Largest first, ties by id.
    std::vector<Cluster> clusters() const;
    std::optional<Cluster> cluster(const ClusterId& id) const;
    std::optional<ClusterId> cluster_of(const ItemId& item) const;
    std::unordered_map<ItemId, ClusterId> assignments() const;
    size_t cluster_count() const;

    // Move every member of `from` into `into`; `from` is deleted.
    bool merge(const ClusterId& into, const ClusterId& from, const ItemLookup& lookup);

    // Move the listed members of `cluster` into a new cluster. Ids that are
    // not members are ignored. Returns the new id, or nullopt when none of
    // the ids were members.
    std::optional<ClusterId> split(const ClusterId& cluster, const std::vector<ItemId>& item_ids,
                                   const ItemLookup& lookup);

    // Drop one item from its cluster. Returns the cluster it left.
    std::optional<ClusterId> evict(const ItemId& item, const ItemLookup& lookup);

    // Recompute the centroid and confidence of the cluster holding `item`
    // after its embedding changed. Returns that cluster, or nullopt when the
    // item is unassigned.
    std::optional<ClusterId> refresh_member(const ItemId& item, const ItemLookup& lookup);

    // User label; survives later passes while the cluster keeps its id.
    bool rename(const ClusterId& cluster, const std::string& label);

    // Replace state with clusters loaded from storage.
    void restore(std::vector<Cluster> clusters);
    void clear();

    const ClusterConfig& config() const { return config_; }

private:
    struct Draft {
        std::vector<ItemId> members;
        Embedding centroid;
        double confidence = 0.0;
        std::vector<std::string> terms;
    };

    ClusterId next_cluster_id_locked();
    void refresh_cluster_locked(Cluster& cluster, const ItemLookup& lookup);
    std::string unique_label_locked(const std::string& base, const Embedding& centroid,
                                    const ClusterId& exclude) const;

    ClusterConfig config_;
    mutable std::mutex mutex_;
    std::map<ClusterId, Cluster> clusters_;
    std::unordered_map<ItemId, ClusterId> assignment_;
    uint64_t next_id_ = 1;
    size_t last_pass_items_ = 0;
    bool has_run_ = false;
};

// Mean cosine of the members to the centroid, clamped to [0, 1].
double centroid_confidence(const std::vector<const Embedding*>& members, const Embedding& centroid);

// Four hex digits derived from the centroid, quantised so tiny float noise
// does not change it.
std::string centroid_tag(const Embedding& centroid);

} // namespace clipmind
