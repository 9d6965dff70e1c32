#pragma once
#include "cluster/cluster_engine.hpp"
#include "config.hpp"
#include "embedding_service.hpp"
#include "event_bus.hpp"
#include "index/hnsw_index.hpp"
#include "item_store.hpp"
#include "search/hybrid_search.hpp"
#include "task.hpp"
#include "worker_pool.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clipmind {

class TextEncoder;

struct EmbedSummary {
    size_t embedded = 0;
    size_t failed = 0;
    size_t indexed = 0;
};

struct EngineStats {
    size_t items = 0;
    size_t embedded = 0;
    size_t indexed = 0;
    size_t tombstones = 0;
    size_t clusters = 0;
    size_t clustered_items = 0;
};

// Query surface over one library. Keeps the vector index and the cluster
// table in step with the item store by listening to its change events.
//
// The store and encoder are not owned and must outlive the engine; a null
// encoder disables embedding (keyword-only search).
class Engine {
public:
    Engine(const Config& config, ItemStore& store, TextEncoder* encoder);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Queries ─────────────────────────────────────────────────
    SearchOutcome search(const std::string& query, const SearchFilters& filters = {}) const;
    std::vector<Cluster> list_clusters() const;
    std::optional<Cluster> get_cluster(const ClusterId& id) const;
    std::optional<Item> get_item(const ItemId& id) const { return store_.get_item(id); }
    EngineStats stats() const;

    // ── Library changes ─────────────────────────────────────────
    // Rebuilds text_content and writes through the store; the store's event
    // triggers embedding and indexing.
    void add_item(Item item);
    bool remove_item(const ItemId& id);

    // Embed every item without an embedding and index everything still
    // flagged needs_indexing.
    EmbedSummary embed_pending();
    std::future<EmbedSummary> embed_pending_async();

    // ── Index ───────────────────────────────────────────────────
    // Clear and re-insert every item with an embedding. Returns the count.
    size_t rebuild_index();
    std::future<size_t> rebuild_index_async();
    bool save_index() const;

    // Load the snapshot and reconcile it with the store. Falls back to a
    // full rebuild (and returns false) when the snapshot is missing or corrupt.
    bool load_index();

    // ── Clustering ──────────────────────────────────────────────
    ClusterPassResult recluster(const TaskHandle& task = TaskHandle());

    // Cancels any pass still running from an earlier call.
    std::future<ClusterPassResult> recluster_async();
    bool should_recluster() const;

    bool merge_clusters(const ClusterId& into, const ClusterId& from);
    std::optional<ClusterId> split_cluster(const ClusterId& cluster,
                                           const std::vector<ItemId>& item_ids);
    bool evict_item(const ItemId& item);
    bool rename_cluster(const ClusterId& cluster, const std::string& label);

    EventBus& events() { return bus_; }
    const HnswIndex& index() const { return index_; }
    const Config& config() const { return config_; }

private:
    void on_item_changed(const ItemId& id, bool metadata_changed);
    void on_item_removed(const ItemId& id);

    bool embed_and_store(Item& item);
    bool index_item(const Item& item);
    void compact_if_needed();

    void persist_clusters();
    void invalidate_catalog();
    ItemCatalog catalog() const;
    ItemLookup lookup();

    Config config_;
    ItemStore& store_;
    EventBus bus_;
    EmbeddingService embedding_;
    HnswIndex index_;
    ClusterEngine clusters_;
    HybridSearchEngine search_;

    mutable std::mutex catalog_mutex_;
    mutable ItemCatalog catalog_;          // null = rebuild on next search

    std::mutex pass_mutex_;                // one clustering pass at a time
    std::mutex current_pass_mutex_;
    TaskHandle current_pass_;

    std::vector<ScopedSubscription> subscriptions_;

    // Declared last: joined first on destruction, while the members it
    // uses are still alive.
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace clipmind
