#include "engine.hpp"
#include "encoder.hpp"
#include "graph/knn_graph.hpp"
#include "util.hpp"

#include <iostream>
#include <new>
#include <unordered_set>

namespace clipmind {

static HnswParams index_params(const IndexConfig& cfg) {
    HnswParams p;
    p.m = cfg.m;
    p.ef_construction = cfg.ef_construction;
    p.ef_search = cfg.ef_search;
    p.seed = cfg.seed;
    return p;
}

Engine::Engine(const Config& config, ItemStore& store, TextEncoder* encoder)
    : config_(config),
      store_(store),
      embedding_(encoder, config.embedding),
      index_(0, index_params(config.index)),
      clusters_(config.cluster),
      search_(embedding_, index_, config.search),
      pool_(std::make_unique<WorkerPool>(config.worker_threads)) {
    store_.set_event_bus(&bus_);

    subscriptions_.push_back(subscribe_scoped<ItemAddedEvent>(bus_, [this](const ItemAddedEvent& ev) {
        on_item_changed(ev.item_id, false);
    }));
    subscriptions_.push_back(subscribe_scoped<ItemUpdatedEvent>(bus_, [this](const ItemUpdatedEvent& ev) {
        on_item_changed(ev.item_id, true);
    }));
    subscriptions_.push_back(subscribe_scoped<ItemRemovedEvent>(bus_, [this](const ItemRemovedEvent& ev) {
        on_item_removed(ev.item_id);
    }));

    clusters_.restore(store_.load_clusters());
}

Engine::~Engine() {
    pool_.reset();
    subscriptions_.clear();
    store_.set_event_bus(nullptr);
}

// ── Catalog ─────────────────────────────────────────────────────

void Engine::invalidate_catalog() {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    catalog_.reset();
}

ItemCatalog Engine::catalog() const {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    if (!catalog_) {
        catalog_ = std::make_shared<const std::vector<Item>>(store_.all_items());
    }
    return catalog_;
}

ItemLookup Engine::lookup() {
    return [this](const ItemId& id) { return store_.get_item(id); };
}

// ── Queries ─────────────────────────────────────────────────────

SearchOutcome Engine::search(const std::string& query, const SearchFilters& filters) const {
    return search_.search(query, catalog(), filters);
}

std::vector<Cluster> Engine::list_clusters() const {
    return clusters_.clusters();
}

std::optional<Cluster> Engine::get_cluster(const ClusterId& id) const {
    return clusters_.cluster(id);
}

EngineStats Engine::stats() const {
    EngineStats s;
    auto items = catalog();
    s.items = items->size();
    for (const auto& item : *items) {
        if (item.has_embedding()) s.embedded++;
        if (item.cluster_id) s.clustered_items++;
    }
    s.indexed = index_.size();
    s.tombstones = index_.tombstones();
    s.clusters = clusters_.cluster_count();
    return s;
}

// ── Library changes ─────────────────────────────────────────────

void Engine::add_item(Item item) {
    refresh_text_content(item);
    if (item.added_at == 0) item.added_at = epoch_seconds();
    // Cluster membership belongs to the engine, so an update keeps it
    item.cluster_id = clusters_.cluster_of(item.id);
    store_.put_item(item);
}

bool Engine::remove_item(const ItemId& id) {
    return store_.remove_item(id);
}

bool Engine::embed_and_store(Item& item) {
    if (item.text_content.empty()) refresh_text_content(item);
    auto result = embedding_.embed(item.text_content);

    ItemEmbeddedEvent ev;
    ev.item_id = item.id;
    ev.success = result.ok();
    if (!result.ok()) {
        ev.error = embedding_error_to_string(result.error);
        std::cerr << "[engine] Embedding " << item.id << " failed: " << ev.error;
        if (!result.cause.empty()) std::cerr << " (" << result.cause << ")";
        std::cerr << "\n";
        bus_.publish(ev);
        return false;
    }

    item.embedding = std::move(result.vector);
    item.needs_indexing = true;
    store_.update_embedding(item.id, *item.embedding);
    bus_.publish(ev);
    return true;
}

bool Engine::index_item(const Item& item) {
    if (!item.has_embedding()) return false;
    IndexStatus status = index_.insert(item.id, *item.embedding);
    if (status != IndexStatus::Ok) {
        std::cerr << "[engine] Cannot index " << item.id << ": "
                  << index_status_to_string(status) << "\n";
        return false;
    }
    store_.set_needs_indexing(item.id, false);
    return true;
}

void Engine::compact_if_needed() {
    size_t dead = index_.tombstones();
    if (dead > 64 && dead > index_.size() / 2) {
        size_t reclaimed = index_.compact();
        std::cerr << "[engine] Compacted index, reclaimed " << reclaimed << " slots\n";
    }
}

void Engine::on_item_changed(const ItemId& id, bool metadata_changed) {
    auto item = store_.get_item(id);
    if (!item) return;

    bool reembedded = false;
    if (metadata_changed || !item->has_embedding()) {
        reembedded = embed_and_store(*item);
        if (!reembedded && metadata_changed && item->has_embedding()) {
            std::cerr << "[engine] Keeping previous embedding for " << id << "\n";
        }
    }
    if (item->has_embedding()) index_item(*item);
    if (reembedded && clusters_.refresh_member(id, lookup())) {
        persist_clusters();
        return;
    }
    invalidate_catalog();
}

void Engine::on_item_removed(const ItemId& id) {
    index_.remove(id);
    if (clusters_.evict(id, lookup())) persist_clusters();
    compact_if_needed();
    invalidate_catalog();
}

EmbedSummary Engine::embed_pending() {
    EmbedSummary summary;
    auto items = store_.all_items();

    std::vector<Item*> pending;
    std::vector<std::string> texts;
    for (auto& item : items) {
        if (item.has_embedding()) continue;
        if (item.text_content.empty()) refresh_text_content(item);
        pending.push_back(&item);
        texts.push_back(item.text_content);
    }

    auto results = embedding_.embed_batch(texts);
    for (size_t i = 0; i < pending.size(); i++) {
        Item& item = *pending[i];
        ItemEmbeddedEvent ev;
        ev.item_id = item.id;
        ev.success = results[i].ok();
        if (results[i].ok()) {
            item.embedding = std::move(results[i].vector);
            item.needs_indexing = true;
            store_.update_embedding(item.id, *item.embedding);
            summary.embedded++;
        } else {
            ev.error = embedding_error_to_string(results[i].error);
            summary.failed++;
        }
        bus_.publish(ev);
    }

    for (const auto& item : items) {
        if (!item.has_embedding()) continue;
        if (item.needs_indexing || !index_.contains(item.id)) {
            if (index_item(item)) summary.indexed++;
        }
    }

    if (summary.failed > 0) {
        std::cerr << "[engine] " << summary.failed << " item(s) could not be embedded\n";
    }
    invalidate_catalog();
    return summary;
}

std::future<EmbedSummary> Engine::embed_pending_async() {
    return pool_->submit([this]() { return embed_pending(); });
}

// ── Index ───────────────────────────────────────────────────────

size_t Engine::rebuild_index() {
    auto items = store_.all_items_with_embeddings();
    index_.clear();
    size_t indexed = 0;
    for (const auto& item : items) {
        if (index_item(item)) indexed++;
    }

    IndexRebuiltEvent ev;
    ev.item_count = indexed;
    bus_.publish(ev);
    return indexed;
}

std::future<size_t> Engine::rebuild_index_async() {
    return pool_->submit([this]() { return rebuild_index(); });
}

bool Engine::save_index() const {
    return index_.save(config_.snapshot_path());
}

bool Engine::load_index() {
    if (!index_.load(config_.snapshot_path())) {
        std::cerr << "[engine] No usable index snapshot, rebuilding\n";
        rebuild_index();
        return false;
    }

    // The store is authoritative: drop what it no longer has, add what the
    // snapshot missed or holds stale.
    auto items = store_.all_items_with_embeddings();
    std::unordered_set<ItemId> live;
    for (const auto& item : items) live.insert(item.id);

    size_t dropped = 0;
    for (const auto& id : index_.ids()) {
        if (!live.count(id)) {
            index_.remove(id);
            dropped++;
        }
    }
    size_t added = 0;
    for (const auto& item : items) {
        if (item.needs_indexing || !index_.contains(item.id)) {
            if (index_item(item)) added++;
        }
    }
    if (dropped || added) {
        std::cerr << "[engine] Reconciled snapshot: " << dropped << " dropped, "
                  << added << " added\n";
    }
    compact_if_needed();
    return true;
}

// ── Clustering ──────────────────────────────────────────────────

ClusterPassResult Engine::recluster(const TaskHandle& task) {
    std::lock_guard<std::mutex> pass_lock(pass_mutex_);
    ClusterPassResult result;
    if (task.cancelled()) {
        result.cancelled = true;
        return result;
    }

    try {
        auto items = store_.all_items_with_embeddings();
        KnnGraph graph = build_graph(items, index_, config_.graph.k);
        result = clusters_.run_pass(items, graph, task);
    } catch (const std::bad_alloc&) {
        std::cerr << "[engine] Out of memory building the similarity graph\n";
        result = ClusterPassResult{};
        result.error = "out of memory";
        return result;
    }

    if (result.cancelled) {
        std::cerr << "[engine] Clustering pass cancelled\n";
        return result;
    }
    if (!result.ok) return result;

    persist_clusters();
    std::cerr << "[engine] Clustered " << result.clustered_items << " items into "
              << result.cluster_count << " clusters (modularity " << result.modularity
              << ", " << result.retained_ids << " ids kept)\n";

    ClustersUpdatedEvent ev;
    ev.cluster_count = result.cluster_count;
    ev.item_count = result.clustered_items;
    ev.modularity = result.modularity;
    bus_.publish(ev);
    return result;
}

std::future<ClusterPassResult> Engine::recluster_async() {
    TaskHandle task;
    {
        std::lock_guard<std::mutex> lock(current_pass_mutex_);
        current_pass_.cancel();
        current_pass_ = task;
    }
    return pool_->submit([this, task]() { return recluster(task); });
}

bool Engine::should_recluster() const {
    return clusters_.should_recluster(index_.size());
}

void Engine::persist_clusters() {
    store_.save_clusters(clusters_.clusters());
    invalidate_catalog();
}

bool Engine::merge_clusters(const ClusterId& into, const ClusterId& from) {
    if (!clusters_.merge(into, from, lookup())) return false;
    persist_clusters();
    return true;
}

std::optional<ClusterId> Engine::split_cluster(const ClusterId& cluster,
                                               const std::vector<ItemId>& item_ids) {
    auto id = clusters_.split(cluster, item_ids, lookup());
    if (id) persist_clusters();
    return id;
}

bool Engine::evict_item(const ItemId& item) {
    if (!clusters_.evict(item, lookup())) return false;
    persist_clusters();
    return true;
}

bool Engine::rename_cluster(const ClusterId& cluster, const std::string& label) {
    if (!clusters_.rename(cluster, label)) return false;
    persist_clusters();
    return true;
}

} // namespace clipmind
