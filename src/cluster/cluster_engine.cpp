#include "cluster_engine.hpp"
#include "keywords.hpp"
#include "leiden.hpp"
#include "../util.hpp"
#include "../vector_math.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <new>
#include <set>

namespace clipmind {

double centroid_confidence(const std::vector<const Embedding*>& members, const Embedding& centroid) {
    if (members.empty() || centroid.empty()) return 0.0;
    double sum = 0.0;
    for (const Embedding* m : members) sum += cosine_similarity(*m, centroid);
    double mean = sum / static_cast<double>(members.size());
    return std::min(1.0, std::max(0.0, mean));
}

std::string centroid_tag(const Embedding& centroid) {
    // FNV-1a over the centroid rounded to two decimals
    uint32_t hash = 2166136261u;
    for (float x : centroid) {
        auto q = static_cast<int32_t>(std::lround(static_cast<double>(x) * 100.0));
        for (int b = 0; b < 4; b++) {
            hash ^= static_cast<uint8_t>((static_cast<uint32_t>(q) >> (8 * b)) & 0xFF);
            hash *= 16777619u;
        }
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04x", static_cast<unsigned>((hash ^ (hash >> 16)) & 0xFFFF));
    return buf;
}

namespace {

// Base label, then "<label> #xxxx", then "<label> #xxxx 2", "... 3", ...
std::string disambiguate(const std::string& base, const Embedding& centroid,
                         const std::set<std::string>& issued) {
    if (!issued.count(base)) return base;
    std::string tagged = base + " #" + centroid_tag(centroid);
    if (!issued.count(tagged)) return tagged;
    for (size_t n = 2;; n++) {
        std::string candidate = tagged + " " + std::to_string(n);
        if (!issued.count(candidate)) return candidate;
    }
}

std::vector<const Embedding*> member_vectors(const std::vector<ItemId>& members,
                                             const std::unordered_map<ItemId, const Item*>& by_id) {
    std::vector<const Embedding*> out;
    out.reserve(members.size());
    for (const auto& id : members) {
        auto it = by_id.find(id);
        if (it != by_id.end() && it->second->has_embedding()) out.push_back(&*it->second->embedding);
    }
    return out;
}

uint64_t parse_cluster_number(const ClusterId& id) {
    if (id.size() < 2 || id[0] != 'c') return 0;
    uint64_t n = 0;
    for (size_t i = 1; i < id.size(); i++) {
        if (id[i] < '0' || id[i] > '9') return 0;
        n = n * 10 + static_cast<uint64_t>(id[i] - '0');
    }
    return n;
}

} // namespace

ClusterEngine::ClusterEngine(ClusterConfig config) : config_(config) {
    config_.label_terms = std::min<uint32_t>(5, std::max<uint32_t>(3, config_.label_terms));
}

ClusterId ClusterEngine::next_cluster_id_locked() {
    return "c" + std::to_string(next_id_++);
}

// ── Clustering pass ─────────────────────────────────────────────

ClusterPassResult ClusterEngine::run_pass(const std::vector<Item>& items, const KnnGraph& graph,
                                          const TaskHandle& task) {
    ClusterPassResult result;

    try {
        LeidenParams params;
        params.resolution = config_.resolution;
        params.max_iterations = config_.max_iterations;
        params.min_modularity_gain = config_.min_modularity_gain;

        LeidenResult partition = run_leiden(graph, params, task);
        if (partition.cancelled) {
            result.cancelled = true;
            return result;
        }
        result.modularity = partition.modularity;
        result.iterations = partition.iterations;

        std::unordered_map<ItemId, const Item*> by_id;
        by_id.reserve(items.size());
        for (const auto& item : items) by_id[item.id] = &item;

        // Group graph nodes by community, in community order
        std::vector<Draft> drafts(partition.community_count);
        for (uint32_t slot = 0; slot < partition.membership.size(); slot++) {
            uint32_t c = partition.membership[slot];
            if (c == LeidenResult::kUnassigned) continue;
            const ItemId& id = graph.id_of(slot);
            if (!by_id.count(id)) {
                std::cerr << "[cluster] Graph node " << id << " has no item, skipping\n";
                continue;
            }
            drafts[c].members.push_back(id);
        }

        drafts.erase(std::remove_if(drafts.begin(), drafts.end(), [&](const Draft& d) {
            return d.members.empty() || d.members.size() < config_.min_cluster_size;
        }), drafts.end());

        for (auto& draft : drafts) {
            auto vectors = member_vectors(draft.members, by_id);
            draft.centroid = mean_vector(vectors);
            draft.confidence = centroid_confidence(vectors, draft.centroid);

            std::vector<const std::string*> texts;
            texts.reserve(draft.members.size());
            for (const auto& id : draft.members) texts.push_back(&by_id[id]->text_content);
            draft.terms = top_terms(texts, config_.label_terms);
        }

        if (task.cancelled()) {
            result.cancelled = true;
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        // Greedy one-to-one matching on centroid similarity, best pairs first
        struct Match { double sim; size_t draft; ClusterId prior; };
        std::vector<Match> candidates;
        for (size_t d = 0; d < drafts.size(); d++) {
            for (const auto& [id, prior] : clusters_) {
                double sim = cosine_similarity(drafts[d].centroid, prior.centroid);
                if (sim >= config_.stability_threshold) candidates.push_back({sim, d, id});
            }
        }
        std::sort(candidates.begin(), candidates.end(), [](const Match& a, const Match& b) {
            if (a.sim != b.sim) return a.sim > b.sim;
            if (a.draft != b.draft) return a.draft < b.draft;
            return a.prior < b.prior;
        });

        std::vector<const Cluster*> matched(drafts.size(), nullptr);
        std::set<ClusterId> taken;
        for (const auto& m : candidates) {
            if (matched[m.draft] || taken.count(m.prior)) continue;
            matched[m.draft] = &clusters_.at(m.prior);
            taken.insert(m.prior);
        }

        // Custom labels are reserved before generated ones are issued
        std::set<std::string> issued;
        for (size_t d = 0; d < drafts.size(); d++) {
            if (matched[d] && matched[d]->custom_label) issued.insert(matched[d]->label);
        }

        uint64_t now = epoch_seconds();
        std::map<ClusterId, Cluster> next;
        std::unordered_map<ItemId, ClusterId> next_assignment;
        for (size_t d = 0; d < drafts.size(); d++) {
            Draft& draft = drafts[d];
            Cluster cluster;
            if (matched[d]) {
                cluster.id = matched[d]->id;
                cluster.custom_label = matched[d]->custom_label;
                if (cluster.custom_label) cluster.label = matched[d]->label;
                result.retained_ids++;
            } else {
                cluster.id = next_cluster_id_locked();
            }
            if (!cluster.custom_label) {
                cluster.label = disambiguate(make_label(draft.terms), draft.centroid, issued);
                issued.insert(cluster.label);
            }
            cluster.centroid = std::move(draft.centroid);
            cluster.confidence_score = draft.confidence;
            cluster.item_count = static_cast<uint32_t>(draft.members.size());
            cluster.member_ids = std::move(draft.members);
            cluster.updated_at = now;

            for (const auto& id : cluster.member_ids) next_assignment[id] = cluster.id;
            result.clustered_items += cluster.member_ids.size();
            next.emplace(cluster.id, std::move(cluster));
        }

        clusters_ = std::move(next);
        assignment_ = std::move(next_assignment);
        last_pass_items_ = graph.live_node_count();
        has_run_ = true;
        result.cluster_count = clusters_.size();
        result.ok = true;
    } catch (const std::bad_alloc&) {
        std::cerr << "[cluster] Out of memory during clustering pass, keeping previous clusters\n";
        result.error = "out of memory";
    }
    return result;
}

bool ClusterEngine::should_recluster(size_t current_item_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_run_) return current_item_count > 0;
    if (current_item_count <= last_pass_items_) return false;
    double grown = static_cast<double>(current_item_count - last_pass_items_);
    return grown > config_.recluster_growth * static_cast<double>(last_pass_items_);
}

// ── Accessors ───────────────────────────────────────────────────

std::vector<Cluster> ClusterEngine::clusters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cluster> out;
    out.reserve(clusters_.size());
    for (const auto& [id, c] : clusters_) out.push_back(c);
    std::stable_sort(out.begin(), out.end(), [](const Cluster& a, const Cluster& b) {
        return a.item_count > b.item_count;
    });
    return out;
}

std::optional<Cluster> ClusterEngine::cluster(const ClusterId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clusters_.find(id);
    if (it == clusters_.end()) return std::nullopt;
    return it->second;
}

std::optional<ClusterId> ClusterEngine::cluster_of(const ItemId& item) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assignment_.find(item);
    if (it == assignment_.end()) return std::nullopt;
    return it->second;
}

std::unordered_map<ItemId, ClusterId> ClusterEngine::assignments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assignment_;
}

size_t ClusterEngine::cluster_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clusters_.size();
}

// ── Manual operations ───────────────────────────────────────────

void ClusterEngine::refresh_cluster_locked(Cluster& cluster, const ItemLookup& lookup) {
    std::vector<Embedding> vectors;
    vectors.reserve(cluster.member_ids.size());
    for (const auto& id : cluster.member_ids) {
        auto item = lookup ? lookup(id) : std::nullopt;
        if (item && item->has_embedding()) vectors.push_back(std::move(*item->embedding));
    }
    std::vector<const Embedding*> ptrs;
    ptrs.reserve(vectors.size());
    for (const auto& v : vectors) ptrs.push_back(&v);

    cluster.centroid = mean_vector(ptrs);
    cluster.confidence_score = centroid_confidence(ptrs, cluster.centroid);
    cluster.item_count = static_cast<uint32_t>(cluster.member_ids.size());
    cluster.updated_at = epoch_seconds();
}

std::string ClusterEngine::unique_label_locked(const std::string& base, const Embedding& centroid,
                                               const ClusterId& exclude) const {
    std::set<std::string> issued;
    for (const auto& [id, c] : clusters_) {
        if (id != exclude) issued.insert(c.label);
    }
    return disambiguate(base, centroid, issued);
}

bool ClusterEngine::merge(const ClusterId& into, const ClusterId& from, const ItemLookup& lookup) {
    if (into == from) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto dst = clusters_.find(into);
    auto src = clusters_.find(from);
    if (dst == clusters_.end() || src == clusters_.end()) return false;

    for (auto& id : src->second.member_ids) {
        assignment_[id] = into;
        dst->second.member_ids.push_back(std::move(id));
    }
    clusters_.erase(src);
    refresh_cluster_locked(dst->second, lookup);
    return true;
}

std::optional<ClusterId> ClusterEngine::split(const ClusterId& cluster,
                                              const std::vector<ItemId>& item_ids,
                                              const ItemLookup& lookup) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clusters_.find(cluster);
    if (it == clusters_.end()) return std::nullopt;

    std::set<ItemId> wanted(item_ids.begin(), item_ids.end());
    std::vector<ItemId> moved;
    std::vector<ItemId> kept;
    for (auto& id : it->second.member_ids) {
        if (wanted.count(id)) moved.push_back(std::move(id));
        else kept.push_back(std::move(id));
    }
    if (moved.empty()) {
        it->second.member_ids = std::move(kept);
        return std::nullopt;
    }

    Cluster fresh;
    fresh.id = next_cluster_id_locked();
    fresh.member_ids = std::move(moved);
    for (const auto& id : fresh.member_ids) assignment_[id] = fresh.id;
    refresh_cluster_locked(fresh, lookup);

    std::vector<std::string> texts;
    texts.reserve(fresh.member_ids.size());
    for (const auto& id : fresh.member_ids) {
        auto item = lookup ? lookup(id) : std::nullopt;
        if (item) texts.push_back(item->text_content);
    }
    std::vector<const std::string*> text_ptrs;
    for (const auto& t : texts) text_ptrs.push_back(&t);

    if (kept.empty()) {
        clusters_.erase(it);
    } else {
        it->second.member_ids = std::move(kept);
        refresh_cluster_locked(it->second, lookup);
    }

    fresh.label = unique_label_locked(make_label(top_terms(text_ptrs, config_.label_terms)),
                                      fresh.centroid, fresh.id);
    ClusterId id = fresh.id;
    clusters_.emplace(id, std::move(fresh));
    return id;
}

std::optional<ClusterId> ClusterEngine::evict(const ItemId& item, const ItemLookup& lookup) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto a = assignment_.find(item);
    if (a == assignment_.end()) return std::nullopt;

    ClusterId from = a->second;
    assignment_.erase(a);

    auto it = clusters_.find(from);
    if (it == clusters_.end()) return from;
    auto& members = it->second.member_ids;
    members.erase(std::remove(members.begin(), members.end(), item), members.end());
    if (members.empty()) {
        clusters_.erase(it);
    } else {
        refresh_cluster_locked(it->second, lookup);
    }
    return from;
}

std::optional<ClusterId> ClusterEngine::refresh_member(const ItemId& item,
                                                       const ItemLookup& lookup) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto a = assignment_.find(item);
    if (a == assignment_.end()) return std::nullopt;
    auto it = clusters_.find(a->second);
    if (it == clusters_.end()) return std::nullopt;
    refresh_cluster_locked(it->second, lookup);
    return a->second;
}

bool ClusterEngine::rename(const ClusterId& cluster, const std::string& label) {
    std::string trimmed = trim(label);
    if (trimmed.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clusters_.find(cluster);
    if (it == clusters_.end()) return false;
    for (const auto& [id, c] : clusters_) {
        if (id != cluster && c.label == trimmed) return false;
    }
    it->second.label = trimmed;
    it->second.custom_label = true;
    it->second.updated_at = epoch_seconds();
    return true;
}

void ClusterEngine::restore(std::vector<Cluster> clusters) {
    std::lock_guard<std::mutex> lock(mutex_);
    clusters_.clear();
    assignment_.clear();
    last_pass_items_ = 0;
    for (auto& c : clusters) {
        if (c.member_ids.empty()) continue;
        next_id_ = std::max(next_id_, parse_cluster_number(c.id) + 1);
        c.item_count = static_cast<uint32_t>(c.member_ids.size());
        for (const auto& id : c.member_ids) assignment_[id] = c.id;
        last_pass_items_ += c.member_ids.size();
        ClusterId id = c.id;
        clusters_.emplace(std::move(id), std::move(c));
    }
    has_run_ = !clusters_.empty();
}

void ClusterEngine::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    clusters_.clear();
    assignment_.clear();
    last_pass_items_ = 0;
    has_run_ = false;
}

} // namespace clipmind
