#include "hybrid_search.hpp"
#include "../cluster/keywords.hpp"
#include "../embedding_service.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace clipmind {

std::string fusion_to_string(FusionStrategy strategy) {
    switch (strategy) {
        case FusionStrategy::ReciprocalRank: return "rrf";
        case FusionStrategy::WeightedSum:    return "weighted";
    }
    return "rrf";
}

FusionStrategy fusion_from_string(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "weighted" || v == "weighted_sum") return FusionStrategy::WeightedSum;
    if (v != "rrf" && v != "reciprocal_rank") {
        std::cerr << "[search] Unknown fusion strategy '" << s << "', using rrf\n";
    }
    return FusionStrategy::ReciprocalRank;
}

// ── Keyword path ────────────────────────────────────────────────

static bool contains_ci(const std::string& haystack, const std::string& lower_needle) {
    auto it = std::search(haystack.begin(), haystack.end(),
                          lower_needle.begin(), lower_needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    return it != haystack.end();
}

std::vector<ScoredId> keyword_rank(const std::vector<std::string>& terms,
                                   const std::vector<Item>& items) {
    struct Scored {
        const Item* item;
        uint32_t matches;
    };
    std::vector<Scored> scored;
    if (terms.empty()) return {};

    for (const auto& item : items) {
        uint32_t matches = 0;
        for (const auto& term : terms) {
            if (contains_ci(item.text_content, term)) matches++;
        }
        if (matches > 0) scored.push_back({&item, matches});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.matches != b.matches) return a.matches > b.matches;
        if (a.item->recency() != b.item->recency()) return a.item->recency() > b.item->recency();
        return a.item->id < b.item->id;
    });

    std::vector<ScoredId> out;
    out.reserve(scored.size());
    for (const auto& s : scored) out.push_back({s.item->id, static_cast<double>(s.matches)});
    return out;
}

// ── Fusion ──────────────────────────────────────────────────────

static void sort_hits(std::vector<SearchHit>& hits) {
    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
}

std::vector<SearchHit> fuse_reciprocal_rank(const std::vector<ScoredId>& keyword,
                                            const std::vector<ScoredId>& vector,
                                            uint32_t k) {
    std::unordered_map<ItemId, SearchHit> merged;

    for (size_t i = 0; i < keyword.size(); i++) {
        auto& hit = merged[keyword[i].id];
        hit.id = keyword[i].id;
        if (hit.keyword_rank) continue; // duplicate id within one list
        hit.keyword_rank = static_cast<uint32_t>(i + 1);
        hit.score += 1.0 / (static_cast<double>(k) + static_cast<double>(i + 1));
    }
    for (size_t i = 0; i < vector.size(); i++) {
        auto& hit = merged[vector[i].id];
        hit.id = vector[i].id;
        if (hit.vector_rank) continue;
        hit.vector_rank = static_cast<uint32_t>(i + 1);
        hit.score += 1.0 / (static_cast<double>(k) + static_cast<double>(i + 1));
    }

    std::vector<SearchHit> hits;
    hits.reserve(merged.size());
    for (auto& [id, hit] : merged) hits.push_back(std::move(hit));
    sort_hits(hits);
    return hits;
}

std::vector<SearchHit> fuse_weighted(const std::vector<ScoredId>& keyword,
                                     const std::vector<ScoredId>& vector,
                                     double keyword_weight, double vector_weight) {
    auto max_score = [](const std::vector<ScoredId>& list) {
        double m = 0.0;
        for (const auto& r : list) m = std::max(m, r.score);
        return m;
    };
    double kw_max = max_score(keyword);
    double vec_max = max_score(vector);

    std::unordered_map<ItemId, SearchHit> merged;
    for (size_t i = 0; i < keyword.size(); i++) {
        auto& hit = merged[keyword[i].id];
        hit.id = keyword[i].id;
        if (hit.keyword_rank) continue;
        hit.keyword_rank = static_cast<uint32_t>(i + 1);
        if (kw_max > 0.0) hit.score += keyword_weight * std::max(0.0, keyword[i].score) / kw_max;
    }
    for (size_t i = 0; i < vector.size(); i++) {
        auto& hit = merged[vector[i].id];
        hit.id = vector[i].id;
        if (hit.vector_rank) continue;
        hit.vector_rank = static_cast<uint32_t>(i + 1);
        if (vec_max > 0.0) hit.score += vector_weight * std::max(0.0, vector[i].score) / vec_max;
    }

    std::vector<SearchHit> hits;
    hits.reserve(merged.size());
    for (auto& [id, hit] : merged) hits.push_back(std::move(hit));
    sort_hits(hits);
    return hits;
}

bool passes_filters(const Item& item, const SearchFilters& filters) {
    if (filters.min_duration && item.duration_seconds < *filters.min_duration) return false;
    if (filters.max_duration && item.duration_seconds > *filters.max_duration) return false;
    if (filters.published_after && item.recency() < *filters.published_after) return false;
    if (filters.published_before && item.recency() > *filters.published_before) return false;
    if (filters.source && item.source != *filters.source) return false;
    if (filters.cluster_id && (!item.cluster_id || *item.cluster_id != *filters.cluster_id)) return false;
    return true;
}

// ── HybridSearchEngine ──────────────────────────────────────────

HybridSearchEngine::HybridSearchEngine(const EmbeddingService& embedder, const HnswIndex& index,
                                       SearchConfig config)
    : embedder_(embedder), index_(index), config_(std::move(config)),
      strategy_(fusion_from_string(config_.fusion)) {}

HybridSearchEngine::~HybridSearchEngine() {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    for (auto& f : stragglers_) {
        if (f.valid()) f.wait();
    }
}

HybridSearchEngine::PathResult HybridSearchEngine::vector_path(const std::string& query) const {
    PathResult result;
    auto embedded = embedder_.embed(query);
    if (!embedded.ok()) {
        // Not fatal: search continues on keywords alone
        std::cerr << "[search] Vector path skipped: "
                  << embedding_error_to_string(embedded.error);
        if (!embedded.cause.empty()) std::cerr << " (" << embedded.cause << ")";
        std::cerr << "\n";
        return result;
    }
    result.ranked = index_.query(embedded.vector, config_.vector_top_k);
    return result;
}

HybridSearchEngine::PathResult HybridSearchEngine::collect(
        std::future<PathResult>& future,
        std::chrono::steady_clock::time_point deadline,
        const char* name) const {
    if (config_.path_timeout_ms > 0 &&
        future.wait_until(deadline) != std::future_status::ready) {
        std::cerr << "[search] " << name << " path timed out after "
                  << config_.path_timeout_ms << " ms\n";
        std::lock_guard<std::mutex> lock(stragglers_mutex_);
        stragglers_.push_back(std::move(future));
        PathResult timed_out;
        timed_out.error = std::string(name) + " path timed out";
        return timed_out;
    }
    try {
        return future.get();
    } catch (const std::exception& e) {
        std::cerr << "[search] " << name << " path failed: " << e.what() << "\n";
        PathResult failed;
        failed.error = e.what();
        return failed;
    }
}

SearchOutcome HybridSearchEngine::search(const std::string& query, ItemCatalog catalog,
                                         const SearchFilters& filters) const {
    SearchOutcome outcome;
    std::string trimmed = trim(query);
    if (trimmed.empty()) return outcome;
    // Stopword-only queries still reach the vector path
    auto terms = query_terms(trimmed);
    if (!catalog) catalog = std::make_shared<const std::vector<Item>>();

    {
        std::lock_guard<std::mutex> lock(stragglers_mutex_);
        stragglers_.erase(std::remove_if(stragglers_.begin(), stragglers_.end(), [](auto& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), stragglers_.end());
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.path_timeout_ms);

    auto keyword_future = std::async(std::launch::async, [catalog, terms]() {
        PathResult r;
        r.ranked = keyword_rank(terms, *catalog);
        return r;
    });
    auto vector_future = std::async(std::launch::async, [this, trimmed]() {
        return vector_path(trimmed);
    });

    PathResult keyword = collect(keyword_future, deadline, "keyword");
    PathResult vector = collect(vector_future, deadline, "vector");

    if (!keyword.error.empty() && !vector.error.empty()) {
        outcome.ok = false;
        outcome.error = keyword.error + "; " + vector.error;
        return outcome;
    }
    if (!keyword.error.empty() && vector.ranked.empty()) {
        outcome.ok = false;
        outcome.error = keyword.error;
        return outcome;
    }

    std::vector<SearchHit> fused = strategy_ == FusionStrategy::WeightedSum
        ? fuse_weighted(keyword.ranked, vector.ranked, config_.keyword_weight, config_.vector_weight)
        : fuse_reciprocal_rank(keyword.ranked, vector.ranked, config_.rrf_k);

    std::unordered_set<ItemId> wanted;
    for (const auto& hit : fused) wanted.insert(hit.id);
    std::unordered_map<ItemId, const Item*> by_id;
    for (const auto& item : *catalog) {
        if (wanted.count(item.id)) by_id[item.id] = &item;
    }

    for (auto& hit : fused) {
        if (outcome.hits.size() >= config_.max_results) break;
        auto it = by_id.find(hit.id);
        if (it == by_id.end()) {
            std::cerr << "[search] Index returned unknown item " << hit.id << ", skipping\n";
            continue;
        }
        if (!passes_filters(*it->second, filters)) continue;
        outcome.hits.push_back(std::move(hit));
    }
    return outcome;
}

} // namespace clipmind
