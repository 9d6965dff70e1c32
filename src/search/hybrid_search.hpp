#pragma once
#include "../config.hpp"
#include "../item.hpp"
#include "../index/hnsw_index.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clipmind {

class EmbeddingService;

enum class FusionStrategy { ReciprocalRank, WeightedSum };

std::string fusion_to_string(FusionStrategy strategy);
// "rrf" / "weighted"; anything else falls back to ReciprocalRank.
FusionStrategy fusion_from_string(const std::string& s);

struct SearchFilters {
    std::optional<double> min_duration;      // seconds, inclusive
    std::optional<double> max_duration;
    std::optional<uint64_t> published_after; // epoch seconds, inclusive
    std::optional<uint64_t> published_before;
    std::optional<ItemSource> source;
    std::optional<ClusterId> cluster_id;
};

struct SearchHit {
    ItemId id;
    double score = 0.0;
    uint32_t keyword_rank = 0;   // 1-based, 0 = not returned by that path
    uint32_t vector_rank = 0;
};

struct SearchOutcome {
    bool ok = true;
    std::string error;
    std::vector<SearchHit> hits;
};

// Immutable item list shared with in-flight searches.
using ItemCatalog = std::shared_ptr<const std::vector<Item>>;

// ── Building blocks ─────────────────────────────────────────────

// Items whose text_content contains at least one term (case-insensitive
// substring). Score = number of terms found. Ordered by score, then newest,
// then id.
std::vector<ScoredId> keyword_rank(const std::vector<std::string>& terms,
                                   const std::vector<Item>& items);

// Σ 1/(k + rank) over the lists an id appears in, ranks 1-based.
std::vector<SearchHit> fuse_reciprocal_rank(const std::vector<ScoredId>& keyword,
                                            const std::vector<ScoredId>& vector,
                                            uint32_t k);

// Each list's scores divided by its maximum, then blended by weight.
std::vector<SearchHit> fuse_weighted(const std::vector<ScoredId>& keyword,
                                     const std::vector<ScoredId>& vector,
                                     double keyword_weight, double vector_weight);

bool passes_filters(const Item& item, const SearchFilters& filters);

// ── Engine ──────────────────────────────────────────────────────

// Runs the keyword and vector paths concurrently and fuses them. The
// embedding service and index must outlive the engine.
class HybridSearchEngine {
public:
    HybridSearchEngine(const EmbeddingService& embedder, const HnswIndex& index,
                       SearchConfig config = {});
    ~HybridSearchEngine();

    HybridSearchEngine(const HybridSearchEngine&) = delete;
    HybridSearchEngine& operator=(const HybridSearchEngine&) = delete;

    // Empty or stopword-only queries return ok with no hits.
    SearchOutcome search(const std::string& query, ItemCatalog catalog,
                         const SearchFilters& filters = {}) const;

    FusionStrategy strategy() const { return strategy_; }
    const SearchConfig& config() const { return config_; }

private:
    struct PathResult {
        std::vector<ScoredId> ranked;
        std::string error;        // non-empty: the path failed
    };

    PathResult vector_path(const std::string& query) const;
    PathResult collect(std::future<PathResult>& future,
                       std::chrono::steady_clock::time_point deadline,
                       const char* name) const;

    const EmbeddingService& embedder_;
    const HnswIndex& index_;
    SearchConfig config_;
    FusionStrategy strategy_;

    // Paths that missed their deadline; reaped on later searches and
    // waited for on destruction.
    mutable std::mutex stragglers_mutex_;
    mutable std::vector<std::future<PathResult>> stragglers_;
};

} // namespace clipmind
