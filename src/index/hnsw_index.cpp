#include "hnsw_index.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <mutex>
#include <queue>
#include <sstream>
#include <unordered_set>

namespace clipmind {

std::string index_status_to_string(IndexStatus status) {
    switch (status) {
        case IndexStatus::Ok:                return "ok";
        case IndexStatus::DimensionMismatch: return "dimension mismatch";
        case IndexStatus::EmptyVector:       return "empty vector";
    }
    return "unknown";
}

namespace {

double inverse_norm(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    if (sum <= 0.0) return 0.0;
    return 1.0 / std::sqrt(sum);
}

double dot(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return sum;
}

// ── Snapshot encoding ───────────────────────────────────────────

const char kMagic[6] = {'C', 'M', 'H', 'N', 'S', 'W'};
constexpr uint16_t kSnapshotVersion = 1;

template <typename T>
void put(std::string& out, const T& value) {
    out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

void put_string(std::string& out, const std::string& s) {
    put<uint32_t>(out, static_cast<uint32_t>(s.size()));
    out.append(s);
}

struct Reader {
    const std::string& data;
    size_t pos = 0;
    bool failed = false;

    explicit Reader(const std::string& d) : data(d) {}

    size_t remaining() const { return failed ? 0 : data.size() - pos; }

    template <typename T>
    T get() {
        T value{};
        if (remaining() < sizeof(T)) {
            failed = true;
            return value;
        }
        std::memcpy(&value, data.data() + pos, sizeof(T));
        pos += sizeof(T);
        return value;
    }

    std::string get_string() {
        uint32_t len = get<uint32_t>();
        if (remaining() < len) {
            failed = true;
            return {};
        }
        std::string s = data.substr(pos, len);
        pos += len;
        return s;
    }

    bool get_floats(Embedding& out, size_t count) {
        if (remaining() / sizeof(float) < count) {
            failed = true;
            return false;
        }
        out.resize(count);
        if (count > 0) std::memcpy(out.data(), data.data() + pos, count * sizeof(float));
        pos += count * sizeof(float);
        return true;
    }
};

} // namespace

// ── Construction ────────────────────────────────────────────────

HnswIndex::HnswIndex(uint32_t dimensions, HnswParams params)
    : initial_dim_(dimensions), dim_(dimensions), params_(params), rng_(params.seed) {
    if (params_.m < 2) params_.m = 2;
    if (params_.ef_construction == 0) params_.ef_construction = 1;
    if (params_.ef_search == 0) params_.ef_search = 1;
    level_mult_ = 1.0 / std::log(static_cast<double>(params_.m));
}

int HnswIndex::random_level() {
    // Uniform in (0, 1), never exactly 0 so the log stays finite
    double u = (static_cast<double>(rng_() >> 11) + 0.5) * (1.0 / 9007199254740992.0);
    int level = static_cast<int>(std::floor(-std::log(u) * level_mult_));
    return std::min(level, kMaxLevel);
}

double HnswIndex::similarity(const Embedding& q, double q_inv, uint32_t node) const {
    const Node& n = nodes_[node];
    if (q_inv == 0.0 || n.inv_norm == 0.0) return 0.0;
    return dot(q, n.vec) * q_inv * n.inv_norm;
}

double HnswIndex::node_similarity(uint32_t a, uint32_t b) const {
    return similarity(nodes_[a].vec, nodes_[a].inv_norm, b);
}

// ── Graph search ────────────────────────────────────────────────

std::vector<HnswIndex::Candidate> HnswIndex::search_layer(
        const Embedding& q, double q_inv,
        const std::vector<uint32_t>& entry_points,
        size_t ef, int layer) const {
    // Strict total order so traversal is reproducible: higher similarity wins,
    // equal similarity goes to the lower slot.
    auto better = [](const Candidate& a, const Candidate& b) {
        if (a.sim != b.sim) return a.sim > b.sim;
        return a.node < b.node;
    };
    auto best_on_top = [&](const Candidate& a, const Candidate& b) { return better(b, a); };
    auto worst_on_top = [&](const Candidate& a, const Candidate& b) { return better(a, b); };

    std::priority_queue<Candidate, std::vector<Candidate>, decltype(best_on_top)> candidates(best_on_top);
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(worst_on_top)> results(worst_on_top);
    std::unordered_set<uint32_t> visited;
    visited.reserve(ef * 4 + 16);

    for (uint32_t ep : entry_points) {
        if (nodes_[ep].deleted || !visited.insert(ep).second) continue;
        Candidate c{similarity(q, q_inv, ep), ep};
        candidates.push(c);
        results.push(c);
        if (results.size() > ef) results.pop();
    }

    while (!candidates.empty()) {
        Candidate current = candidates.top();
        if (results.size() >= ef && better(results.top(), current)) break;
        candidates.pop();

        const Node& node = nodes_[current.node];
        if (layer >= static_cast<int>(node.links.size())) continue;

        for (uint32_t neighbor : node.links[layer]) {
            if (!visited.insert(neighbor).second) continue;
            if (nodes_[neighbor].deleted) continue;
            Candidate c{similarity(q, q_inv, neighbor), neighbor};
            if (results.size() < ef || better(c, results.top())) {
                candidates.push(c);
                results.push(c);
                if (results.size() > ef) results.pop();
            }
        }
    }

    std::vector<Candidate> out;
    out.reserve(results.size());
    while (!results.empty()) {
        out.push_back(results.top());
        results.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

uint32_t HnswIndex::descend(const Embedding& q, double q_inv, int target_layer) const {
    uint32_t ep = entry_point_;
    for (int layer = max_level_; layer > target_layer; --layer) {
        auto closest = search_layer(q, q_inv, {ep}, 1, layer);
        if (!closest.empty()) ep = closest.front().node;
    }
    return ep;
}

// Heuristic selection: a candidate is kept only if it is closer to `base`
// than to any neighbour already chosen. Pruned candidates backfill free slots.
std::vector<uint32_t> HnswIndex::select_neighbors(uint32_t base,
                                                  const std::vector<Candidate>& candidates,
                                                  size_t max_count) const {
    std::vector<uint32_t> selected;
    std::vector<uint32_t> pruned;
    selected.reserve(max_count);

    for (const auto& c : candidates) {
        if (c.node == base || nodes_[c.node].deleted) continue;
        if (selected.size() >= max_count) break;
        bool diverse = true;
        for (uint32_t s : selected) {
            if (node_similarity(c.node, s) > c.sim) {
                diverse = false;
                break;
            }
        }
        if (diverse) selected.push_back(c.node);
        else pruned.push_back(c.node);
    }

    for (uint32_t p : pruned) {
        if (selected.size() >= max_count) break;
        selected.push_back(p);
    }
    return selected;
}

void HnswIndex::shrink_links(uint32_t node, int layer) {
    auto& links = nodes_[node].links[layer];
    if (links.size() <= max_degree(layer)) return;

    std::vector<Candidate> candidates;
    candidates.reserve(links.size());
    for (uint32_t l : links) candidates.push_back({node_similarity(node, l), l});
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.sim != b.sim) return a.sim > b.sim;
        return a.node < b.node;
    });
    nodes_[node].links[layer] = select_neighbors(node, candidates, max_degree(layer));
}

void HnswIndex::connect(uint32_t from, uint32_t to, int layer) {
    auto& links = nodes_[from].links[layer];
    if (std::find(links.begin(), links.end(), to) != links.end()) return;
    links.push_back(to);
    shrink_links(from, layer);
}

// Called after `node` lost its link to a removed node: reselect from its
// remaining links plus the removed node's links on that layer.
void HnswIndex::repair_links(uint32_t node, int layer,
                             const std::vector<uint32_t>& orphaned_from) {
    std::unordered_set<uint32_t> pool(nodes_[node].links[layer].begin(),
                                      nodes_[node].links[layer].end());
    for (uint32_t c : orphaned_from) {
        if (c == node || nodes_[c].deleted) continue;
        if (static_cast<int>(nodes_[c].links.size()) <= layer) continue;
        pool.insert(c);
    }

    std::vector<Candidate> candidates;
    candidates.reserve(pool.size());
    for (uint32_t c : pool) candidates.push_back({node_similarity(node, c), c});
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.sim != b.sim) return a.sim > b.sim;
        return a.node < b.node;
    });

    std::vector<uint32_t> previous = nodes_[node].links[layer];
    nodes_[node].links[layer] = select_neighbors(node, candidates, max_degree(layer));

    // New neighbours link back so the repaired node stays reachable
    for (uint32_t n : nodes_[node].links[layer]) {
        if (std::find(previous.begin(), previous.end(), n) == previous.end()) {
            connect(n, node, layer);
        }
    }
}

// ── Mutation ────────────────────────────────────────────────────

IndexStatus HnswIndex::insert(const ItemId& id, const Embedding& vector) {
    if (vector.empty()) return IndexStatus::EmptyVector;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (dim_ == 0) dim_ = static_cast<uint32_t>(vector.size());
    if (vector.size() != dim_) return IndexStatus::DimensionMismatch;

    remove_locked(id);

    uint32_t idx = static_cast<uint32_t>(nodes_.size());
    Node node;
    node.id = id;
    node.vec = vector;
    node.inv_norm = inverse_norm(vector);
    node.level = random_level();
    node.links.resize(static_cast<size_t>(node.level) + 1);
    nodes_.push_back(std::move(node));
    id_to_node_[id] = idx;

    int level = nodes_[idx].level;
    if (entry_point_ == kNone) {
        entry_point_ = idx;
        max_level_ = level;
        return IndexStatus::Ok;
    }

    const Embedding& q = nodes_[idx].vec;
    double q_inv = nodes_[idx].inv_norm;

    std::vector<uint32_t> entry_points{descend(q, q_inv, level)};
    for (int layer = std::min(level, max_level_); layer >= 0; --layer) {
        auto found = search_layer(q, q_inv, entry_points, params_.ef_construction, layer);
        nodes_[idx].links[layer] = select_neighbors(idx, found, params_.m);
        for (uint32_t neighbor : nodes_[idx].links[layer]) {
            connect(neighbor, idx, layer);
        }
        entry_points.clear();
        for (const auto& c : found) entry_points.push_back(c.node);
    }

    if (level > max_level_) {
        entry_point_ = idx;
        max_level_ = level;
    }
    return IndexStatus::Ok;
}

bool HnswIndex::remove(const ItemId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return remove_locked(id);
}

bool HnswIndex::remove_locked(const ItemId& id) {
    auto it = id_to_node_.find(id);
    if (it == id_to_node_.end()) return false;

    uint32_t idx = it->second;
    id_to_node_.erase(it);
    Node& removed = nodes_[idx];
    removed.deleted = true;
    removed.inv_norm = 0.0;
    tombstones_++;

    std::vector<std::vector<uint32_t>> orphaned = std::move(removed.links);
    removed.links.assign(orphaned.size(), {});
    removed.vec.clear();
    removed.vec.shrink_to_fit();

    // Strip every in-link and reconnect the nodes that lost one
    for (uint32_t j = 0; j < nodes_.size(); j++) {
        if (j == idx || nodes_[j].deleted) continue;
        int top = std::min(nodes_[j].level, static_cast<int>(orphaned.size()) - 1);
        for (int layer = 0; layer <= top; layer++) {
            auto& links = nodes_[j].links[layer];
            auto pos = std::find(links.begin(), links.end(), idx);
            if (pos == links.end()) continue;
            links.erase(pos);
            repair_links(j, layer, orphaned[layer]);
        }
    }

    if (entry_point_ == idx) elect_entry_point();
    return true;
}

void HnswIndex::elect_entry_point() {
    entry_point_ = kNone;
    max_level_ = -1;
    for (uint32_t i = 0; i < nodes_.size(); i++) {
        if (nodes_[i].deleted) continue;
        if (nodes_[i].level > max_level_) {
            max_level_ = nodes_[i].level;
            entry_point_ = i;
        }
    }
}

size_t HnswIndex::compact() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return compact_locked();
}

size_t HnswIndex::compact_locked() {
    if (tombstones_ == 0) return 0;

    std::vector<uint32_t> remap(nodes_.size(), kNone);
    std::vector<Node> kept;
    kept.reserve(nodes_.size() - tombstones_);
    for (uint32_t i = 0; i < nodes_.size(); i++) {
        if (nodes_[i].deleted) continue;
        remap[i] = static_cast<uint32_t>(kept.size());
        kept.push_back(std::move(nodes_[i]));
    }

    for (auto& node : kept) {
        for (auto& layer : node.links) {
            std::vector<uint32_t> renumbered;
            renumbered.reserve(layer.size());
            for (uint32_t l : layer) {
                if (remap[l] != kNone) renumbered.push_back(remap[l]);
            }
            layer = std::move(renumbered);
        }
    }

    id_to_node_.clear();
    for (uint32_t i = 0; i < kept.size(); i++) id_to_node_[kept[i].id] = i;
    entry_point_ = entry_point_ == kNone ? kNone : remap[entry_point_];

    size_t reclaimed = tombstones_;
    nodes_ = std::move(kept);
    tombstones_ = 0;
    return reclaimed;
}

void HnswIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    reset_locked();
    dim_ = initial_dim_;
}

void HnswIndex::reset_locked() {
    nodes_.clear();
    id_to_node_.clear();
    entry_point_ = kNone;
    max_level_ = -1;
    tombstones_ = 0;
    rng_.seed(params_.seed);
}

// ── Query ───────────────────────────────────────────────────────

std::vector<ScoredId> HnswIndex::query(const Embedding& vector, size_t k) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (k == 0 || vector.empty() || entry_point_ == kNone) return {};
    if (vector.size() != dim_) {
        std::cerr << "[index] Query has " << vector.size()
                  << " dimensions, index has " << dim_ << "\n";
        return {};
    }

    double q_inv = inverse_norm(vector);
    size_t ef = std::max<size_t>(params_.ef_search, k);
    uint32_t ep = descend(vector, q_inv, 0);
    auto found = search_layer(vector, q_inv, {ep}, ef, 0);

    std::vector<ScoredId> results;
    results.reserve(found.size());
    for (const auto& c : found) {
        if (nodes_[c.node].deleted) continue;
        results.push_back({nodes_[c.node].id, c.sim});
    }
    std::sort(results.begin(), results.end(), [](const ScoredId& a, const ScoredId& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
    if (results.size() > k) results.resize(k);
    return results;
}

// ── Accessors ───────────────────────────────────────────────────

size_t HnswIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return id_to_node_.size();
}

size_t HnswIndex::tombstones() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tombstones_;
}

uint32_t HnswIndex::dimensions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return dim_;
}

bool HnswIndex::contains(const ItemId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return id_to_node_.count(id) > 0;
}

std::vector<ItemId> HnswIndex::ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ItemId> out;
    out.reserve(id_to_node_.size());
    for (const auto& node : nodes_) {
        if (!node.deleted) out.push_back(node.id);
    }
    return out;
}

std::optional<Embedding> HnswIndex::vector(const ItemId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = id_to_node_.find(id);
    if (it == id_to_node_.end()) return std::nullopt;
    return nodes_[it->second].vec;
}

HnswParams HnswIndex::params() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return params_;
}

void HnswIndex::set_ef_search(uint32_t ef) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    params_.ef_search = ef == 0 ? 1 : ef;
}

// ── Snapshot ────────────────────────────────────────────────────
//
// Layout (little-endian host order):
//   "CMHNSW" u16 version
//   u32 dim  u32 m  u32 ef_construction  u32 ef_search  u64 seed
//   u32 node_count  u32 entry_point  i32 max_level
//   string rng_state
//   per node: string id  i32 level  f32[dim]  per layer: u32 n  u32[n]
//
// Tombstones are dropped on write, so slots are renumbered densely.

std::string HnswIndex::serialize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<uint32_t> remap(nodes_.size(), kNone);
    uint32_t live = 0;
    for (uint32_t i = 0; i < nodes_.size(); i++) {
        if (!nodes_[i].deleted) remap[i] = live++;
    }

    std::string out;
    out.reserve(64 + static_cast<size_t>(live) * (dim_ * sizeof(float) + 64));
    out.append(kMagic, sizeof(kMagic));
    put<uint16_t>(out, kSnapshotVersion);
    put<uint32_t>(out, dim_);
    put<uint32_t>(out, params_.m);
    put<uint32_t>(out, params_.ef_construction);
    put<uint32_t>(out, params_.ef_search);
    put<uint64_t>(out, params_.seed);
    put<uint32_t>(out, live);
    put<uint32_t>(out, entry_point_ == kNone ? kNone : remap[entry_point_]);
    put<int32_t>(out, max_level_);

    std::ostringstream rng_state;
    rng_state << rng_;
    put_string(out, rng_state.str());

    for (const auto& node : nodes_) {
        if (node.deleted) continue;
        put_string(out, node.id);
        put<int32_t>(out, node.level);
        out.append(reinterpret_cast<const char*>(node.vec.data()), node.vec.size() * sizeof(float));
        for (const auto& layer : node.links) {
            std::vector<uint32_t> renumbered;
            renumbered.reserve(layer.size());
            for (uint32_t l : layer) {
                if (remap[l] != kNone) renumbered.push_back(remap[l]);
            }
            put<uint32_t>(out, static_cast<uint32_t>(renumbered.size()));
            for (uint32_t l : renumbered) put<uint32_t>(out, l);
        }
    }
    return out;
}

bool HnswIndex::deserialize(const std::string& blob) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    reset_locked();

    auto corrupt = [&](const char* what) {
        std::cerr << "[index] Corrupt snapshot: " << what << "\n";
        reset_locked();
        dim_ = initial_dim_;
        return false;
    };

    if (blob.size() < sizeof(kMagic) || std::memcmp(blob.data(), kMagic, sizeof(kMagic)) != 0) {
        return corrupt("bad magic");
    }
    Reader in(blob);
    in.pos = sizeof(kMagic);

    if (in.get<uint16_t>() != kSnapshotVersion) return corrupt("unsupported version");

    uint32_t dim = in.get<uint32_t>();
    HnswParams params;
    params.m = in.get<uint32_t>();
    params.ef_construction = in.get<uint32_t>();
    params.ef_search = in.get<uint32_t>();
    params.seed = in.get<uint64_t>();
    uint32_t count = in.get<uint32_t>();
    uint32_t entry = in.get<uint32_t>();
    int32_t max_level = in.get<int32_t>();
    std::string rng_state = in.get_string();
    if (in.failed) return corrupt("truncated header");

    if (params.m < 2 || params.ef_construction == 0 || params.ef_search == 0) {
        return corrupt("invalid parameters");
    }
    if (count > 0 && (dim == 0 || entry >= count || max_level < 0 || max_level > kMaxLevel)) {
        return corrupt("invalid entry point");
    }
    if (count == 0 && entry != kNone) return corrupt("entry point in empty index");
    // Every node carries at least its id length, level and vector
    if (static_cast<uint64_t>(count) * (8 + static_cast<uint64_t>(dim) * sizeof(float)) > in.remaining()) {
        return corrupt("node count exceeds payload");
    }

    std::vector<Node> nodes(count);
    std::unordered_map<ItemId, uint32_t> id_to_node;
    id_to_node.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        Node& node = nodes[i];
        node.id = in.get_string();
        int32_t level = in.get<int32_t>();
        if (in.failed) return corrupt("truncated node");
        if (level < 0 || level > max_level) return corrupt("node level out of range");
        node.level = level;
        if (!in.get_floats(node.vec, dim)) return corrupt("truncated vector");
        node.inv_norm = inverse_norm(node.vec);
        node.links.resize(static_cast<size_t>(level) + 1);
        for (auto& layer : node.links) {
            uint32_t n = in.get<uint32_t>();
            if (in.failed || n > in.remaining() / sizeof(uint32_t)) return corrupt("truncated links");
            layer.reserve(n);
            for (uint32_t k = 0; k < n; k++) {
                uint32_t target = in.get<uint32_t>();
                if (target >= count || target == i) return corrupt("link out of range");
                layer.push_back(target);
            }
        }
        if (!id_to_node.emplace(node.id, i).second) return corrupt("duplicate id");
    }
    if (in.pos != blob.size()) return corrupt("trailing bytes");

    // Links may only point at nodes that exist on that layer
    for (const auto& node : nodes) {
        for (size_t layer = 0; layer < node.links.size(); layer++) {
            for (uint32_t target : node.links[layer]) {
                if (nodes[target].level < static_cast<int>(layer)) return corrupt("link above target level");
            }
        }
    }
    if (count > 0 && nodes[entry].level != max_level) return corrupt("entry point not on top layer");

    dim_ = dim;
    params_ = params;
    level_mult_ = 1.0 / std::log(static_cast<double>(params_.m));
    nodes_ = std::move(nodes);
    id_to_node_ = std::move(id_to_node);
    entry_point_ = count > 0 ? entry : kNone;
    max_level_ = count > 0 ? max_level : -1;

    std::istringstream rng_in(rng_state);
    rng_in >> rng_;
    if (rng_in.fail()) rng_.seed(params_.seed);
    return true;
}

bool HnswIndex::save(const std::string& path) const {
    if (!atomic_write_file(path, serialize())) {
        std::cerr << "[index] Failed to write snapshot: " << path << "\n";
        return false;
    }
    return true;
}

bool HnswIndex::load(const std::string& path) {
    std::string blob;
    if (!read_file(path, blob)) return false;
    return deserialize(blob);
}

} // namespace clipmind
