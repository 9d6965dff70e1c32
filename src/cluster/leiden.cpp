#include "leiden.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>

namespace clipmind {

namespace {

constexpr double kEpsilon = 1e-12;
constexpr uint32_t kCancelCheckInterval = 256;

// Working graph for one level. Aggregated levels carry self loops.
struct LevelGraph {
    std::vector<std::vector<std::pair<uint32_t, double>>> adj;
    std::vector<double> self_weight;
    std::vector<double> strength;   // k_i, self loop included
    double total = 0.0;             // 2m

    size_t size() const { return adj.size(); }
};

// Live slots of the kNN graph are packed into [0, n).
LevelGraph from_knn(const KnnGraph& graph, std::vector<uint32_t>& slot_to_node) {
    LevelGraph g;
    slot_to_node.assign(graph.node_count(), LeidenResult::kUnassigned);
    uint32_t n = 0;
    for (uint32_t s = 0; s < graph.node_count(); s++) {
        if (!graph.is_removed(s)) slot_to_node[s] = n++;
    }

    g.adj.resize(n);
    g.self_weight.assign(n, 0.0);
    g.strength.assign(n, 0.0);
    for (uint32_t s = 0; s < graph.node_count(); s++) {
        uint32_t u = slot_to_node[s];
        if (u == LeidenResult::kUnassigned) continue;
        for (const auto& [other, w] : graph.neighbors(s)) {
            uint32_t v = slot_to_node[other];
            if (v == LeidenResult::kUnassigned) continue;
            g.adj[u].emplace_back(v, w);
            g.strength[u] += w;
        }
        // Hash-map iteration order is not stable across runs
        std::sort(g.adj[u].begin(), g.adj[u].end());
        g.total += g.strength[u];
    }
    return g;
}

// Renumber labels 0.. by first appearance. Returns the label count.
uint32_t renumber(std::vector<uint32_t>& labels) {
    std::unordered_map<uint32_t, uint32_t> seen;
    for (auto& l : labels) {
        if (l == LeidenResult::kUnassigned) continue;
        auto it = seen.find(l);
        if (it == seen.end()) {
            uint32_t next = static_cast<uint32_t>(seen.size());
            seen.emplace(l, next);
            l = next;
        } else {
            l = it->second;
        }
    }
    return static_cast<uint32_t>(seen.size());
}

// Scratch space mapping community -> accumulated link weight.
class NeighborWeights {
public:
    explicit NeighborWeights(size_t n) : weight_(n, 0.0), touched_flag_(n, false) {}

    void add(uint32_t c, double w) {
        if (!touched_flag_[c]) {
            touched_flag_[c] = true;
            touched_.push_back(c);
        }
        weight_[c] += w;
    }
    double get(uint32_t c) const { return weight_[c]; }
    const std::vector<uint32_t>& touched() const { return touched_; }

    void reset() {
        for (uint32_t c : touched_) {
            weight_[c] = 0.0;
            touched_flag_[c] = false;
        }
        touched_.clear();
    }

private:
    std::vector<double> weight_;
    std::vector<bool> touched_flag_;
    std::vector<uint32_t> touched_;
};

// Queue-based fast local moving. Returns false when cancelled.
bool move_nodes(const LevelGraph& g, std::vector<uint32_t>& community, double gamma,
                const TaskHandle& task, bool& changed) {
    size_t n = g.size();
    changed = false;
    if (n == 0 || g.total <= 0.0) return true;

    std::vector<double> tot(n, 0.0);
    std::vector<uint32_t> members(n, 0);
    for (uint32_t i = 0; i < n; i++) {
        tot[community[i]] += g.strength[i];
        members[community[i]]++;
    }
    std::vector<uint32_t> empty;
    for (uint32_t c = static_cast<uint32_t>(n); c-- > 0;) {
        if (members[c] == 0) empty.push_back(c);
    }

    std::deque<uint32_t> queue;
    std::vector<bool> queued(n, true);
    for (uint32_t i = 0; i < n; i++) queue.push_back(i);

    NeighborWeights links(n);
    uint32_t processed = 0;

    while (!queue.empty()) {
        if (++processed % kCancelCheckInterval == 0 && task.cancelled()) return false;

        uint32_t i = queue.front();
        queue.pop_front();
        queued[i] = false;

        uint32_t current = community[i];
        double k_i = g.strength[i];

        links.reset();
        links.add(current, 0.0);
        for (const auto& [j, w] : g.adj[i]) links.add(community[j], w);

        tot[current] -= k_i;
        members[current]--;

        uint32_t best = current;
        double best_gain = links.get(current) - gamma * k_i * tot[current] / g.total;
        for (uint32_t c : links.touched()) {
            if (c == current) continue;
            double gain = links.get(c) - gamma * k_i * tot[c] / g.total;
            if (gain > best_gain + kEpsilon) {
                best_gain = gain;
                best = c;
            }
        }
        // Being alone scores 0; take an empty community if everything else is worse
        if (best_gain < -kEpsilon && members[current] > 0) {
            while (!empty.empty() && members[empty.back()] != 0) empty.pop_back();
            if (!empty.empty()) {
                best = empty.back();
                empty.pop_back();
            }
        }

        tot[best] += k_i;
        members[best]++;
        community[i] = best;

        if (best != current) {
            changed = true;
            if (members[current] == 0) empty.push_back(current);
            for (const auto& [j, w] : g.adj[i]) {
                if (!queued[j] && community[j] != best) {
                    queued[j] = true;
                    queue.push_back(j);
                }
            }
        }
    }
    return true;
}

// Split every community into well-connected sub-communities. Nodes start as
// singletons and greedily join the best sub-community of their own community.
// Returns the refined label per node, renumbered from 0.
std::vector<uint32_t> refine(const LevelGraph& g, const std::vector<uint32_t>& community,
                             double gamma) {
    size_t n = g.size();
    std::vector<uint32_t> refined(n);
    for (uint32_t i = 0; i < n; i++) refined[i] = i;
    if (n == 0 || g.total <= 0.0) {
        renumber(refined);
        return refined;
    }

    std::vector<double> community_tot(n, 0.0);
    for (uint32_t i = 0; i < n; i++) community_tot[community[i]] += g.strength[i];

    // ext[r]: weight from sub-community r to the rest of its community
    std::vector<double> tot(n, 0.0);
    std::vector<double> ext(n, 0.0);
    std::vector<bool> singleton(n, true);
    for (uint32_t i = 0; i < n; i++) {
        tot[i] = g.strength[i];
        for (const auto& [j, w] : g.adj[i]) {
            if (community[j] == community[i]) ext[i] += w;
        }
    }

    NeighborWeights links(n);
    for (uint32_t v = 0; v < n; v++) {
        if (!singleton[v]) continue;
        uint32_t c = community[v];
        double k_v = g.strength[v];
        double c_tot = community_tot[c];

        // v itself must be well connected to its community
        if (ext[v] < gamma * k_v * (c_tot - k_v) / g.total) continue;

        links.reset();
        for (const auto& [j, w] : g.adj[v]) {
            if (community[j] == c) links.add(refined[j], w);
        }

        uint32_t best = refined[v];
        double best_gain = 0.0;
        for (uint32_t r : links.touched()) {
            if (r == refined[v]) continue;
            if (ext[r] < gamma * tot[r] * (c_tot - tot[r]) / g.total) continue;
            double gain = links.get(r) - gamma * k_v * tot[r] / g.total;
            bool take = best == refined[v] ? gain >= 0.0 : gain > best_gain + kEpsilon;
            if (take) {
                best_gain = gain;
                best = r;
            }
        }
        if (best == refined[v]) continue;

        uint32_t old = refined[v];
        ext[best] = ext[best] + ext[v] - 2.0 * links.get(best);
        tot[best] += k_v;
        tot[old] = 0.0;
        ext[old] = 0.0;
        refined[v] = best;
        for (const auto& [j, w] : g.adj[v]) {
            if (refined[j] == best) singleton[j] = false;
        }
        singleton[v] = false;
    }

    renumber(refined);
    return refined;
}

LevelGraph aggregate(const LevelGraph& g, const std::vector<uint32_t>& refined, uint32_t count) {
    LevelGraph out;
    out.adj.resize(count);
    out.self_weight.assign(count, 0.0);
    out.strength.assign(count, 0.0);
    out.total = g.total;

    std::vector<std::unordered_map<uint32_t, double>> merged(count);
    for (uint32_t i = 0; i < g.size(); i++) {
        uint32_t r = refined[i];
        out.strength[r] += g.strength[i];
        out.self_weight[r] += g.self_weight[i];
        for (const auto& [j, w] : g.adj[i]) {
            uint32_t s = refined[j];
            if (s == r) out.self_weight[r] += w;
            else merged[r][s] += w;
        }
    }
    for (uint32_t r = 0; r < count; r++) {
        out.adj[r].assign(merged[r].begin(), merged[r].end());
        std::sort(out.adj[r].begin(), out.adj[r].end());
    }
    return out;
}

double level_modularity(const LevelGraph& g, const std::vector<uint32_t>& community,
                        double gamma) {
    if (g.total <= 0.0) return 0.0;
    size_t n = g.size();
    std::vector<double> in(n, 0.0);
    std::vector<double> tot(n, 0.0);
    for (uint32_t i = 0; i < n; i++) {
        uint32_t c = community[i];
        tot[c] += g.strength[i];
        in[c] += g.self_weight[i];
        for (const auto& [j, w] : g.adj[i]) {
            if (community[j] == c) in[c] += w;
        }
    }
    double q = 0.0;
    for (uint32_t c = 0; c < n; c++) {
        if (tot[c] == 0.0 && in[c] == 0.0) continue;
        q += in[c] / g.total - gamma * (tot[c] / g.total) * (tot[c] / g.total);
    }
    return q;
}

} // namespace

double modularity(const KnnGraph& graph, const std::vector<uint32_t>& membership,
                  double resolution) {
    std::vector<uint32_t> slot_to_node;
    LevelGraph g = from_knn(graph, slot_to_node);

    std::vector<uint32_t> community(g.size(), 0);
    std::vector<uint32_t> labels;
    labels.reserve(g.size());
    for (uint32_t s = 0; s < slot_to_node.size(); s++) {
        if (slot_to_node[s] == LeidenResult::kUnassigned) continue;
        labels.push_back(s < membership.size() ? membership[s] : LeidenResult::kUnassigned);
    }
    // Unlabelled nodes each count as their own community
    uint32_t next = 0;
    for (auto l : labels) {
        if (l != LeidenResult::kUnassigned) next = std::max(next, l + 1);
    }
    for (uint32_t i = 0; i < labels.size(); i++) {
        community[i] = labels[i] == LeidenResult::kUnassigned ? next++ : labels[i];
    }
    renumber(community);
    return level_modularity(g, community, resolution);
}

LeidenResult run_leiden(const KnnGraph& graph, const LeidenParams& params,
                        const TaskHandle& task) {
    LeidenResult result;
    std::vector<uint32_t> slot_to_node;
    const LevelGraph base = from_knn(graph, slot_to_node);
    size_t n = base.size();
    double gamma = params.resolution;

    // membership[node]: aggregated node at the current level
    std::vector<uint32_t> membership(n);
    for (uint32_t i = 0; i < n; i++) membership[i] = i;

    LevelGraph level = base;
    std::vector<uint32_t> community(n);
    for (uint32_t i = 0; i < n; i++) community[i] = i;

    std::vector<uint32_t> flat(n);
    for (uint32_t i = 0; i < n; i++) flat[i] = i;
    double prev_q = level_modularity(base, flat, gamma);
    result.modularity = prev_q;

    for (uint32_t iter = 0; iter < params.max_iterations; iter++) {
        if (task.cancelled()) {
            result.cancelled = true;
            return result;
        }

        bool changed = false;
        if (!move_nodes(level, community, gamma, task, changed)) {
            result.cancelled = true;
            return result;
        }
        result.iterations = iter + 1;

        for (uint32_t i = 0; i < n; i++) flat[i] = community[membership[i]];
        double q = level_modularity(base, flat, gamma);
        result.modularity = q;

        if (!changed || q - prev_q < params.min_modularity_gain) break;
        prev_q = q;

        auto refined = refine(level, community, gamma);
        uint32_t count = 0;
        for (uint32_t r : refined) count = std::max(count, r + 1);

        std::vector<uint32_t> next_community(count);
        for (uint32_t i = 0; i < level.size(); i++) next_community[refined[i]] = community[i];
        renumber(next_community);

        for (uint32_t i = 0; i < n; i++) membership[i] = refined[membership[i]];
        level = aggregate(level, refined, count);
        community = std::move(next_community);
    }

    if (task.cancelled()) {
        result.cancelled = true;
        return result;
    }

    renumber(flat);
    result.membership.assign(slot_to_node.size(), LeidenResult::kUnassigned);
    for (uint32_t s = 0; s < slot_to_node.size(); s++) {
        if (slot_to_node[s] != LeidenResult::kUnassigned) {
            result.membership[s] = flat[slot_to_node[s]];
        }
    }
    result.community_count = renumber(result.membership);
    return result;
}

} // namespace clipmind
