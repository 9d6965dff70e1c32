#pragma once
#include "../graph/knn_graph.hpp"
#include "../task.hpp"
#include <cstdint>
#include <limits>
#include <vector>

namespace clipmind {

struct LeidenParams {
    double resolution = 1.0;
    uint32_t max_iterations = 50;
    double min_modularity_gain = 1e-6;
};

struct LeidenResult {
    static constexpr uint32_t kUnassigned = std::numeric_limits<uint32_t>::max();

    // Community per graph slot, numbered 0.. by first appearance in slot
    // order. Removed slots hold kUnassigned.
    std::vector<uint32_t> membership;
    uint32_t community_count = 0;
    double modularity = 0.0;
    uint32_t iterations = 0;
    bool cancelled = false;   // membership is empty when set
};

// Leiden community detection: fast local moving, refinement into
// well-connected sub-communities, aggregation on the refined partition.
// Greedy and deterministic for a given graph.
LeidenResult run_leiden(const KnnGraph& graph, const LeidenParams& params = {},
                        const TaskHandle& task = TaskHandle());

// Generalised modularity of `membership` (indexed by graph slot).
double modularity(const KnnGraph& graph, const std::vector<uint32_t>& membership,
                  double resolution = 1.0);

} // namespace clipmind
