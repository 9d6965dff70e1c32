#include <catch2/catch.hpp>
#include "cluster/leiden.hpp"
#include <cmath>
#include <set>
#include <string>

using namespace clipmind;

namespace {

// `groups` cliques of `size` nodes (weight 1 inside), consecutive cliques
// joined by one edge of weight `bridge`. Slots are assigned clique by clique.
KnnGraph planted(uint32_t groups, uint32_t size, double bridge) {
    KnnGraph g;
    for (uint32_t c = 0; c < groups; c++) {
        for (uint32_t i = 0; i < size; i++) {
            g.add_node("g" + std::to_string(c) + "_" + std::to_string(i));
        }
    }
    for (uint32_t c = 0; c < groups; c++) {
        uint32_t base = c * size;
        for (uint32_t i = 0; i < size; i++) {
            for (uint32_t j = i + 1; j < size; j++) g.add_edge(base + i, base + j, 1.0);
        }
        if (c + 1 < groups) g.add_edge(base + size - 1, base + size, bridge);
    }
    return g;
}

} // namespace

TEST_CASE("run_leiden: recovers planted cliques", "[leiden]") {
    KnnGraph g = planted(3, 5, 0.1);
    auto result = run_leiden(g);

    REQUIRE_FALSE(result.cancelled);
    REQUIRE(result.community_count == 3);
    REQUIRE(result.membership.size() == 15);
    for (uint32_t s = 0; s < 15; s++) {
        REQUIRE(result.membership[s] == s / 5);
    }
    REQUIRE(result.modularity > 0.6);
    REQUIRE(result.iterations >= 1);
}

TEST_CASE("run_leiden: reported modularity matches the partition", "[leiden]") {
    KnnGraph g = planted(4, 6, 0.2);
    auto result = run_leiden(g);
    REQUIRE(std::abs(result.modularity - modularity(g, result.membership)) < 1e-9);
}

TEST_CASE("run_leiden: deterministic for the same graph", "[leiden]") {
    KnnGraph a = planted(5, 4, 0.3);
    KnnGraph b = planted(5, 4, 0.3);
    auto ra = run_leiden(a);
    auto rb = run_leiden(b);
    REQUIRE(ra.membership == rb.membership);
    REQUIRE(ra.modularity == rb.modularity);
}

TEST_CASE("run_leiden: communities are connected", "[leiden]") {
    KnnGraph g = planted(4, 5, 0.05);
    auto result = run_leiden(g);

    // Every member of a multi-node community has a neighbour in it
    for (uint32_t s = 0; s < g.node_count(); s++) {
        uint32_t c = result.membership[s];
        size_t same = 0;
        for (uint32_t t = 0; t < g.node_count(); t++) {
            if (result.membership[t] == c) same++;
        }
        if (same == 1) continue;
        bool linked = false;
        for (const auto& [other, w] : g.neighbors(s)) {
            if (result.membership[other] == c) linked = true;
        }
        REQUIRE(linked);
    }
}

TEST_CASE("run_leiden: low resolution merges, high resolution splits", "[leiden]") {
    KnnGraph g = planted(3, 5, 0.1);

    LeidenParams low;
    low.resolution = 0.001;
    REQUIRE(run_leiden(g, low).community_count == 1);

    LeidenParams high;
    high.resolution = 20.0;
    REQUIRE(run_leiden(g, high).community_count > 3);
}

TEST_CASE("run_leiden: isolated nodes are their own community", "[leiden]") {
    KnnGraph g = planted(2, 4, 0.1);
    g.add_node("loner");
    auto result = run_leiden(g);
    REQUIRE(result.community_count == 3);
    uint32_t loner = *g.node_of("loner");
    for (uint32_t s = 0; s < g.node_count(); s++) {
        if (s != loner) REQUIRE(result.membership[s] != result.membership[loner]);
    }
}

TEST_CASE("run_leiden: removed slots stay unassigned", "[leiden]") {
    KnnGraph g = planted(2, 4, 0.1);
    g.remove_node("g0_1");
    auto result = run_leiden(g);
    REQUIRE(result.membership.size() == 8);
    REQUIRE(result.membership[1] == LeidenResult::kUnassigned);
    REQUIRE(result.community_count == 2);
}

TEST_CASE("run_leiden: empty and edgeless graphs", "[leiden]") {
    KnnGraph empty;
    auto r = run_leiden(empty);
    REQUIRE(r.community_count == 0);
    REQUIRE(r.membership.empty());
    REQUIRE_FALSE(r.cancelled);

    KnnGraph dots;
    dots.add_node("a");
    dots.add_node("b");
    auto d = run_leiden(dots);
    REQUIRE(d.community_count == 2);
    REQUIRE(d.modularity == 0.0);
}

TEST_CASE("run_leiden: zero iterations leaves singletons", "[leiden]") {
    KnnGraph g = planted(2, 3, 0.1);
    LeidenParams p;
    p.max_iterations = 0;
    auto r = run_leiden(g, p);
    REQUIRE(r.community_count == 6);
    REQUIRE(r.iterations == 0);
}

TEST_CASE("run_leiden: cancelled task returns no membership", "[leiden]") {
    KnnGraph g = planted(3, 5, 0.1);
    TaskHandle task;
    TaskHandle copy = task;
    copy.cancel();
    REQUIRE(task.cancelled());

    auto r = run_leiden(g, {}, task);
    REQUIRE(r.cancelled);
    REQUIRE(r.membership.empty());
}

TEST_CASE("modularity: single community scores zero", "[leiden]") {
    KnnGraph g = planted(2, 3, 0.5);
    std::vector<uint32_t> all(g.node_count(), 0);
    REQUIRE(std::abs(modularity(g, all)) < 1e-12);
}

TEST_CASE("modularity: planted split beats a bad split", "[leiden]") {
    KnnGraph g = planted(2, 4, 0.1);
    std::vector<uint32_t> good = {0, 0, 0, 0, 1, 1, 1, 1};
    std::vector<uint32_t> bad = {0, 1, 0, 1, 0, 1, 0, 1};
    REQUIRE(modularity(g, good) > modularity(g, bad));
}
