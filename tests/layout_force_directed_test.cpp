#include "gtest/gtest.h"
#include <kgview/core/random_source.h>
#include <kgview/graph/graph_model.h>
#include <kgview/graph/layout/force_directed_layout.h>
#include <kgview/graph/layout/spatial_hash.h>

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using kgview::core::Mt19937RandomSource;
using kgview::graph::EdgeRecord;
using kgview::graph::ForceDirectedLayout;
using kgview::graph::GraphModel;
using kgview::graph::NodeRecord;
using kgview::graph::PositionMap;
using kgview::graph::SpatialHash;

namespace {

// Cycle n1 -> n2 -> ... -> n<count> -> n1.
GraphModel MakeCycle(int count) {
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
    for (int i = 0; i < count; ++i) {
        NodeRecord node;
        node.id = "n" + std::to_string(i + 1);
        nodes.push_back(node);

        EdgeRecord edge;
        edge.id = "e" + std::to_string(i + 1);
        edge.source_id = "n" + std::to_string(i + 1);
        edge.target_id = "n" + std::to_string((i + 1) % count + 1);
        edges.push_back(edge);
    }
    return GraphModel(std::move(nodes), std::move(edges));
}

bool IsFinite(const glm::vec3& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

float MinPairDistance(const PositionMap& positions) {
    float best = std::numeric_limits<float>::max();
    for (auto a = positions.begin(); a != positions.end(); ++a) {
        for (auto b = std::next(a); b != positions.end(); ++b) {
            best = std::min(best, glm::length(a->second - b->second));
        }
    }
    return best;
}

} // namespace

TEST(ForceDirectedLayoutTest, FiveCycleProducesDistinctFinitePositions) {
    GraphModel model = MakeCycle(5);
    Mt19937RandomSource rng(42);
    ForceDirectedLayout layout(rng);

    PositionMap positions = layout.ComputeLayout(model);

    ASSERT_EQ(positions.size(), 5u);
    for (const char* id : {"n1", "n2", "n3", "n4", "n5"}) {
        EXPECT_EQ(positions.count(id), 1u) << id;
    }
    for (const auto& entry : positions) {
        EXPECT_TRUE(IsFinite(entry.second)) << entry.first;
    }
    EXPECT_GT(MinPairDistance(positions), 1e-3f);

    for (const auto& edge : model.Edges()) {
        const float length = glm::length(positions.at(edge.record.source_id) - positions.at(edge.record.target_id));
        EXPECT_GT(length, 0.5f);
        EXPECT_LT(length, 1000.0f);
    }
}

TEST(ForceDirectedLayoutTest, EmptyGraphYieldsNoPositions) {
    GraphModel model;
    Mt19937RandomSource rng(1);
    ForceDirectedLayout layout(rng);

    PositionMap positions = layout.ComputeLayout(model);
    EXPECT_TRUE(positions.empty());
    EXPECT_FALSE(layout.IsRunning());
}

TEST(ForceDirectedLayoutTest, SingleNodeStaysFinite) {
    NodeRecord node;
    node.id = "solo";
    GraphModel model({node}, {});
    Mt19937RandomSource rng(3);
    ForceDirectedLayout layout(rng);

    PositionMap positions = layout.ComputeLayout(model);
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_TRUE(IsFinite(positions.at("solo")));
}

TEST(ForceDirectedLayoutTest, DanglingEdgeDoesNotAffectLayout) {
    NodeRecord a, b;
    a.id = "a";
    b.id = "b";
    EdgeRecord ghost;
    ghost.source_id = "a";
    ghost.target_id = "missing";

    GraphModel with_dangling({a, b}, {ghost});
    GraphModel without({a, b}, {});

    Mt19937RandomSource rng1(9), rng2(9);
    ForceDirectedLayout layout1(rng1), layout2(rng2);
    PositionMap p1 = layout1.ComputeLayout(with_dangling);
    PositionMap p2 = layout2.ComputeLayout(without);

    ASSERT_EQ(p1.size(), 2u);
    EXPECT_EQ(p1.at("a"), p2.at("a"));
    EXPECT_EQ(p1.at("b"), p2.at("b"));
}

TEST(ForceDirectedLayoutTest, SameSeedIsDeterministic) {
    GraphModel model = MakeCycle(12);
    Mt19937RandomSource rng1(2024), rng2(2024);
    ForceDirectedLayout layout1(rng1), layout2(rng2);

    PositionMap p1 = layout1.ComputeLayout(model);
    PositionMap p2 = layout2.ComputeLayout(model);

    for (const auto& entry : p1) {
        EXPECT_EQ(entry.second, p2.at(entry.first)) << entry.first;
    }
}

TEST(ForceDirectedLayoutTest, StartsOnSphereOfInitialRadius) {
    GraphModel model = MakeCycle(8);
    Mt19937RandomSource rng(5);
    ForceDirectedLayout::LayoutParams params;
    params.initial_jitter = 0.0f;
    params.iterations = 0;
    ForceDirectedLayout layout(rng, params);

    PositionMap positions = layout.ComputeLayout(model);
    for (const auto& entry : positions) {
        EXPECT_NEAR(glm::length(entry.second), params.initial_radius, 1e-3f);
    }
    EXPECT_GT(MinPairDistance(positions), 1.0f);
}

TEST(ForceDirectedLayoutTest, WarmStartKeepsPersistingNodes) {
    GraphModel model = MakeCycle(6);
    Mt19937RandomSource rng(11);
    ForceDirectedLayout first(rng);
    PositionMap previous = first.ComputeLayout(model);

    ForceDirectedLayout::LayoutParams params;
    params.warm_start = true;
    params.iterations = 0;
    ForceDirectedLayout second(rng, params);
    PositionMap restarted = second.ComputeLayout(model, &previous);

    for (const auto& entry : previous) {
        EXPECT_EQ(restarted.at(entry.first), entry.second) << entry.first;
    }
}

TEST(ForceDirectedLayoutTest, CoincidentStartSeparates) {
    GraphModel model = MakeCycle(4);
    PositionMap stacked;
    for (const auto& node : model.Nodes()) {
        stacked[node.id()] = glm::vec3(0.0f);
    }

    Mt19937RandomSource rng(8);
    ForceDirectedLayout::LayoutParams params;
    params.warm_start = true;
    ForceDirectedLayout layout(rng, params);
    PositionMap positions = layout.ComputeLayout(model, &stacked);

    for (const auto& entry : positions) {
        EXPECT_TRUE(IsFinite(entry.second));
    }
    EXPECT_GT(MinPairDistance(positions), 1e-3f);
}

TEST(ForceDirectedLayoutTest, SpatialHashPathMatchesAllPairsWithinCutoff) {
    GraphModel model = MakeCycle(40);

    ForceDirectedLayout::LayoutParams brute;
    brute.iterations = 5;
    ForceDirectedLayout::LayoutParams hashed = brute;
    hashed.spatial_hash_threshold = 10;
    hashed.repulsion_cutoff = 10000.0f;

    Mt19937RandomSource rng1(77), rng2(77);
    ForceDirectedLayout layout1(rng1, brute), layout2(rng2, hashed);
    PositionMap p1 = layout1.ComputeLayout(model);
    PositionMap p2 = layout2.ComputeLayout(model);

    for (const auto& entry : p1) {
        const glm::vec3& other = p2.at(entry.first);
        EXPECT_NEAR(entry.second.x, other.x, 1e-2f);
        EXPECT_NEAR(entry.second.y, other.y, 1e-2f);
        EXPECT_NEAR(entry.second.z, other.z, 1e-2f);
    }
}

TEST(ForceDirectedLayoutTest, SpatialHashPathStaysFinite) {
    GraphModel model = MakeCycle(300);
    ForceDirectedLayout::LayoutParams params;
    params.spatial_hash_threshold = 100;
    params.repulsion_cutoff = 30.0f;

    Mt19937RandomSource rng(99);
    ForceDirectedLayout layout(rng, params);
    PositionMap positions = layout.ComputeLayout(model);

    ASSERT_EQ(positions.size(), 300u);
    for (const auto& entry : positions) {
        EXPECT_TRUE(IsFinite(entry.second));
    }
}

TEST(SpatialHashTest, QueryFindsNeighboursOnly) {
    SpatialHash hash(10.0f);
    std::vector<glm::vec3> points = {
        glm::vec3(0.0f), glm::vec3(3.0f, 0.0f, 0.0f), glm::vec3(-4.0f, 2.0f, 1.0f), glm::vec3(500.0f, 0.0f, 0.0f)
    };
    hash.Insert(points);

    std::vector<std::uint32_t> found = hash.Query(glm::vec3(0.0f), 10.0f);
    std::sort(found.begin(), found.end());
    EXPECT_TRUE(std::binary_search(found.begin(), found.end(), 0u));
    EXPECT_TRUE(std::binary_search(found.begin(), found.end(), 1u));
    EXPECT_TRUE(std::binary_search(found.begin(), found.end(), 2u));
    EXPECT_FALSE(std::binary_search(found.begin(), found.end(), 3u));
}
