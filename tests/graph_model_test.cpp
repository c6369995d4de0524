#include "gtest/gtest.h"
#include <kgview/graph/graph_model.h>

using kgview::graph::EdgeRecord;
using kgview::graph::GraphModel;
using kgview::graph::NodeRecord;

namespace {
NodeRecord MakeNode(const std::string& id, const std::string& type = "concept") {
    NodeRecord record;
    record.id = id;
    record.content = "content of " + id;
    record.type = type;
    return record;
}

EdgeRecord MakeEdge(const std::string& id, const std::string& source, const std::string& target) {
    EdgeRecord record;
    record.id = id;
    record.source_id = source;
    record.target_id = target;
    return record;
}
} // namespace

TEST(GraphModelTest, EmptySnapshot) {
    GraphModel model;
    EXPECT_TRUE(model.Empty());
    EXPECT_EQ(model.NodeCount(), 0u);
    EXPECT_EQ(model.EdgeCount(), 0u);
    EXPECT_EQ(model.FindNode("missing"), nullptr);
}

TEST(GraphModelTest, DropsEdgesWithMissingEndpoints) {
    GraphModel model({MakeNode("a"), MakeNode("b")},
                     {MakeEdge("e1", "a", "b"), MakeEdge("e2", "a", "ghost"), MakeEdge("e3", "ghost", "b")});

    ASSERT_EQ(model.EdgeCount(), 1u);
    EXPECT_EQ(model.Edges()[0].record.id, "e1");
    EXPECT_EQ(model.Edges()[0].source, 0u);
    EXPECT_EQ(model.Edges()[0].target, 1u);
    EXPECT_EQ(model.DroppedEdgeCount(), 2u);
}

TEST(GraphModelTest, FirstDuplicateNodeWins) {
    NodeRecord first = MakeNode("a");
    first.content = "first";
    NodeRecord second = MakeNode("a");
    second.content = "second";

    GraphModel model({first, second, MakeNode("b")}, {});
    ASSERT_EQ(model.NodeCount(), 2u);
    EXPECT_EQ(model.FindNode("a")->record.content, "first");
    EXPECT_EQ(model.DroppedDuplicateNodeCount(), 1u);
    EXPECT_EQ(model.IndexOf("b").value(), 1u);
}

TEST(GraphModelTest, DerivesSeedAndGeneratedFlags) {
    NodeRecord flagged = MakeNode("c");
    flagged.is_generated = true;

    GraphModel model({MakeNode("a"), MakeNode("b", "generated"), flagged}, {}, std::string("a"));

    EXPECT_TRUE(model.FindNode("a")->is_seed);
    EXPECT_FALSE(model.FindNode("a")->is_generated);
    EXPECT_FALSE(model.FindNode("b")->is_seed);
    EXPECT_TRUE(model.FindNode("b")->is_generated);
    EXPECT_TRUE(model.FindNode("c")->is_generated);
    ASSERT_TRUE(model.SeedNodeId().has_value());
    EXPECT_EQ(*model.SeedNodeId(), "a");
}

TEST(GraphModelTest, SeedIdNotInSnapshotMarksNothing) {
    GraphModel model({MakeNode("a")}, {}, std::string("zzz"));
    EXPECT_FALSE(model.FindNode("a")->is_seed);
}
