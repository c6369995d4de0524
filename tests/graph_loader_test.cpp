#include "gtest/gtest.h"
#include <kgview/graph/graph_loader.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using kgview::graph::GraphLoadError;
using kgview::graph::LoadGraphFromFile;
using kgview::graph::LoadGraphFromJson;
using kgview::graph::LoadGraphFromString;

TEST(GraphLoaderTest, LoadsTopLevelNodesAndEdges) {
    auto model = LoadGraphFromString(R"({
        "nodes": [
            {"id": "n1", "content": "Graph theory", "node_type": "topic", "created_at": "2024-01-01T00:00:00Z"},
            {"id": "n2", "content": "Vertex", "updated_at": "2024-02-01T00:00:00Z"},
            {"id": "n3", "content": "Edge", "is_generated": true}
        ],
        "edges": [
            {"id": "e1", "source_id": "n1", "target_id": "n2", "relation_type": "has_part", "weight": 3},
            {"source_id": "n1", "target_id": "n3"}
        ],
        "seed_node_id": "n1"
    })");

    ASSERT_EQ(model->NodeCount(), 3u);
    ASSERT_EQ(model->EdgeCount(), 2u);

    const auto* n1 = model->FindNode("n1");
    ASSERT_NE(n1, nullptr);
    EXPECT_EQ(n1->record.type, "topic");
    EXPECT_EQ(n1->record.created_at, "2024-01-01T00:00:00Z");
    EXPECT_TRUE(n1->is_seed);

    const auto* n2 = model->FindNode("n2");
    EXPECT_EQ(n2->record.type, "concept");
    ASSERT_TRUE(n2->record.updated_at.has_value());
    EXPECT_TRUE(model->FindNode("n3")->is_generated);

    EXPECT_EQ(model->Edges()[0].record.relation_type, "has_part");
    EXPECT_DOUBLE_EQ(model->Edges()[0].record.weight, 3.0);
    EXPECT_EQ(model->Edges()[1].record.id, "1");
    EXPECT_EQ(model->Edges()[1].record.relation_type, "related");
    EXPECT_DOUBLE_EQ(model->Edges()[1].record.weight, 1.0);
}

TEST(GraphLoaderTest, AcceptsNestedGraphAndIntegerIds) {
    const nlohmann::json document = nlohmann::json::parse(R"({
        "graph": {
            "nodes": [{"id": 1}, {"id": 2}],
            "edges": [{"source_id": 1, "target_id": 2}]
        },
        "seed_node_id": 2
    })");

    auto model = LoadGraphFromJson(document);
    ASSERT_EQ(model->NodeCount(), 2u);
    EXPECT_NE(model->FindNode("1"), nullptr);
    EXPECT_EQ(model->EdgeCount(), 1u);
    EXPECT_TRUE(model->FindNode("2")->is_seed);
}

TEST(GraphLoaderTest, KeepsFractionalAndLargeWeights) {
    auto model = LoadGraphFromString(R"({
        "nodes": [{"id": "a"}, {"id": "b"}],
        "edges": [
            {"id": "light", "source_id": "a", "target_id": "b", "weight": 0.75},
            {"id": "heavy", "source_id": "b", "target_id": "a", "weight": 1e30}
        ]
    })");

    ASSERT_EQ(model->EdgeCount(), 2u);
    EXPECT_DOUBLE_EQ(model->Edges()[0].record.weight, 0.75);
    EXPECT_DOUBLE_EQ(model->Edges()[1].record.weight, 1e30);
}

TEST(GraphLoaderTest, MissingEdgesKeyMeansNoEdges) {
    auto model = LoadGraphFromString(R"({"nodes": [{"id": "only"}]})");
    EXPECT_EQ(model->NodeCount(), 1u);
    EXPECT_EQ(model->EdgeCount(), 0u);
}

TEST(GraphLoaderTest, DanglingEdgeIsDroppedNotRejected) {
    auto model = LoadGraphFromString(R"({
        "nodes": [{"id": "a"}],
        "edges": [{"source_id": "a", "target_id": "b"}]
    })");
    EXPECT_EQ(model->EdgeCount(), 0u);
    EXPECT_EQ(model->DroppedEdgeCount(), 1u);
}

TEST(GraphLoaderTest, RejectsMalformedInput) {
    EXPECT_THROW(LoadGraphFromString("{not json"), GraphLoadError);
    EXPECT_THROW(LoadGraphFromString("[]"), GraphLoadError);
    EXPECT_THROW(LoadGraphFromString(R"({"edges": []})"), GraphLoadError);
    EXPECT_THROW(LoadGraphFromString(R"({"nodes": [{"content": "no id"}]})"), GraphLoadError);
    EXPECT_THROW(LoadGraphFromString(R"({"nodes": [{"id": "a"}], "edges": [{"source_id": "a"}]})"), GraphLoadError);
    EXPECT_THROW(LoadGraphFromString(R"({"nodes": [{"id": "a"}], "edges": {}})"), GraphLoadError);
}

TEST(GraphLoaderTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "kgview_graph_loader_test.json";
    {
        std::ofstream out(path);
        out << R"({"nodes": [{"id": "a"}, {"id": "b"}], "edges": [{"source_id": "a", "target_id": "b"}]})";
    }
    auto model = LoadGraphFromFile(path);
    EXPECT_EQ(model->NodeCount(), 2u);
    EXPECT_EQ(model->EdgeCount(), 1u);
    std::filesystem::remove(path);

    EXPECT_THROW(LoadGraphFromFile(path), GraphLoadError);
}
