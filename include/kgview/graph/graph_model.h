#ifndef KGVIEW_GRAPH_MODEL_H
#define KGVIEW_GRAPH_MODEL_H

#include <kgview/core/id_types.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgview {
namespace graph {

// Node record as supplied by the data collaborator.
struct NodeRecord {
    NodeId id;
    std::string content;
    std::string type = "concept";
    std::string created_at;
    std::optional<std::string> updated_at;
    bool is_generated = false;
};

// Edge record as supplied by the data collaborator.
struct EdgeRecord {
    std::string id;
    NodeId source_id;
    NodeId target_id;
    std::string relation_type = "related";
    double weight = 1.0;
};

struct GraphNode {
    NodeRecord record;
    bool is_seed = false;        // Derived: record.id == the snapshot's seed id
    bool is_generated = false;

    const NodeId& id() const { return record.id; }
};

// Edge with both endpoints resolved to snapshot indices.
struct GraphEdge {
    EdgeRecord record;
    NodeIndex source;
    NodeIndex target;
};

/*
 * Immutable snapshot of nodes and edges for one rendering pass.
 * Edges whose endpoints are missing from the node set are dropped here, so
 * everything downstream only ever sees resolvable edges.
 */
class GraphModel {
public:
    GraphModel() = default;
    GraphModel(std::vector<NodeRecord> nodes,
               std::vector<EdgeRecord> edges,
               std::optional<NodeId> seed_node_id = std::nullopt);

    const std::vector<GraphNode>& Nodes() const { return nodes_; }
    const std::vector<GraphEdge>& Edges() const { return edges_; }
    const std::optional<NodeId>& SeedNodeId() const { return seed_node_id_; }

    std::size_t NodeCount() const { return nodes_.size(); }
    std::size_t EdgeCount() const { return edges_.size(); }
    bool Empty() const { return nodes_.empty(); }

    std::optional<NodeIndex> IndexOf(const NodeId& id) const;
    const GraphNode* FindNode(const NodeId& id) const;

    // Diagnostics for the omissions performed at construction.
    std::size_t DroppedEdgeCount() const { return dropped_edges_; }
    std::size_t DroppedDuplicateNodeCount() const { return dropped_duplicate_nodes_; }

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<NodeId, NodeIndex> index_by_id_;
    std::optional<NodeId> seed_node_id_;
    std::size_t dropped_edges_ = 0;
    std::size_t dropped_duplicate_nodes_ = 0;
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_GRAPH_MODEL_H
