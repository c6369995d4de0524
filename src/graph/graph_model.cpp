#include <kgview/graph/graph_model.h>

#include <utility>

namespace kgview {
namespace graph {

namespace {
constexpr const char* kGeneratedNodeType = "generated";
}

GraphModel::GraphModel(std::vector<NodeRecord> nodes,
                       std::vector<EdgeRecord> edges,
                       std::optional<NodeId> seed_node_id)
    : seed_node_id_(std::move(seed_node_id)) {
    nodes_.reserve(nodes.size());
    index_by_id_.reserve(nodes.size());

    for (auto& record : nodes) {
        if (index_by_id_.count(record.id)) {
            ++dropped_duplicate_nodes_;
            continue;
        }
        const auto index = static_cast<NodeIndex>(nodes_.size());
        index_by_id_.emplace(record.id, index);

        GraphNode node;
        node.is_seed = seed_node_id_.has_value() && *seed_node_id_ == record.id;
        node.is_generated = record.is_generated || record.type == kGeneratedNodeType;
        node.record = std::move(record);
        nodes_.push_back(std::move(node));
    }

    edges_.reserve(edges.size());
    for (auto& record : edges) {
        auto source_it = index_by_id_.find(record.source_id);
        auto target_it = index_by_id_.find(record.target_id);
        if (source_it == index_by_id_.end() || target_it == index_by_id_.end()) {
            ++dropped_edges_;
            continue;
        }
        GraphEdge edge{std::move(record), source_it->second, target_it->second};
        edges_.push_back(std::move(edge));
    }
}

std::optional<NodeIndex> GraphModel::IndexOf(const NodeId& id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) return std::nullopt;
    return it->second;
}

const GraphNode* GraphModel::FindNode(const NodeId& id) const {
    auto index = IndexOf(id);
    if (!index) return nullptr;
    return &nodes_[*index];
}

} // namespace graph
} // namespace kgview
