#include <kgview/graph/graph_loader.h>

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace kgview {
namespace graph {

namespace {

// Ids may arrive as strings or as integers depending on the backing store.
std::optional<std::string> ReadId(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key)) return std::nullopt;
    const auto& value = obj[key];
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return std::nullopt;
}

std::string ReadOptionalString(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    if (!obj.contains(key) || !obj[key].is_string()) return fallback;
    return obj[key].get<std::string>();
}

NodeRecord ParseNode(const nlohmann::json& node_obj, std::size_t position) {
    if (!node_obj.is_object()) {
        throw GraphLoadError("Node at position " + std::to_string(position) + " is not an object");
    }
    auto id = ReadId(node_obj, "id");
    if (!id || id->empty()) {
        throw GraphLoadError("Node at position " + std::to_string(position) + " has no usable 'id'");
    }

    NodeRecord record;
    record.id = std::move(*id);
    record.content = ReadOptionalString(node_obj, "content", "");
    // The backend calls the tag node_type, the frontend type.
    record.type = ReadOptionalString(node_obj, "node_type", ReadOptionalString(node_obj, "type", "concept"));
    record.created_at = ReadOptionalString(node_obj, "created_at", "");
    if (node_obj.contains("updated_at") && node_obj["updated_at"].is_string()) {
        record.updated_at = node_obj["updated_at"].get<std::string>();
    }
    if (node_obj.contains("is_generated") && node_obj["is_generated"].is_boolean()) {
        record.is_generated = node_obj["is_generated"].get<bool>();
    }
    return record;
}

EdgeRecord ParseEdge(const nlohmann::json& edge_obj, std::size_t position) {
    if (!edge_obj.is_object()) {
        throw GraphLoadError("Edge at position " + std::to_string(position) + " is not an object");
    }
    auto source = ReadId(edge_obj, "source_id");
    auto target = ReadId(edge_obj, "target_id");
    if (!source || !target) {
        throw GraphLoadError("Edge at position " + std::to_string(position) + " is missing 'source_id' or 'target_id'");
    }

    EdgeRecord record;
    record.id = ReadId(edge_obj, "id").value_or(std::to_string(position));
    record.source_id = std::move(*source);
    record.target_id = std::move(*target);
    record.relation_type = ReadOptionalString(edge_obj, "relation_type", "related");
    if (edge_obj.contains("weight") && edge_obj["weight"].is_number()) {
        record.weight = edge_obj["weight"].get<double>();
    }
    return record;
}

} // anonymous namespace

std::shared_ptr<const GraphModel> LoadGraphFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw GraphLoadError("Graph document must be a JSON object");
    }
    const nlohmann::json& graph_obj =
        (document.contains("graph") && document["graph"].is_object()) ? document["graph"] : document;

    if (!graph_obj.contains("nodes") || !graph_obj["nodes"].is_array()) {
        throw GraphLoadError("Graph document has no 'nodes' array");
    }

    std::vector<NodeRecord> nodes;
    nodes.reserve(graph_obj["nodes"].size());
    std::size_t position = 0;
    for (const auto& node_obj : graph_obj["nodes"]) {
        nodes.push_back(ParseNode(node_obj, position++));
    }

    std::vector<EdgeRecord> edges;
    if (graph_obj.contains("edges")) {
        if (!graph_obj["edges"].is_array()) {
            throw GraphLoadError("Graph document 'edges' is not an array");
        }
        edges.reserve(graph_obj["edges"].size());
        position = 0;
        for (const auto& edge_obj : graph_obj["edges"]) {
            edges.push_back(ParseEdge(edge_obj, position++));
        }
    }

    std::optional<NodeId> seed = ReadId(document, "seed_node_id");
    if (!seed) seed = ReadId(graph_obj, "seed_node_id");

    return std::make_shared<const GraphModel>(std::move(nodes), std::move(edges), std::move(seed));
}

std::shared_ptr<const GraphModel> LoadGraphFromString(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw GraphLoadError("Failed to parse graph JSON: " + std::string(e.what()));
    }
    return LoadGraphFromJson(document);
}

std::shared_ptr<const GraphModel> LoadGraphFromFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw GraphLoadError("Cannot open graph file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadGraphFromString(buffer.str());
}

} // namespace graph
} // namespace kgview
