#pragma once

#include <kgview/graph/graph_model.h>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace kgview {
namespace graph {

class GraphLoadError : public std::runtime_error {
public:
    explicit GraphLoadError(const std::string& what) : std::runtime_error(what) {}
};

/*
 * Decodes the data collaborator's graph payload:
 *   { "nodes": [...], "edges": [...], "seed_node_id": "..." }
 * or the same lists nested under a "graph" object.
 * Throws GraphLoadError on malformed input.
 */
std::shared_ptr<const GraphModel> LoadGraphFromJson(const nlohmann::json& document);
std::shared_ptr<const GraphModel> LoadGraphFromString(const std::string& text);
std::shared_ptr<const GraphModel> LoadGraphFromFile(const std::filesystem::path& path);

} // namespace graph
} // namespace kgview
