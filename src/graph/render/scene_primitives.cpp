#include <kgview/graph/render/scene_primitives.h>
#include <kgview/graph/graph_model.h>
#include <kgview/core/random_source.h>


#include <algorithm>
#include <cmath>

namespace kgview {
namespace graph {

const glm::vec3& ScenePrimitiveBuilder::ColorForNode(bool is_seed, bool is_generated, const NodeColorPalette& palette) {
    if (is_seed) return palette.seed_node;
    if (is_generated) return palette.generated_node;
    return palette.default_node;
}

std::shared_ptr<const ScenePrimitives> ScenePrimitiveBuilder::Build(const GraphModel& model,
                                                                    const PositionMap& positions,
                                                                    const NodeColorPalette& palette) {
    auto primitives = std::make_shared<ScenePrimitives>();
    if (model.Empty()) return primitives;

    primitives->points.reserve(model.NodeCount());
    primitives->point_to_node.reserve(model.NodeCount());
    std::vector<const glm::vec3*> node_positions(model.NodeCount(), nullptr);

    const auto& nodes = model.Nodes();
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        auto it = positions.find(nodes[i].id());
        if (it == positions.end()) continue;
        node_positions[i] = &it->second;
        primitives->points.push_back({it->second, ColorForNode(nodes[i].is_seed, nodes[i].is_generated, palette)});
        primitives->point_to_node.push_back(static_cast<NodeIndex>(i));
    }

    primitives->lines.reserve(model.EdgeCount() * 2);
    for (const auto& edge : model.Edges()) {
        const glm::vec3* source = node_positions[edge.source];
        const glm::vec3* target = node_positions[edge.target];
        if (!source || !target) continue;
        primitives->lines.push_back({*source, palette.edge});
        primitives->lines.push_back({*target, palette.edge});
    }
    return primitives;
}

std::shared_ptr<const ScenePrimitives> ScenePrimitiveBuilder::BuildStarfield(core::RandomSource& rng,
                                                                             int point_count,
                                                                             float radius,
                                                                             const glm::vec3& color) {
    auto primitives = std::make_shared<ScenePrimitives>();
    const int count = std::max(0, point_count);
    primitives->points.reserve(static_cast<std::size_t>(count));

    for (int i = 0; i < count; ++i) {
        // Uniform direction from z and azimuth, then a shell depth of 0.6..1.0 * radius
        const float z = rng.NextFloat(-1.0f, 1.0f);
        const float azimuth = rng.NextFloat(0.0f, 6.28318530718f);
        const float ring = std::sqrt(std::max(0.0f, 1.0f - z * z));
        const float depth = radius * rng.NextFloat(0.6f, 1.0f);
        const float brightness = rng.NextFloat(0.35f, 1.0f);

        glm::vec3 p(ring * std::cos(azimuth), ring * std::sin(azimuth), z);
        primitives->points.push_back({p * depth, color * brightness});
    }
    return primitives;
}

} // namespace graph
} // namespace kgview
