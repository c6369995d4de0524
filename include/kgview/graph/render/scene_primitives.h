#ifndef KGVIEW_SCENE_PRIMITIVES_H
#define KGVIEW_SCENE_PRIMITIVES_H

#include <kgview/core/id_types.h>
#include <kgview/graph/layout/force_directed_layout.h>
#include <kgview/graph/render/color_palette.h>

#include <glm/vec3.hpp>

#include <memory>
#include <vector>

namespace kgview {

namespace core {
class RandomSource;
}

namespace graph {

class GraphModel;

// Interleaved vertex layout shared by point and line buffers.
struct ColoredVertex {
    glm::vec3 position;
    glm::vec3 color;
};

/*
 * CPU-side geometry for one GraphModel snapshot: one point per node and two
 * line vertices per rendered edge. Immutable once built; the renderer takes
 * ownership of a new bundle and releases the previous one.
 */
struct ScenePrimitives {
    std::vector<ColoredVertex> points;
    std::vector<ColoredVertex> lines;
    std::vector<NodeIndex> point_to_node; // point vertex index -> snapshot node index

    std::size_t PointCount() const { return points.size(); }
    std::size_t LineSegmentCount() const { return lines.size() / 2; }
    bool Empty() const { return points.empty() && lines.empty(); }
};

class ScenePrimitiveBuilder {
public:
    // Nodes without an entry in positions are skipped, and so are their edges.
    static std::shared_ptr<const ScenePrimitives> Build(const GraphModel& model,
                                                        const PositionMap& positions,
                                                        const NodeColorPalette& palette);

    // Decorative background point cloud on a spherical shell.
    static std::shared_ptr<const ScenePrimitives> BuildStarfield(core::RandomSource& rng,
                                                                 int point_count,
                                                                 float radius,
                                                                 const glm::vec3& color);

    static const glm::vec3& ColorForNode(bool is_seed, bool is_generated, const NodeColorPalette& palette);
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_SCENE_PRIMITIVES_H
