#pragma once

#include <kgview/core/id_types.h>

#include <glm/vec2.hpp>

#include <optional>

namespace kgview {

namespace graph {
class PerspectiveCamera;
struct ScenePrimitives;
}

namespace gui {

struct PickResult {
    std::size_t point_index;    // Index into ScenePrimitives::points
    NodeIndex node_index;       // Snapshot node index of that point
    float distance;             // Along the pick ray
};

/*
 * Screen-space picking against the point vertices of a scene. A point is
 * hit when the pick ray passes within hit_radius_px (converted to world
 * units at the point's depth); the nearest hit along the ray wins.
 */
class PointerPicker {
public:
    explicit PointerPicker(float hit_radius_px);

    // surface_pixel is relative to the render surface, origin top-left.
    std::optional<PickResult> Pick(const glm::vec2& surface_pixel,
                                   const graph::PerspectiveCamera& camera,
                                   const graph::ScenePrimitives& primitives) const;

    void SetHitRadius(float hit_radius_px) { hit_radius_px_ = hit_radius_px; }
    float GetHitRadius() const { return hit_radius_px_; }

private:
    float hit_radius_px_;
};

} // namespace gui
} // namespace kgview
