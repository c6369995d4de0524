#include <kgview/gui/interaction/pointer_picker.h>
#include <kgview/graph/render/camera_utils.h>
#include <kgview/graph/render/scene_primitives.h>

#include <glm/geometric.hpp>

#include <limits>

namespace kgview {
namespace gui {

PointerPicker::PointerPicker(float hit_radius_px)
    : hit_radius_px_(hit_radius_px) {}

std::optional<PickResult> PointerPicker::Pick(const glm::vec2& surface_pixel,
                                              const graph::PerspectiveCamera& camera,
                                              const graph::ScenePrimitives& primitives) const {
    if (primitives.points.empty()) {
        return std::nullopt;
    }

    const graph::Ray ray = graph::CameraUtils::RayFromScreen(surface_pixel, camera);
    const glm::vec3& forward = camera.GetForward();

    std::optional<PickResult> best;
    float best_t = std::numeric_limits<float>::max();

    for (std::size_t i = 0; i < primitives.points.size(); ++i) {
        const glm::vec3& p = primitives.points[i].position;
        const glm::vec3 to_point = p - ray.origin;

        const float t = glm::dot(to_point, ray.direction);
        if (t <= 0.0f) continue; // Behind the camera

        const glm::vec3 closest = ray.origin + ray.direction * t;
        const float miss = glm::length(p - closest);

        const float depth = glm::dot(to_point, forward);
        const float threshold = hit_radius_px_ * graph::CameraUtils::WorldUnitsPerPixel(camera, depth);

        if (miss <= threshold && t < best_t) {
            best_t = t;
            NodeIndex node_index = i < primitives.point_to_node.size()
                ? primitives.point_to_node[i]
                : kInvalidNodeIndex;
            best = PickResult{i, node_index, t};
        }
    }

    return best;
}

} // namespace gui
} // namespace kgview
