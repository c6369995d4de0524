#pragma once

#include <kgview/graph/render/scene_primitives.h>

#include <glm/vec3.hpp>

#include <memory>

namespace kgview {
namespace graph {

class PerspectiveCamera;

/*
 * Owner of the scene's GPU-side primitives. Only the renderer mutates
 * geometry; everything else hands it finished ScenePrimitives bundles.
 * Calls made before Initialize() or after Shutdown() are no-ops.
 */
class SceneRenderer {
public:
    virtual ~SceneRenderer() = default;

    virtual void Initialize() = 0;
    virtual void Shutdown() = 0;
    virtual bool IsInitialized() const = 0;

    // Replaces the graph geometry. The previous bundle is released.
    virtual void InstallPrimitives(std::shared_ptr<const ScenePrimitives> primitives) = 0;
    // Replaces the decorative background point cloud.
    virtual void InstallBackground(std::shared_ptr<const ScenePrimitives> background) = 0;

    virtual void SetClearColor(const glm::vec3& color) = 0;
    virtual void Render(const PerspectiveCamera& camera) = 0;
};

} // namespace graph
} // namespace kgview
