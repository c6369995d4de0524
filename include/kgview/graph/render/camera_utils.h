#ifndef KGVIEW_CAMERA_UTILS_H
#define KGVIEW_CAMERA_UTILS_H

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace kgview {
namespace graph {

namespace detail {
    // Easing and smoothing helpers for camera motion
    namespace Easing {
        float EaseOutCubic(float t);
        float Lerp(float a, float b, float t);
        glm::vec3 LerpVec3(const glm::vec3& a, const glm::vec3& b, float t);
    }
} // namespace detail

// Provide public alias so callers can use graph::Easing directly
namespace Easing = detail::Easing;

struct Ray {
    glm::vec3 origin;
    glm::vec3 direction; // Unit length
};

/*
 * Perspective camera with fixed field of view and clip planes. The aspect
 * ratio follows the viewport through SetViewportSize().
 */
class PerspectiveCamera {
public:
    PerspectiveCamera();
    PerspectiveCamera(float fov_degrees, float near_plane, float far_plane);

    void SetViewportSize(int width, int height);
    int GetViewportWidth() const { return viewport_width_; }
    int GetViewportHeight() const { return viewport_height_; }
    float GetAspect() const { return aspect_ratio_; }
    float GetFovDegrees() const { return fov_degrees_; }
    float GetNear() const { return near_plane_; }
    float GetFar() const { return far_plane_; }

    void SetPosition(const glm::vec3& position) { position_ = position; }
    void LookAt(const glm::vec3& target);
    const glm::vec3& GetPosition() const { return position_; }
    const glm::vec3& GetForward() const { return forward_; }
    glm::vec3 GetRight() const;
    glm::vec3 GetUp() const;

    glm::mat4 GetViewMatrix() const;
    glm::mat4 GetProjectionMatrix() const;
    glm::mat4 GetViewProjectionMatrix() const;

private:
    float fov_degrees_;
    float near_plane_;
    float far_plane_;
    float aspect_ratio_ = 1.0f;
    int viewport_width_ = 1;
    int viewport_height_ = 1;

    glm::vec3 position_;
    glm::vec3 forward_;
};

/*
 * Coordinate conversions between world space, normalized device
 * coordinates and viewport pixels (origin top-left, y down).
 * All methods are static; an instance of CameraUtils is never created.
 */
class CameraUtils {
public:
    static glm::vec2 ScreenToNdc(const glm::vec2& pixel, int viewport_width, int viewport_height);

    // Returns false when the point is behind the camera.
    static bool WorldToScreen(const glm::vec3& world_pos, const PerspectiveCamera& camera, glm::vec2& out_pixel);

    static Ray RayFromNdc(const glm::vec2& ndc, const PerspectiveCamera& camera);
    static Ray RayFromScreen(const glm::vec2& pixel, const PerspectiveCamera& camera);

    // World-space length covered by one pixel at the given view depth.
    static float WorldUnitsPerPixel(const PerspectiveCamera& camera, float depth);
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_CAMERA_UTILS_H
