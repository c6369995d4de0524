#include <kgview/graph/render/camera_utils.h>
#include <kgview/core/config.h>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace kgview {
namespace graph {

namespace detail { namespace Easing {
    // Ease-out cubic function for natural deceleration
    float EaseOutCubic(float t) {
        return 1.0f - std::pow(1.0f - t, 3.0f);
    }

    float Lerp(float a, float b, float t) {
        return a + t * (b - a);
    }

    glm::vec3 LerpVec3(const glm::vec3& a, const glm::vec3& b, float t) {
        return a + t * (b - a);
    }
} // namespace Easing
} // namespace detail

namespace {
const glm::vec3 kWorldUp(0.0f, 1.0f, 0.0f);
}

PerspectiveCamera::PerspectiveCamera()
    : PerspectiveCamera(config::kCameraFovDegrees, config::kCameraNearPlane, config::kCameraFarPlane) {}

PerspectiveCamera::PerspectiveCamera(float fov_degrees, float near_plane, float far_plane)
    : fov_degrees_(fov_degrees), near_plane_(near_plane), far_plane_(far_plane),
      position_(0.0f, 0.0f, config::kCameraInitialDistance), forward_(0.0f, 0.0f, -1.0f) {}

void PerspectiveCamera::SetViewportSize(int width, int height) {
    viewport_width_ = std::max(1, width);
    viewport_height_ = std::max(1, height);
    aspect_ratio_ = static_cast<float>(viewport_width_) / static_cast<float>(viewport_height_);
}

void PerspectiveCamera::LookAt(const glm::vec3& target) {
    glm::vec3 dir = target - position_;
    float len = glm::length(dir);
    if (len > 1e-6f) {
        forward_ = dir / len;
    }
}

glm::vec3 PerspectiveCamera::GetRight() const {
    glm::vec3 right = glm::cross(forward_, kWorldUp);
    float len = glm::length(right);
    if (len < 1e-6f) {
        // Looking straight up or down; any horizontal axis will do.
        return glm::vec3(1.0f, 0.0f, 0.0f);
    }
    return right / len;
}

glm::vec3 PerspectiveCamera::GetUp() const {
    return glm::normalize(glm::cross(GetRight(), forward_));
}

glm::mat4 PerspectiveCamera::GetViewMatrix() const {
    return glm::lookAt(position_, position_ + forward_, GetUp());
}

glm::mat4 PerspectiveCamera::GetProjectionMatrix() const {
    return glm::perspective(glm::radians(fov_degrees_), aspect_ratio_, near_plane_, far_plane_);
}

glm::mat4 PerspectiveCamera::GetViewProjectionMatrix() const {
    return GetProjectionMatrix() * GetViewMatrix();
}

glm::vec2 CameraUtils::ScreenToNdc(const glm::vec2& pixel, int viewport_width, int viewport_height) {
    const float w = static_cast<float>(std::max(1, viewport_width));
    const float h = static_cast<float>(std::max(1, viewport_height));
    return glm::vec2((pixel.x / w) * 2.0f - 1.0f, -(pixel.y / h) * 2.0f + 1.0f);
}

bool CameraUtils::WorldToScreen(const glm::vec3& world_pos, const PerspectiveCamera& camera, glm::vec2& out_pixel) {
    glm::vec4 clip = camera.GetViewProjectionMatrix() * glm::vec4(world_pos, 1.0f);
    if (clip.w <= 0.0f) return false;
    const glm::vec2 ndc(clip.x / clip.w, clip.y / clip.w);
    out_pixel.x = (ndc.x + 1.0f) * 0.5f * static_cast<float>(camera.GetViewportWidth());
    out_pixel.y = (1.0f - ndc.y) * 0.5f * static_cast<float>(camera.GetViewportHeight());
    return true;
}

Ray CameraUtils::RayFromNdc(const glm::vec2& ndc, const PerspectiveCamera& camera) {
    const float tan_half_fov = std::tan(glm::radians(camera.GetFovDegrees()) * 0.5f);
    const glm::vec3 direction = camera.GetForward() +
                                camera.GetRight() * (ndc.x * tan_half_fov * camera.GetAspect()) +
                                camera.GetUp() * (ndc.y * tan_half_fov);
    return Ray{camera.GetPosition(), glm::normalize(direction)};
}

Ray CameraUtils::RayFromScreen(const glm::vec2& pixel, const PerspectiveCamera& camera) {
    return RayFromNdc(ScreenToNdc(pixel, camera.GetViewportWidth(), camera.GetViewportHeight()), camera);
}

float CameraUtils::WorldUnitsPerPixel(const PerspectiveCamera& camera, float depth) {
    const float tan_half_fov = std::tan(glm::radians(camera.GetFovDegrees()) * 0.5f);
    const float visible_height = 2.0f * std::max(depth, camera.GetNear()) * tan_half_fov;
    return visible_height / static_cast<float>(camera.GetViewportHeight());
}

} // namespace graph
} // namespace kgview
