#include <kgview/gui/interaction/orbit_controls.h>
#include <kgview/core/config.h>
#include <kgview/graph/render/camera_utils.h>

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>

namespace kgview {
namespace gui {

namespace {
    // Remaining pending motion below this is dropped.
    constexpr float kSettleEpsilon = 1e-5f;
}

OrbitControls::Params::Params()
    : damping_factor(config::kDefaultDampingFactor),
      radians_per_pixel(config::kOrbitRadiansPerPixel),
      zoom_step(config::kZoomStep),
      min_distance(1.0f),
      max_distance(config::kCameraFarPlane * 0.8f),
      max_pitch(1.55f) {}

OrbitControls::OrbitControls(graph::PerspectiveCamera& camera, const Params& params)
    : camera_(camera), params_(params) {
    SyncFromCamera();
}

void OrbitControls::Rotate(float dx_px, float dy_px) {
    pending_yaw_ -= dx_px * params_.radians_per_pixel;
    pending_pitch_ += dy_px * params_.radians_per_pixel;
}

void OrbitControls::Zoom(float scroll_delta) {
    pending_zoom_ += scroll_delta * params_.zoom_step;
}

bool OrbitControls::HasPendingMotion() const {
    return std::abs(pending_yaw_) > kSettleEpsilon ||
           std::abs(pending_pitch_) > kSettleEpsilon ||
           std::abs(pending_zoom_) > kSettleEpsilon;
}

void OrbitControls::CancelPendingMotion() {
    pending_yaw_ = pending_pitch_ = pending_zoom_ = 0.0f;
}

bool OrbitControls::Update(float dt) {
    bool moved = false;

    if (focusing_) {
        focus_elapsed_ += std::max(dt, 0.0f);
        float t = focus_duration_ > 0.0f ? focus_elapsed_ / focus_duration_ : 1.0f;
        if (t >= 1.0f) {
            t = 1.0f;
            focusing_ = false;
        }
        target_ = graph::Easing::LerpVec3(focus_from_, focus_to_, graph::Easing::EaseOutCubic(t));
        moved = true;
    }

    if (HasPendingMotion()) {
        const float k = std::clamp(params_.damping_factor, 0.0f, 1.0f);

        const float yaw_step = pending_yaw_ * k;
        const float pitch_step = pending_pitch_ * k;
        const float zoom_step = pending_zoom_ * k;
        pending_yaw_ -= yaw_step;
        pending_pitch_ -= pitch_step;
        pending_zoom_ -= zoom_step;

        yaw_ += yaw_step;
        pitch_ = std::clamp(pitch_ + pitch_step, -params_.max_pitch, params_.max_pitch);
        // Positive scroll zooms in.
        distance_ = std::clamp(distance_ * std::exp(-zoom_step),
                               params_.min_distance, params_.max_distance);
        moved = true;
    } else {
        pending_yaw_ = pending_pitch_ = pending_zoom_ = 0.0f;
    }

    if (moved) {
        ApplyToCamera();
    }
    return moved;
}

void OrbitControls::Translate(const glm::vec3& delta) {
    target_ += delta;
    if (focusing_) {
        focus_from_ += delta;
        focus_to_ += delta;
    }
    camera_.SetPosition(camera_.GetPosition() + delta);
}

void OrbitControls::FocusOn(const glm::vec3& target, float duration) {
    if (duration <= 0.0f) {
        focusing_ = false;
        target_ = target;
        ApplyToCamera();
        return;
    }
    focusing_ = true;
    focus_from_ = target_;
    focus_to_ = target;
    focus_elapsed_ = 0.0f;
    focus_duration_ = duration;
}

void OrbitControls::Frame(const glm::vec3& target, float distance) {
    focusing_ = false;
    pending_yaw_ = pending_pitch_ = pending_zoom_ = 0.0f;
    target_ = target;
    yaw_ = 0.0f;
    pitch_ = 0.0f;
    distance_ = std::clamp(distance, params_.min_distance, params_.max_distance);
    ApplyToCamera();
}

void OrbitControls::SyncFromCamera() {
    const glm::vec3 offset = camera_.GetPosition() - target_;
    const float len = glm::length(offset);
    if (len < 1e-6f) {
        distance_ = params_.min_distance;
        yaw_ = 0.0f;
        pitch_ = 0.0f;
        ApplyToCamera();
        return;
    }
    distance_ = std::clamp(len, params_.min_distance, params_.max_distance);
    pitch_ = std::clamp(std::asin(std::clamp(offset.y / len, -1.0f, 1.0f)),
                        -params_.max_pitch, params_.max_pitch);
    yaw_ = std::atan2(offset.x, offset.z);
}

void OrbitControls::ApplyToCamera() {
    const float cp = std::cos(pitch_);
    const float sp = std::sin(pitch_);
    const float cy = std::cos(yaw_);
    const float sy = std::sin(yaw_);

    const glm::vec3 offset(distance_ * cp * sy, distance_ * sp, distance_ * cp * cy);
    camera_.SetPosition(target_ + offset);
    camera_.LookAt(target_);
}

} // namespace gui
} // namespace kgview
