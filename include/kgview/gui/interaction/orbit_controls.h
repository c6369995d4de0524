#ifndef KGVIEW_ORBIT_CONTROLS_H
#define KGVIEW_ORBIT_CONTROLS_H

#include <glm/vec3.hpp>

namespace kgview {

namespace graph {
class PerspectiveCamera;
}

namespace gui {

/*
 * Orbit camera around a target point, driven by yaw, pitch and distance.
 *
 * Rotate() and Zoom() only accumulate pending deltas. Each Update() applies
 * damping_factor of what is pending and keeps the remainder, so motion eases
 * out over the following frames.
 */
class OrbitControls {
public:
    struct Params {
        float damping_factor;
        float radians_per_pixel;
        float zoom_step;        // Log-distance change per scroll unit
        float min_distance;
        float max_distance;
        float max_pitch;        // Radians, symmetric around the horizon

        Params();
    };

    explicit OrbitControls(graph::PerspectiveCamera& camera, const Params& params = Params());

    void Rotate(float dx_px, float dy_px);
    void Zoom(float scroll_delta);

    // Applies the damped share of pending motion and advances a running
    // focus animation. Returns true when the camera moved.
    bool Update(float dt);

    // Moves target and camera together (free movement).
    void Translate(const glm::vec3& delta);

    // Eases the target to a new point over duration seconds (0 = jump).
    void FocusOn(const glm::vec3& target, float duration);

    // Places the camera in front of target at the given distance and drops
    // any pending motion.
    void Frame(const glm::vec3& target, float distance);

    // Re-derives yaw, pitch and distance from the camera's current position.
    void SyncFromCamera();

    void SetParams(const Params& params) { params_ = params; }
    const Params& GetParams() const { return params_; }

    const glm::vec3& GetTarget() const { return target_; }
    float GetYaw() const { return yaw_; }
    float GetPitch() const { return pitch_; }
    float GetDistance() const { return distance_; }
    bool HasPendingMotion() const;
    // Drops accumulated drag and scroll input without applying it.
    void CancelPendingMotion();
    bool IsFocusing() const { return focusing_; }

private:
    void ApplyToCamera();

    graph::PerspectiveCamera& camera_;
    Params params_;

    glm::vec3 target_{0.0f};
    float yaw_ = 0.0f;
    float pitch_ = 0.0f;
    float distance_ = 1.0f;

    float pending_yaw_ = 0.0f;
    float pending_pitch_ = 0.0f;
    float pending_zoom_ = 0.0f;

    bool focusing_ = false;
    glm::vec3 focus_from_{0.0f};
    glm::vec3 focus_to_{0.0f};
    float focus_elapsed_ = 0.0f;
    float focus_duration_ = 0.0f;
};

} // namespace gui
} // namespace kgview

#endif // KGVIEW_ORBIT_CONTROLS_H
