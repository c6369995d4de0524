#include <kgview/gui/interaction/free_movement.h>
#include <kgview/graph/render/camera_utils.h>

#include <glm/geometric.hpp>

namespace kgview {
namespace gui {

std::optional<MovementKey> MovementKeyFor(Key key) {
    switch (key) {
        case Key::W: return MovementKey::FORWARD;
        case Key::S: return MovementKey::BACK;
        case Key::A: return MovementKey::STRAFE_LEFT;
        case Key::D: return MovementKey::STRAFE_RIGHT;
        case Key::E:
        case Key::SPACE: return MovementKey::UP;
        case Key::Q:
        case Key::LEFT_SHIFT: return MovementKey::DOWN;
        default: return std::nullopt;
    }
}

bool ActiveInputSet::Press(Key key) {
    if (!MovementKeyFor(key)) return false;
    keys_.set(static_cast<std::size_t>(key));
    return true;
}

bool ActiveInputSet::Release(Key key) {
    if (!MovementKeyFor(key)) return false;
    keys_.reset(static_cast<std::size_t>(key));
    return true;
}

bool ActiveInputSet::Holds(Key key) const {
    return MovementKeyFor(key).has_value() && keys_.test(static_cast<std::size_t>(key));
}

bool ActiveInputSet::Contains(MovementKey direction) const {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_.test(i) && MovementKeyFor(static_cast<Key>(i)) == direction) return true;
    }
    return false;
}

glm::vec3 LocalMovementDirection(const ActiveInputSet& input) {
    glm::vec3 direction(0.0f);
    if (input.Contains(MovementKey::FORWARD)) direction.z += 1.0f;
    if (input.Contains(MovementKey::BACK)) direction.z -= 1.0f;
    if (input.Contains(MovementKey::STRAFE_RIGHT)) direction.x += 1.0f;
    if (input.Contains(MovementKey::STRAFE_LEFT)) direction.x -= 1.0f;
    if (input.Contains(MovementKey::UP)) direction.y += 1.0f;
    if (input.Contains(MovementKey::DOWN)) direction.y -= 1.0f;

    const float len = glm::length(direction);
    if (len < 1e-6f) return glm::vec3(0.0f);
    return direction / len;
}

glm::vec3 WorldMovementDelta(const ActiveInputSet& input,
                             const graph::PerspectiveCamera& camera,
                             float speed,
                             float dt) {
    const glm::vec3 local = LocalMovementDirection(input);
    if (local == glm::vec3(0.0f)) return local;

    const glm::vec3 world = camera.GetRight() * local.x +
                            camera.GetUp() * local.y +
                            camera.GetForward() * local.z;
    return world * (speed * dt);
}

} // namespace gui
} // namespace kgview
