#pragma once

#include <kgview/gui/interaction/input_events.h>

#include <glm/vec3.hpp>

#include <bitset>
#include <optional>

namespace kgview {

namespace graph {
class PerspectiveCamera;
}

namespace gui {

enum class MovementKey {
    FORWARD,
    BACK,
    STRAFE_LEFT,
    STRAFE_RIGHT,
    UP,
    DOWN,
    COUNT
};

// W/S forward/back, A/D strafe, E/Space up, Q/Left Shift down.
std::optional<MovementKey> MovementKeyFor(Key key);

/*
 * Set of currently held movement keys. Idempotent: pressing a held key or
 * releasing a free one changes nothing. Directions are derived from the held
 * keys, so two keys bound to the same direction release independently.
 */
class ActiveInputSet {
public:
    // Keys without a movement binding are ignored; returns false for them.
    bool Press(Key key);
    bool Release(Key key);
    void Clear() { keys_.reset(); }

    bool Holds(Key key) const;
    // True while at least one key bound to the direction is held.
    bool Contains(MovementKey direction) const;
    bool Empty() const { return keys_.none(); }

private:
    std::bitset<static_cast<std::size_t>(Key::OTHER)> keys_;
};

// Camera-local direction (x right, y up, z forward) of the held keys,
// unit length or zero. Opposing keys cancel.
glm::vec3 LocalMovementDirection(const ActiveInputSet& input);

// World-space displacement for one frame: the local direction rotated into
// the camera's orientation and scaled by speed * dt.
glm::vec3 WorldMovementDelta(const ActiveInputSet& input,
                             const graph::PerspectiveCamera& camera,
                             float speed,
                             float dt);

} // namespace gui
} // namespace kgview
