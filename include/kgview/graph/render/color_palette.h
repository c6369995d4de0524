#pragma once

#include <glm/vec3.hpp>

namespace kgview {

enum class ThemeType {
    DARK,
    WHITE
};

namespace graph {

// Static colour table for one theme. Evaluated when primitives are built.
struct NodeColorPalette {
    glm::vec3 seed_node;
    glm::vec3 generated_node;
    glm::vec3 default_node;
    glm::vec3 edge;
    glm::vec3 background;
    glm::vec3 star;
};

const NodeColorPalette& GetThemePalette(ThemeType theme);

} // namespace graph
} // namespace kgview
