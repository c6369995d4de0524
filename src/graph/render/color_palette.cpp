#include <kgview/graph/render/color_palette.h>

namespace kgview {
namespace graph {

namespace {
const NodeColorPalette kDarkPalette{
    glm::vec3(1.00f, 0.84f, 0.00f),  // seed: gold
    glm::vec3(0.31f, 0.80f, 0.77f),  // generated: teal
    glm::vec3(0.39f, 0.58f, 0.93f),  // default: cornflower
    glm::vec3(0.45f, 0.45f, 0.50f),
    glm::vec3(0.06f, 0.06f, 0.09f),
    glm::vec3(0.55f, 0.55f, 0.65f),
};

const NodeColorPalette kWhitePalette{
    glm::vec3(0.90f, 0.49f, 0.13f),  // seed: orange
    glm::vec3(0.10f, 0.60f, 0.45f),  // generated: green
    glm::vec3(0.16f, 0.38f, 0.75f),  // default: blue
    glm::vec3(0.62f, 0.62f, 0.66f),
    glm::vec3(0.97f, 0.97f, 0.98f),
    glm::vec3(0.78f, 0.78f, 0.84f),
};
} // anonymous namespace

const NodeColorPalette& GetThemePalette(ThemeType theme) {
    switch (theme) {
        case ThemeType::WHITE: return kWhitePalette;
        case ThemeType::DARK:
        default: return kDarkPalette;
    }
}

} // namespace graph
} // namespace kgview
