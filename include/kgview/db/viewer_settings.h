#ifndef KGVIEW_VIEWER_SETTINGS_H
#define KGVIEW_VIEWER_SETTINGS_H

#include <kgview/graph/render/color_palette.h>

namespace kgview {
namespace db {

class SettingsStore;

// User-adjustable viewer options persisted in the settings table.
struct ViewerSettings {
    ThemeType theme = ThemeType::DARK;
    float move_speed;
    float hit_radius_px;
    float damping_factor;
    bool animate = true;
    int layout_iterations;

    ViewerSettings();

    // Missing keys keep their defaults. Unparsable or out-of-range values
    // are replaced by defaults with a warning on std::cerr.
    static ViewerSettings Load(SettingsStore& store);
    // Throws std::runtime_error if a write fails.
    void Save(SettingsStore& store) const;
};

// Accepted ranges, inclusive.
namespace settings_limits {
    constexpr float kMinMoveSpeed = 1.0f;
    constexpr float kMaxMoveSpeed = 1000.0f;
    constexpr float kMinHitRadiusPx = 1.0f;
    constexpr float kMaxHitRadiusPx = 64.0f;
    constexpr float kMinDampingFactor = 0.01f;
    constexpr float kMaxDampingFactor = 1.0f;
    constexpr int kMinLayoutIterations = 0;
    constexpr int kMaxLayoutIterations = 5000;
}

} // namespace db
} // namespace kgview

#endif // KGVIEW_VIEWER_SETTINGS_H
