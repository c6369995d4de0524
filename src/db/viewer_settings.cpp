#include <kgview/db/viewer_settings.h>
#include <kgview/db/settings_store.h>
#include <kgview/core/config.h>

#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace kgview {
namespace db {

namespace {

constexpr const char* kThemeKey = "theme";
constexpr const char* kMoveSpeedKey = "move_speed";
constexpr const char* kHitRadiusKey = "hit_radius_px";
constexpr const char* kDampingKey = "damping_factor";
constexpr const char* kAnimateKey = "animate";
constexpr const char* kLayoutIterationsKey = "layout_iterations";

template<typename T, typename Parse>
void loadRanged(SettingsStore& store, const char* key, T min_value, T max_value, T& target, Parse parse) {
    std::optional<std::string> raw = store.loadSetting(key);
    if (!raw) return;

    try {
        T value = parse(*raw);
        if (value < min_value || value > max_value) {
            std::cerr << "Warning: setting '" << key << "' out of range (" << *raw
                      << "), using default " << target << std::endl;
            return;
        }
        target = value;
    } catch (const std::exception& e) {
        std::cerr << "Warning: could not parse setting '" << key << "' (" << *raw
                  << "): " << e.what() << ". Using default." << std::endl;
    }
}

} // end anonymous namespace

ViewerSettings::ViewerSettings()
    : move_speed(config::kDefaultMoveSpeed),
      hit_radius_px(config::kDefaultHitRadiusPx),
      damping_factor(config::kDefaultDampingFactor),
      layout_iterations(config::kDefaultLayoutIterations) {}

ViewerSettings ViewerSettings::Load(SettingsStore& store) {
    ViewerSettings settings;

    if (auto theme = store.loadSetting(kThemeKey)) {
        if (*theme == "WHITE") {
            settings.theme = ThemeType::WHITE;
        } else if (*theme != "DARK") {
            std::cerr << "Warning: unknown theme '" << *theme << "', using DARK" << std::endl;
        }
    }

    if (auto animate = store.loadSetting(kAnimateKey)) {
        if (*animate == "1" || *animate == "true") {
            settings.animate = true;
        } else if (*animate == "0" || *animate == "false") {
            settings.animate = false;
        } else {
            std::cerr << "Warning: invalid value for setting 'animate' (" << *animate << ")" << std::endl;
        }
    }

    auto parse_float = [](const std::string& s) {
        std::size_t consumed = 0;
        const float value = std::stof(s, &consumed);
        if (consumed != s.size() || !std::isfinite(value)) {
            throw std::invalid_argument("not a finite number");
        }
        return value;
    };
    auto parse_int = [](const std::string& s) {
        std::size_t consumed = 0;
        const int value = std::stoi(s, &consumed);
        if (consumed != s.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    };

    loadRanged(store, kMoveSpeedKey, settings_limits::kMinMoveSpeed, settings_limits::kMaxMoveSpeed,
               settings.move_speed, parse_float);
    loadRanged(store, kHitRadiusKey, settings_limits::kMinHitRadiusPx, settings_limits::kMaxHitRadiusPx,
               settings.hit_radius_px, parse_float);
    loadRanged(store, kDampingKey, settings_limits::kMinDampingFactor, settings_limits::kMaxDampingFactor,
               settings.damping_factor, parse_float);
    loadRanged(store, kLayoutIterationsKey, settings_limits::kMinLayoutIterations,
               settings_limits::kMaxLayoutIterations, settings.layout_iterations, parse_int);

    return settings;
}

void ViewerSettings::Save(SettingsStore& store) const {
    store.saveSetting(kThemeKey, theme == ThemeType::WHITE ? "WHITE" : "DARK");
    store.saveSetting(kAnimateKey, animate ? "1" : "0");
    store.saveSetting(kMoveSpeedKey, std::to_string(move_speed));
    store.saveSetting(kHitRadiusKey, std::to_string(hit_radius_px));
    store.saveSetting(kDampingKey, std::to_string(damping_factor));
    store.saveSetting(kLayoutIterationsKey, std::to_string(layout_iterations));
}

} // namespace db
} // namespace kgview
