#include <kgview/gui/render/theme_utils.h>

#include <imgui.h>

namespace kgview {
namespace ThemeUtils {

void applyDarkTheme() {
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    // Translucent overlays over the 3D scene
    style.Colors[ImGuiCol_WindowBg].w = 0.85f;
    style.Colors[ImGuiCol_PopupBg].w = 0.92f;
}

void applyWhiteTheme() {
    ImGui::StyleColorsLight();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.97f, 0.97f, 0.97f, 0.90f);
    style.Colors[ImGuiCol_PopupBg].w = 0.95f;
}

void setTheme(ThemeType theme) {
    switch (theme) {
        case ThemeType::WHITE:
            applyWhiteTheme();
            break;
        case ThemeType::DARK:
        default:
            applyDarkTheme();
            break;
    }
}

} // namespace ThemeUtils
} // namespace kgview
