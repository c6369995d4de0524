#include <kgview/gui/views/main_gui_views.h>
#include <kgview/gui/views/graph_viewport.h>

#include <imgui.h>

namespace kgview {
namespace gui {

namespace {
void drawControlsHelp() {
    ImGui::TextDisabled("Drag: orbit   Scroll: zoom   Click: select");
    ImGui::TextDisabled("W/S A/D: move   E/Q, Space/Shift: up/down");
    ImGui::TextDisabled("F: focus selection   Esc: clear selection");
}
} // anonymous namespace

SettingsPanelActions drawSettingsPanel(db::ViewerSettings& settings,
                                       GraphViewport& viewport,
                                       const GraphFileStatus& status) {
    SettingsPanelActions actions;

    ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowBgAlpha(0.8f);
    if (!ImGui::Begin("kgview", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::End();
        return actions;
    }

    ImGui::Text("File: %s", status.path.c_str());
    ImGui::Text("Nodes: %zu  Edges: %zu", status.node_count, status.edge_count);
    if (status.dropped_edges > 0) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%zu dropped)", status.dropped_edges);
    }
    if (!status.last_error.empty()) {
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.3f, 1.0f), "Load error: %s", status.last_error.c_str());
    }
    if (viewport.IsLayoutInProgress()) {
        ImGui::TextColored(ImVec4(1.0f, 1.0f, 0.0f, 1.0f), "Layout running...");
    }

    if (ImGui::Button("Reload")) actions.reload_requested = true;
    ImGui::SameLine();
    if (ImGui::Button("Focus selection")) actions.focus_requested = true;

    if (ImGui::CollapsingHeader("Settings")) {
        ImGui::Indent();

        ImGui::Text("Theme:"); ImGui::SameLine();
        if (ImGui::RadioButton("Dark", settings.theme == ThemeType::DARK)) {
            settings.theme = ThemeType::DARK;
            actions.settings_changed = true;
        }
        ImGui::SameLine();
        if (ImGui::RadioButton("White", settings.theme == ThemeType::WHITE)) {
            settings.theme = ThemeType::WHITE;
            actions.settings_changed = true;
        }

        if (ImGui::Checkbox("Animate", &settings.animate)) actions.settings_changed = true;

        ImGui::SetNextItemWidth(180.0f);
        if (ImGui::SliderFloat("Move speed", &settings.move_speed,
                               db::settings_limits::kMinMoveSpeed, 300.0f, "%.0f")) {
            actions.settings_changed = true;
        }
        ImGui::SetNextItemWidth(180.0f);
        if (ImGui::SliderFloat("Hit radius (px)", &settings.hit_radius_px,
                               db::settings_limits::kMinHitRadiusPx, 32.0f, "%.0f")) {
            actions.settings_changed = true;
        }
        ImGui::SetNextItemWidth(180.0f);
        if (ImGui::SliderFloat("Damping", &settings.damping_factor,
                               db::settings_limits::kMinDampingFactor,
                               db::settings_limits::kMaxDampingFactor, "%.2f")) {
            actions.settings_changed = true;
        }
        ImGui::SetNextItemWidth(180.0f);
        if (ImGui::SliderInt("Layout iterations", &settings.layout_iterations,
                             db::settings_limits::kMinLayoutIterations, 500)) {
            actions.settings_changed = true;
        }
        ImGui::TextDisabled("Iterations apply on the next reload.");

        ImGui::Unindent();
    }

    if (ImGui::CollapsingHeader("Controls")) {
        drawControlsHelp();
    }

    ImGui::End();
    return actions;
}

} // namespace gui
} // namespace kgview
