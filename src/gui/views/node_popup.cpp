#include <kgview/gui/views/node_popup.h>

#include <imgui.h>

#include <string>

namespace kgview {
namespace gui {

bool NodePopup::Draw() {
    if (!selected_) return true;

    const graph::GraphNode& node = selected_->node;
    const glm::vec2& anchor = selected_->screen_position;

    ImGui::SetNextWindowPos(ImVec2(anchor.x + 12.0f, anchor.y + 12.0f), ImGuiCond_Appearing);
    ImGui::SetNextWindowSizeConstraints(ImVec2(220.0f, 0.0f), ImVec2(420.0f, 480.0f));

    bool open = true;
    const std::string title = "Node " + node.id() + "###NodeDetails";
    if (ImGui::Begin(title.c_str(), &open, ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings)) {
        ImGui::Text("ID: %s", node.id().c_str());
        ImGui::Text("Type: %s", node.record.type.c_str());
        if (node.is_seed) {
            ImGui::SameLine();
            ImGui::TextDisabled("(seed)");
        }
        if (node.is_generated) {
            ImGui::SameLine();
            ImGui::TextDisabled("(generated)");
        }
        ImGui::Separator();
        ImGui::PushTextWrapPos(ImGui::GetCursorPos().x + 380.0f);
        ImGui::TextWrapped("%s", node.record.content.c_str());
        ImGui::PopTextWrapPos();
        ImGui::Separator();
        if (!node.record.created_at.empty()) {
            ImGui::Text("Created: %s", node.record.created_at.c_str());
        }
        if (node.record.updated_at) {
            ImGui::Text("Updated: %s", node.record.updated_at->c_str());
        }
        if (ImGui::Button("Copy content")) {
            ImGui::SetClipboardText(node.record.content.c_str());
        }
    }
    ImGui::End();

    if (!open) {
        selected_.reset();
        return false;
    }
    return true;
}

} // namespace gui
} // namespace kgview
