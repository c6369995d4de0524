#pragma once

#include <kgview/gui/interaction/interaction_controller.h>

#include <optional>

namespace kgview {
namespace gui {

/*
 * Detail popup for the selected node, anchored at the click position.
 * Show() and Hide() are wired to the viewport's selection stream;
 * Draw() runs inside an ImGui frame.
 */
class NodePopup {
public:
    void Show(const NodeSelectedEvent& event) { selected_ = event; }
    void Hide() { selected_.reset(); }
    bool IsVisible() const { return selected_.has_value(); }
    const std::optional<NodeSelectedEvent>& GetSelected() const { return selected_; }

    // Returns false when the user closed the popup this frame.
    bool Draw();

private:
    std::optional<NodeSelectedEvent> selected_;
};

} // namespace gui
} // namespace kgview
