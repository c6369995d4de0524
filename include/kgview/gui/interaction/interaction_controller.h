#ifndef KGVIEW_INTERACTION_CONTROLLER_H
#define KGVIEW_INTERACTION_CONTROLLER_H

#include <kgview/core/id_types.h>
#include <kgview/graph/graph_model.h>
#include <kgview/gui/interaction/free_movement.h>
#include <kgview/gui/interaction/input_events.h>
#include <kgview/gui/interaction/orbit_controls.h>
#include <kgview/gui/interaction/pointer_picker.h>

#include <glm/vec2.hpp>

#include <functional>
#include <memory>
#include <optional>

namespace kgview {

namespace graph {
class PerspectiveCamera;
struct ScenePrimitives;
}

namespace gui {

struct NodeSelectedEvent {
    graph::GraphNode node;
    glm::vec2 screen_position; // Surface pixels of the click
};

struct SelectionState {
    NodeId node_id;
    glm::vec2 screen_position;
};

/*
 * Turns raw input into camera motion and selection events.
 *
 * Primary click (press and release without dragging): pick a node.
 * Primary drag: orbit. Scroll: zoom. WASD/QE/Space/Shift: free movement.
 * F focuses the selected node, Escape clears the selection.
 *
 * Registers itself with the event source on construction and unregisters
 * in Dispose(). Once disposed every handler is a no-op.
 */
class InteractionController : public InputListener {
public:
    struct Params {
        float hit_radius_px;
        float move_speed;               // World units per second
        float click_drag_threshold_px;
        float focus_duration;           // Seconds
        OrbitControls::Params orbit;

        Params();
    };

    using NodeSelectedCallback = std::function<void(const NodeSelectedEvent&)>;
    using SelectionClearedCallback = std::function<void()>;

    InteractionController(InputEventSource& events,
                          const ViewportSizeProvider& viewport,
                          graph::PerspectiveCamera& camera,
                          const Params& params = Params());
    ~InteractionController() override;

    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    // Scene used for picking. Keeps the selection if the node survives.
    void SetScene(std::shared_ptr<const graph::GraphModel> model,
                  std::shared_ptr<const graph::ScenePrimitives> primitives);

    void SetNodeSelectedCallback(NodeSelectedCallback callback) { on_selected_ = std::move(callback); }
    void SetSelectionClearedCallback(SelectionClearedCallback callback) { on_cleared_ = std::move(callback); }

    // Per-frame step: free movement, then damped orbit.
    void Advance(float dt);

    const std::optional<SelectionState>& GetSelection() const { return selection_; }
    void ClearSelection();
    // Forgets pending orbit and zoom input and releases all held keys.
    void ResetMotion();
    // Starts a focus animation on the selected node. False if none.
    bool FocusSelected();

    void SetParams(const Params& params);
    const Params& GetParams() const { return params_; }

    OrbitControls& GetOrbitControls() { return orbit_; }
    const ActiveInputSet& GetActiveInput() const { return active_input_; }

    void Dispose();
    bool IsDisposed() const { return disposed_; }

    // InputListener
    void OnPointerButton(const PointerButtonEvent& event) override;
    void OnPointerMove(const PointerMoveEvent& event) override;
    void OnScroll(const ScrollEvent& event) override;
    void OnKey(const KeyEvent& event) override;
    void OnResize(const ResizeEvent& event) override;

private:
    void HandleClick(const glm::vec2& window_position);
    void SyncViewportSize();
    glm::vec2 ToSurface(const glm::vec2& window_position) const;
    bool InsideSurface(const glm::vec2& window_position) const;

    InputEventSource& events_;
    const ViewportSizeProvider& viewport_;
    graph::PerspectiveCamera& camera_;
    Params params_;

    OrbitControls orbit_;
    PointerPicker picker_;
    ActiveInputSet active_input_;

    std::shared_ptr<const graph::GraphModel> model_;
    std::shared_ptr<const graph::ScenePrimitives> primitives_;
    std::optional<SelectionState> selection_;

    bool primary_down_ = false;
    glm::vec2 press_position_{0.0f};
    glm::vec2 last_pointer_{0.0f};
    float drag_distance_ = 0.0f;

    NodeSelectedCallback on_selected_;
    SelectionClearedCallback on_cleared_;
    bool disposed_ = false;
};

} // namespace gui
} // namespace kgview

#endif // KGVIEW_INTERACTION_CONTROLLER_H
