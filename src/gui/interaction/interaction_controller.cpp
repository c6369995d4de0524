#include <kgview/gui/interaction/interaction_controller.h>
#include <kgview/core/config.h>
#include <kgview/graph/render/camera_utils.h>
#include <kgview/graph/render/scene_primitives.h>

#include <glm/geometric.hpp>

#include <algorithm>
#include <iterator>

namespace kgview {
namespace gui {

InteractionController::Params::Params()
    : hit_radius_px(config::kDefaultHitRadiusPx),
      move_speed(config::kDefaultMoveSpeed),
      click_drag_threshold_px(config::kClickDragThresholdPx),
      focus_duration(0.6f),
      orbit() {}

InteractionController::InteractionController(InputEventSource& events,
                                             const ViewportSizeProvider& viewport,
                                             graph::PerspectiveCamera& camera,
                                             const Params& params)
    : events_(events),
      viewport_(viewport),
      camera_(camera),
      params_(params),
      orbit_(camera, params.orbit),
      picker_(params.hit_radius_px) {
    SyncViewportSize();
    events_.AddListener(this);
}

InteractionController::~InteractionController() {
    Dispose();
}

void InteractionController::Dispose() {
    if (disposed_) return;
    disposed_ = true;
    events_.RemoveListener(this);
    active_input_.Clear();
    primary_down_ = false;
    on_selected_ = nullptr;
    on_cleared_ = nullptr;
    model_.reset();
    primitives_.reset();
}

void InteractionController::SetParams(const Params& params) {
    params_ = params;
    orbit_.SetParams(params.orbit);
    picker_.SetHitRadius(params.hit_radius_px);
}

void InteractionController::SetScene(std::shared_ptr<const graph::GraphModel> model,
                                     std::shared_ptr<const graph::ScenePrimitives> primitives) {
    if (disposed_) return;
    model_ = std::move(model);
    primitives_ = std::move(primitives);

    if (selection_ && (!model_ || !model_->FindNode(selection_->node_id))) {
        ClearSelection();
    }
}

void InteractionController::Advance(float dt) {
    if (disposed_) return;

    if (!active_input_.Empty()) {
        const glm::vec3 delta = WorldMovementDelta(active_input_, camera_, params_.move_speed, dt);
        orbit_.Translate(delta);
    }
    orbit_.Update(dt);
}

void InteractionController::ResetMotion() {
    orbit_.CancelPendingMotion();
    active_input_.Clear();
}

void InteractionController::ClearSelection() {
    if (!selection_) return;
    selection_.reset();
    if (on_cleared_) on_cleared_();
}

bool InteractionController::FocusSelected() {
    if (disposed_ || !selection_ || !model_ || !primitives_) return false;

    auto index = model_->IndexOf(selection_->node_id);
    if (!index) return false;

    const auto& mapping = primitives_->point_to_node;
    auto it = std::find(mapping.begin(), mapping.end(), *index);
    if (it == mapping.end()) return false;

    const auto point = static_cast<std::size_t>(std::distance(mapping.begin(), it));
    orbit_.FocusOn(primitives_->points[point].position, params_.focus_duration);
    return true;
}

void InteractionController::OnPointerButton(const PointerButtonEvent& event) {
    if (disposed_ || event.button != MouseButton::PRIMARY) return;

    if (event.pressed) {
        if (!InsideSurface(event.position)) return;
        primary_down_ = true;
        press_position_ = event.position;
        last_pointer_ = event.position;
        drag_distance_ = 0.0f;
        return;
    }

    if (!primary_down_) return;
    primary_down_ = false;
    if (drag_distance_ < params_.click_drag_threshold_px) {
        HandleClick(event.position);
    }
}

void InteractionController::OnPointerMove(const PointerMoveEvent& event) {
    if (disposed_ || !primary_down_) return;

    const glm::vec2 delta = event.position - last_pointer_;
    last_pointer_ = event.position;
    drag_distance_ = std::max(drag_distance_, glm::length(event.position - press_position_));

    if (drag_distance_ >= params_.click_drag_threshold_px) {
        orbit_.Rotate(delta.x, delta.y);
    }
}

void InteractionController::OnScroll(const ScrollEvent& event) {
    if (disposed_) return;
    orbit_.Zoom(event.delta);
}

void InteractionController::OnKey(const KeyEvent& event) {
    if (disposed_) return;

    const bool movement = event.pressed ? active_input_.Press(event.key)
                                        : active_input_.Release(event.key);
    if (movement) return;

    if (!event.pressed) return;
    if (event.key == Key::F) {
        FocusSelected();
    } else if (event.key == Key::ESCAPE) {
        ClearSelection();
    }
}

void InteractionController::OnResize(const ResizeEvent&) {
    if (disposed_) return;
    SyncViewportSize();
}

void InteractionController::HandleClick(const glm::vec2& window_position) {
    if (!InsideSurface(window_position)) return;

    const glm::vec2 surface_position = ToSurface(window_position);

    std::optional<PickResult> hit;
    if (primitives_) {
        hit = picker_.Pick(surface_position, camera_, *primitives_);
    }

    if (!hit || !model_ || hit->node_index >= model_->NodeCount()) {
        ClearSelection();
        return;
    }

    const graph::GraphNode& node = model_->Nodes()[hit->node_index];
    selection_ = SelectionState{node.id(), surface_position};
    if (on_selected_) on_selected_(NodeSelectedEvent{node, surface_position});
}

void InteractionController::SyncViewportSize() {
    const SurfaceRect rect = viewport_.GetSurfaceRect();
    camera_.SetViewportSize(rect.width, rect.height);
}

glm::vec2 InteractionController::ToSurface(const glm::vec2& window_position) const {
    const SurfaceRect rect = viewport_.GetSurfaceRect();
    return window_position - glm::vec2(rect.x, rect.y);
}

bool InteractionController::InsideSurface(const glm::vec2& window_position) const {
    const SurfaceRect rect = viewport_.GetSurfaceRect();
    const glm::vec2 p = window_position - glm::vec2(rect.x, rect.y);
    return p.x >= 0.0f && p.y >= 0.0f &&
           p.x < static_cast<float>(rect.width) && p.y < static_cast<float>(rect.height);
}

} // namespace gui
} // namespace kgview
