#include <kgview/gui/views/graph_viewport.h>
#include <kgview/core/config.h>
#include <kgview/core/random_source.h>
#include <kgview/graph/render/scene_renderer.h>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace kgview {
namespace gui {

GraphViewport::GraphViewport(const Dependencies& deps)
    : deps_(deps) {}

GraphViewport::~GraphViewport() {
    Dispose();
}

void GraphViewport::Initialize(const ViewportDescriptor& descriptor,
                               std::shared_ptr<const graph::GraphModel> model) {
    if (disposed_) {
        throw std::runtime_error("GraphViewport: cannot initialize after dispose");
    }
    if (mounted_) {
        throw std::runtime_error("GraphViewport: already initialized");
    }

    descriptor_ = descriptor;
    theme_ = descriptor.theme;

    if (!deps_.renderer.IsInitialized()) {
        deps_.renderer.Initialize();
    }
    deps_.renderer.SetClearColor(graph::GetThemePalette(theme_).background);
    if (descriptor_.show_starfield) {
        InstallStarfield();
    }

    controller_ = std::make_unique<InteractionController>(
        deps_.events, deps_.viewport, camera_, descriptor_.interaction);
    controller_->SetNodeSelectedCallback([this](const NodeSelectedEvent& event) {
        for (const auto& listener : selected_listeners_) listener(event);
    });
    controller_->SetSelectionClearedCallback([this]() {
        for (const auto& listener : cleared_listeners_) listener();
    });

    frame_loop_ = std::make_unique<FrameLoop>(deps_.scheduler, [this](float dt) { RenderFrame(dt); });

    ApplySnapshot(std::move(model));
    FrameCamera();
    mounted_ = true;

    std::cout << "Graph viewport mounted: " << model_->NodeCount() << " nodes, "
              << model_->EdgeCount() << " edges." << std::endl;

    SetAnimate(descriptor_.animate);
}

bool GraphViewport::Update(std::shared_ptr<const graph::GraphModel> model) {
    if (disposed_ || !mounted_) return false;
    if (model && model == model_) return false;

    ApplySnapshot(std::move(model));
    return true;
}

void GraphViewport::OnNodeSelected(InteractionController::NodeSelectedCallback callback) {
    if (disposed_ || !callback) return;
    selected_listeners_.push_back(std::move(callback));
}

void GraphViewport::OnSelectionCleared(InteractionController::SelectionClearedCallback callback) {
    if (disposed_ || !callback) return;
    cleared_listeners_.push_back(std::move(callback));
}

void GraphViewport::SetAnimate(bool animate) {
    const bool changed = animate != animate_;
    animate_ = animate;
    if (disposed_ || !frame_loop_) return;
    // Input gathered while stopped was never applied; do not replay it.
    if (changed && controller_) controller_->ResetMotion();
    if (animate_) {
        frame_loop_->Enable();
    } else {
        frame_loop_->Disable();
    }
}

void GraphViewport::SetTheme(ThemeType theme) {
    if (disposed_ || theme == theme_) return;
    theme_ = theme;
    if (!mounted_) return;

    deps_.renderer.SetClearColor(graph::GetThemePalette(theme_).background);
    if (descriptor_.show_starfield) {
        InstallStarfield();
    }
    RebuildPrimitives();
}

void GraphViewport::SetInteractionParams(const InteractionController::Params& params) {
    descriptor_.interaction = params;
    if (controller_ && !disposed_) controller_->SetParams(params);
}

// Takes effect on the next snapshot.
void GraphViewport::SetLayoutParams(const graph::ForceDirectedLayout::LayoutParams& params) {
    descriptor_.layout = params;
}

void GraphViewport::RenderFrame(float dt) {
    if (disposed_ || !mounted_) return;

    if (layout_in_progress_) {
        AdvanceLayout();
    }
    controller_->Advance(dt);
    deps_.renderer.Render(camera_);
}

void GraphViewport::RenderStill() {
    if (disposed_ || !mounted_) return;

    // Without a running loop nothing would finish a chunked layout.
    if (layout_in_progress_) {
        while (layout_->UpdateLayout()) {
        }
        layout_in_progress_ = false;
        positions_ = layout_->GetPositions();
        RebuildPrimitives();
    }
    deps_.renderer.Render(camera_);
}

void GraphViewport::Dispose() {
    if (disposed_) return;
    disposed_ = true;

    if (frame_loop_) frame_loop_->Disable();
    if (controller_) controller_->Dispose();
    selected_listeners_.clear();
    cleared_listeners_.clear();

    if (mounted_) {
        deps_.renderer.InstallPrimitives(nullptr);
        deps_.renderer.InstallBackground(nullptr);
    }
    layout_in_progress_ = false;
    primitives_.reset();
}

void GraphViewport::ApplySnapshot(std::shared_ptr<const graph::GraphModel> model) {
    if (!model) {
        model = std::make_shared<const graph::GraphModel>();
    }
    model_ = std::move(model);

    if (model_->DroppedEdgeCount() > 0) {
        std::cerr << "Warning: dropped " << model_->DroppedEdgeCount()
                  << " edge(s) with missing endpoints." << std::endl;
    }

    const graph::PositionMap previous = std::move(positions_);
    positions_.clear();

    layout_ = std::make_unique<graph::ForceDirectedLayout>(deps_.rng, descriptor_.layout);
    const graph::PositionMap* warm = descriptor_.layout.warm_start ? &previous : nullptr;

    if (descriptor_.iterations_per_frame > 0) {
        layout_->Initialize(*model_, warm);
        layout_in_progress_ = layout_->IsRunning();
        positions_ = layout_->GetPositions();
    } else {
        layout_in_progress_ = false;
        positions_ = layout_->ComputeLayout(*model_, warm);
    }

    RebuildPrimitives();
}

void GraphViewport::AdvanceLayout() {
    for (int i = 0; i < descriptor_.iterations_per_frame; ++i) {
        if (!layout_->UpdateLayout()) break;
    }
    layout_in_progress_ = layout_->IsRunning();
    positions_ = layout_->GetPositions();
    RebuildPrimitives();
}

void GraphViewport::RebuildPrimitives() {
    if (model_->Empty()) {
        primitives_ = std::make_shared<const graph::ScenePrimitives>();
        deps_.renderer.InstallPrimitives(nullptr);
    } else {
        primitives_ = graph::ScenePrimitiveBuilder::Build(*model_, positions_, graph::GetThemePalette(theme_));
        deps_.renderer.InstallPrimitives(primitives_);
    }
    if (controller_) controller_->SetScene(model_, primitives_);
}

void GraphViewport::InstallStarfield() {
    deps_.renderer.InstallBackground(graph::ScenePrimitiveBuilder::BuildStarfield(
        deps_.rng, config::kStarfieldPointCount, config::kStarfieldRadius,
        graph::GetThemePalette(theme_).star));
}

void GraphViewport::FrameCamera() {
    if (positions_.empty()) {
        controller_->GetOrbitControls().Frame(glm::vec3(0.0f), config::kCameraInitialDistance);
        return;
    }

    glm::vec3 center(0.0f);
    for (const auto& entry : positions_) center += entry.second;
    center /= static_cast<float>(positions_.size());

    float radius = 0.0f;
    for (const auto& entry : positions_) {
        radius = std::max(radius, glm::length(entry.second - center));
    }

    const float half_fov = glm::radians(camera_.GetFovDegrees()) * 0.5f;
    const float fit = radius / std::tan(half_fov) * 1.2f;
    controller_->GetOrbitControls().Frame(center, std::max(fit, config::kCameraInitialDistance));
}

} // namespace gui
} // namespace kgview
