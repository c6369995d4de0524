#ifndef KGVIEW_GRAPH_VIEWPORT_H
#define KGVIEW_GRAPH_VIEWPORT_H

#include <kgview/graph/graph_model.h>
#include <kgview/graph/layout/force_directed_layout.h>
#include <kgview/graph/render/camera_utils.h>
#include <kgview/graph/render/color_palette.h>
#include <kgview/graph/render/scene_primitives.h>
#include <kgview/gui/interaction/interaction_controller.h>
#include <kgview/gui/render/frame_loop.h>

#include <functional>
#include <memory>
#include <vector>

namespace kgview {

namespace core {
class RandomSource;
}

namespace graph {
class SceneRenderer;
}

namespace gui {

// How the viewport is mounted. The surface size itself comes from the
// ViewportSizeProvider.
struct ViewportDescriptor {
    ThemeType theme = ThemeType::DARK;
    bool animate = true;
    bool show_starfield = true;
    int iterations_per_frame = 0;   // 0 runs the whole layout synchronously
    graph::ForceDirectedLayout::LayoutParams layout;
    InteractionController::Params interaction;
};

/*
 * Entry points of the graph view: mount with data, replace the data, stream
 * selection events and tear down. Owns the camera, layout, interaction
 * controller and frame loop; the renderer and the other collaborators are
 * injected and must outlive the viewport.
 */
class GraphViewport {
public:
    struct Dependencies {
        InputEventSource& events;
        const ViewportSizeProvider& viewport;
        FrameScheduler& scheduler;
        graph::SceneRenderer& renderer;
        core::RandomSource& rng;
    };

    explicit GraphViewport(const Dependencies& deps);
    ~GraphViewport();

    GraphViewport(const GraphViewport&) = delete;
    GraphViewport& operator=(const GraphViewport&) = delete;

    // Throws std::runtime_error when called twice or after Dispose().
    void Initialize(const ViewportDescriptor& descriptor,
                    std::shared_ptr<const graph::GraphModel> model);

    // Replaces the snapshot. The same pointer is a no-op. Returns true when
    // a new layout was built. Ignored once disposed.
    bool Update(std::shared_ptr<const graph::GraphModel> model);

    void OnNodeSelected(InteractionController::NodeSelectedCallback callback);
    void OnSelectionCleared(InteractionController::SelectionClearedCallback callback);

    void SetAnimate(bool animate);
    bool IsAnimating() const { return animate_; }
    void SetTheme(ThemeType theme);
    void SetInteractionParams(const InteractionController::Params& params);
    void SetLayoutParams(const graph::ForceDirectedLayout::LayoutParams& params);
    const InteractionController::Params& GetInteractionParams() const { return descriptor_.interaction; }
    const graph::ForceDirectedLayout::LayoutParams& GetLayoutParams() const { return descriptor_.layout; }

    // One frame: layout chunk, camera controls, render. Driven by the frame loop.
    void RenderFrame(float dt);
    // Draws without advancing anything, for when animation is off.
    void RenderStill();

    void Dispose();
    bool IsMounted() const { return mounted_ && !disposed_; }
    bool IsDisposed() const { return disposed_; }
    bool IsLayoutInProgress() const { return layout_in_progress_; }

    const std::shared_ptr<const graph::GraphModel>& GetModel() const { return model_; }
    const graph::PositionMap& GetPositions() const { return positions_; }
    const std::shared_ptr<const graph::ScenePrimitives>& GetPrimitives() const { return primitives_; }
    graph::PerspectiveCamera& GetCamera() { return camera_; }
    InteractionController* GetController() { return controller_.get(); }
    FrameLoop* GetFrameLoop() { return frame_loop_.get(); }

private:
    void ApplySnapshot(std::shared_ptr<const graph::GraphModel> model);
    void AdvanceLayout();
    void RebuildPrimitives();
    void InstallStarfield();
    void FrameCamera();

    Dependencies deps_;
    ViewportDescriptor descriptor_;
    ThemeType theme_ = ThemeType::DARK;
    bool animate_ = false;
    bool mounted_ = false;
    bool disposed_ = false;
    bool layout_in_progress_ = false;

    graph::PerspectiveCamera camera_;
    std::unique_ptr<graph::ForceDirectedLayout> layout_;
    std::unique_ptr<InteractionController> controller_;
    std::unique_ptr<FrameLoop> frame_loop_;

    std::shared_ptr<const graph::GraphModel> model_;
    std::shared_ptr<const graph::ScenePrimitives> primitives_;
    graph::PositionMap positions_;

    std::vector<InteractionController::NodeSelectedCallback> selected_listeners_;
    std::vector<InteractionController::SelectionClearedCallback> cleared_listeners_;
};

} // namespace gui
} // namespace kgview

#endif // KGVIEW_GRAPH_VIEWPORT_H
