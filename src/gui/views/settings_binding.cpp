#include <kgview/gui/views/settings_binding.h>

namespace kgview {
namespace gui {

namespace {
void CopyInto(const db::ViewerSettings& settings, InteractionController::Params& params) {
    params.hit_radius_px = settings.hit_radius_px;
    params.move_speed = settings.move_speed;
    params.orbit.damping_factor = settings.damping_factor;
}
} // anonymous namespace

InteractionController::Params MakeInteractionParams(const db::ViewerSettings& settings) {
    InteractionController::Params params;
    CopyInto(settings, params);
    return params;
}

graph::ForceDirectedLayout::LayoutParams MakeLayoutParams(const db::ViewerSettings& settings) {
    graph::ForceDirectedLayout::LayoutParams params;
    params.iterations = settings.layout_iterations;
    return params;
}

ViewportDescriptor MakeViewportDescriptor(const db::ViewerSettings& settings) {
    ViewportDescriptor descriptor;
    descriptor.theme = settings.theme;
    descriptor.animate = settings.animate;
    descriptor.layout = MakeLayoutParams(settings);
    descriptor.interaction = MakeInteractionParams(settings);
    return descriptor;
}

void ApplyViewerSettings(const db::ViewerSettings& settings, GraphViewport& viewport) {
    InteractionController::Params interaction = viewport.GetInteractionParams();
    CopyInto(settings, interaction);
    viewport.SetInteractionParams(interaction);

    graph::ForceDirectedLayout::LayoutParams layout = viewport.GetLayoutParams();
    layout.iterations = settings.layout_iterations;
    viewport.SetLayoutParams(layout);

    viewport.SetTheme(settings.theme);
    if (viewport.IsAnimating() != settings.animate) {
        viewport.SetAnimate(settings.animate);
    }
}

} // namespace gui
} // namespace kgview
