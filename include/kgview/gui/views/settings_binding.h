#pragma once

#include <kgview/db/viewer_settings.h>
#include <kgview/gui/views/graph_viewport.h>

namespace kgview {
namespace gui {

// Maps persisted viewer settings onto the viewport's parameter structs.
InteractionController::Params MakeInteractionParams(const db::ViewerSettings& settings);
graph::ForceDirectedLayout::LayoutParams MakeLayoutParams(const db::ViewerSettings& settings);
ViewportDescriptor MakeViewportDescriptor(const db::ViewerSettings& settings);

// Pushes interaction, theme and animation changes into a mounted viewport.
// Layout parameters apply from the next snapshot.
void ApplyViewerSettings(const db::ViewerSettings& settings, GraphViewport& viewport);

} // namespace gui
} // namespace kgview
