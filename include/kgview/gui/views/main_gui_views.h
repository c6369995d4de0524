#pragma once

#include <kgview/db/viewer_settings.h>

#include <cstddef>
#include <string>

namespace kgview {
namespace gui {

class GraphViewport;

struct GraphFileStatus {
    std::string path;
    std::string last_error;     // Empty when the last load succeeded
    std::size_t node_count = 0;
    std::size_t edge_count = 0;
    std::size_t dropped_edges = 0;
};

struct SettingsPanelActions {
    bool settings_changed = false;
    bool reload_requested = false;
    bool focus_requested = false;
};

// Collapsible settings and status panel. Edits settings in place and
// reports what the caller has to act on.
SettingsPanelActions drawSettingsPanel(db::ViewerSettings& settings,
                                       GraphViewport& viewport,
                                       const GraphFileStatus& status);

} // namespace gui
} // namespace kgview
