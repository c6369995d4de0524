#include <kgview/core/command_line.h>
#include <kgview/core/config.h>
#include <kgview/core/filesystem_utils.h>
#include <kgview/core/random_source.h>
#include <kgview/db/settings_store.h>
#include <kgview/db/sqlite_connection.h>
#include <kgview/db/viewer_settings.h>
#include <kgview/graph/graph_loader.h>
#include <kgview/graph/render/gl_scene_renderer.h>
#include <kgview/gui/render/frame_loop.h>
#include <kgview/gui/views/graph_viewport.h>
#include <kgview/gui/views/gui_interface.h>
#include <kgview/gui/views/main_gui_views.h>
#include <kgview/gui/views/node_popup.h>
#include <kgview/gui/views/settings_binding.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kgview;

namespace {

constexpr double kReloadPollSeconds = 1.0;

struct GraphFile {
    std::filesystem::path path;
    std::optional<std::filesystem::file_time_type> last_write;
    gui::GraphFileStatus status;
};

// Loads the file; on failure records the error and returns nullptr so the
// caller keeps showing the previous snapshot.
std::shared_ptr<const graph::GraphModel> load_graph(GraphFile& file) {
    file.last_write = utils::get_last_write_time(file.path);
    try {
        auto model = graph::LoadGraphFromFile(file.path);
        file.status.last_error.clear();
        file.status.node_count = model->NodeCount();
        file.status.edge_count = model->EdgeCount();
        file.status.dropped_edges = model->DroppedEdgeCount();
        return model;
    } catch (const graph::GraphLoadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        file.status.last_error = e.what();
        return nullptr;
    }
}

bool file_changed(const GraphFile& file) {
    auto current = utils::get_last_write_time(file.path);
    return current && current != file.last_write;
}

db::ViewerSettings load_viewer_settings(db::SettingsStore* store) {
    if (!store) return db::ViewerSettings();
    try {
        return db::ViewerSettings::Load(*store);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to load viewer settings: " << e.what() << std::endl;
        return db::ViewerSettings();
    }
}

void save_viewer_settings(db::SettingsStore* store, const db::ViewerSettings& settings) {
    if (!store) return;
    try {
        settings.Save(*store);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to save viewer settings: " << e.what() << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    const std::string program_name = argc > 0 ? argv[0] : "kgview";
    core::CommandLineOptions options;
    try {
        options = core::ParseCommandLine(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << core::UsageText(program_name);
        return 2;
    }
    if (options.show_help) {
        std::cout << core::UsageText(program_name);
        return 0;
    }

    // Settings are optional; the viewer still runs on defaults without them.
    std::unique_ptr<db::SQLiteConnection> db_conn;
    std::unique_ptr<db::SettingsStore> settings_store;
    try {
        db_conn = std::make_unique<db::SQLiteConnection>();
        settings_store = std::make_unique<db::SettingsStore>(*db_conn);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Settings database unavailable: " << e.what() << std::endl;
    }
    db::ViewerSettings settings = load_viewer_settings(settings_store.get());
    if (options.no_animate) {
        settings.animate = false;
    }

    GraphFile graph_file;
    graph_file.path = options.graph_path;
    graph_file.status.path = graph_file.path.string();
    std::shared_ptr<const graph::GraphModel> model = load_graph(graph_file);
    if (!model) {
        return 1;
    }

    std::unique_ptr<core::Mt19937RandomSource> rng = options.seed
        ? std::make_unique<core::Mt19937RandomSource>(*options.seed)
        : std::make_unique<core::Mt19937RandomSource>();
    std::cout << "Layout seed: " << rng->GetSeed() << std::endl;

    gui::GuiInterface gui_ui(config::kDefaultWindowWidth, config::kDefaultWindowHeight, config::kWindowTitle);
    gui_ui.setTheme(settings.theme);
    try {
        gui_ui.initialize();
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        return 1;
    }

    int exit_code = 0;
    {
        graph::GlSceneRenderer renderer(config::kNodePointSizePx);
        gui::FrameRequestQueue frame_queue;
        gui::GraphViewport viewport(gui::GraphViewport::Dependencies{
            gui_ui.getDispatcher(), gui_ui, frame_queue, renderer, *rng});

        gui::NodePopup node_popup;
        viewport.OnNodeSelected([&node_popup](const gui::NodeSelectedEvent& event) { node_popup.Show(event); });
        viewport.OnSelectionCleared([&node_popup]() { node_popup.Hide(); });

        gui::ViewportDescriptor descriptor = gui::MakeViewportDescriptor(settings);
        descriptor.iterations_per_frame = options.iterations_per_frame;
        descriptor.layout.warm_start = options.warm_start;

        try {
            viewport.Initialize(descriptor, model);
        } catch (const std::exception& e) {
            std::cerr << "Error: Failed to initialize graph viewport: " << e.what() << std::endl;
            exit_code = 1;
        }

        double last_reload_check = gui_ui.getTime();
        while (exit_code == 0 && !gui_ui.shouldClose()) {
            gui_ui.beginFrame();

            const double now = gui_ui.getTime();
            bool reload = false;
            if (now - last_reload_check >= kReloadPollSeconds) {
                last_reload_check = now;
                reload = file_changed(graph_file);
            }

            gui_ui.bindFramebufferViewport();
            if (viewport.IsAnimating()) {
                frame_queue.RunFrame(now);
            } else {
                viewport.RenderStill();
            }

            if (!node_popup.Draw()) {
                if (auto* controller = viewport.GetController()) controller->ClearSelection();
            }

            gui::SettingsPanelActions actions = gui::drawSettingsPanel(settings, viewport, graph_file.status);
            if (actions.settings_changed) {
                gui::ApplyViewerSettings(settings, viewport);
                gui_ui.setTheme(settings.theme);
                save_viewer_settings(settings_store.get(), settings);
            }
            if (actions.focus_requested) {
                if (auto* controller = viewport.GetController()) controller->FocusSelected();
            }
            if (actions.reload_requested || reload) {
                if (auto reloaded = load_graph(graph_file)) {
                    std::cout << "Reloaded " << graph_file.status.path << std::endl;
                    viewport.Update(reloaded);
                }
            }

            gui_ui.endFrame();
        }

        viewport.Dispose();
        renderer.Shutdown();
    }

    gui_ui.shutdown();
    return exit_code;
}
