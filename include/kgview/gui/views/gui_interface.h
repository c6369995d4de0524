#pragma once

#include <kgview/graph/render/color_palette.h>
#include <kgview/gui/interaction/input_events.h>

#include <string>

// Forward declaration for GLFW window handle
struct GLFWwindow;

namespace kgview {
namespace gui {

/*
 * Owns the GLFW window, the OpenGL 3.3 core context and the Dear ImGui
 * context. Window input is translated into the InputEventDispatcher, and
 * the window's client area is the viewport's render surface.
 */
class GuiInterface : public ViewportSizeProvider {
public:
    GuiInterface(int width, int height, std::string title);
    ~GuiInterface() override;

    // Prevent copying/moving
    GuiInterface(const GuiInterface&)            = delete;
    GuiInterface& operator=(const GuiInterface&) = delete;
    GuiInterface(GuiInterface&&)                 = delete;
    GuiInterface& operator=(GuiInterface&&)      = delete;

    // Throws std::runtime_error when GLFW, GLEW or ImGui fail to start.
    void initialize();
    void shutdown();

    bool shouldClose() const;
    void requestClose();

    // ImGui frame bracket. endFrame() draws the overlay and swaps buffers.
    void beginFrame();
    void endFrame();

    // Sizes the GL viewport to the framebuffer before the scene is drawn.
    void bindFramebufferViewport();

    void setTheme(ThemeType theme);
    ThemeType getTheme() const { return current_theme; }

    GLFWwindow* getWindow() const { return window; }
    InputEventDispatcher& getDispatcher() { return dispatcher; }
    double getTime() const;

    // ViewportSizeProvider: window client area, in the pointer's coordinates.
    SurfaceRect GetSurfaceRect() const override;

private:
    void failInitialization(const std::string& message);

    int initial_width;
    int initial_height;
    std::string window_title;

    GLFWwindow* window = nullptr;
    bool imgui_init_done = false;
    ThemeType current_theme = ThemeType::DARK;
    InputEventDispatcher dispatcher;
};

} // namespace gui
} // namespace kgview
