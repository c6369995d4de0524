#pragma once

#include <kgview/gui/interaction/input_events.h>

struct GLFWwindow;

namespace kgview {
namespace EventDispatch {

// Installs the input callbacks below on window. The window user pointer
// must be the owning GuiInterface. Call before the ImGui GLFW backend is
// initialised so ImGui chains to them.
void install_callbacks(GLFWwindow* window);

gui::Key translate_key(int glfw_key);

void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
void cursor_pos_callback(GLFWwindow* window, double xpos, double ypos);
void scroll_callback(GLFWwindow* window, double xoffset, double yoffset);
void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
void window_size_callback(GLFWwindow* window, int width, int height);
void glfw_error_callback(int error, const char* description);

} // namespace EventDispatch
} // namespace kgview
