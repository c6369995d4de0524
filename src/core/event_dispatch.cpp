#include <kgview/core/event_dispatch.h>
#include <kgview/gui/views/gui_interface.h>

#include <GLFW/glfw3.h>
#include <imgui.h>

#include <iostream>

namespace kgview {
namespace EventDispatch {

namespace {
gui::GuiInterface* owner(GLFWwindow* window) {
    return static_cast<gui::GuiInterface*>(glfwGetWindowUserPointer(window));
}

// Overlay widgets get the pointer first.
bool imgui_wants_mouse() {
    return ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse;
}

bool imgui_wants_keyboard() {
    return ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureKeyboard;
}
} // anonymous namespace

void install_callbacks(GLFWwindow* window) {
    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetCursorPosCallback(window, cursor_pos_callback);
    glfwSetScrollCallback(window, scroll_callback);
    glfwSetKeyCallback(window, key_callback);
    glfwSetWindowSizeCallback(window, window_size_callback);
}

gui::Key translate_key(int glfw_key) {
    switch (glfw_key) {
        case GLFW_KEY_W: return gui::Key::W;
        case GLFW_KEY_A: return gui::Key::A;
        case GLFW_KEY_S: return gui::Key::S;
        case GLFW_KEY_D: return gui::Key::D;
        case GLFW_KEY_Q: return gui::Key::Q;
        case GLFW_KEY_E: return gui::Key::E;
        case GLFW_KEY_SPACE: return gui::Key::SPACE;
        case GLFW_KEY_LEFT_SHIFT: return gui::Key::LEFT_SHIFT;
        case GLFW_KEY_F: return gui::Key::F;
        case GLFW_KEY_ESCAPE: return gui::Key::ESCAPE;
        default: return gui::Key::OTHER;
    }
}

void mouse_button_callback(GLFWwindow* window, int button, int action, int) {
    gui::GuiInterface* gui_ui = owner(window);
    if (!gui_ui) return;

    gui::MouseButton mapped;
    switch (button) {
        case GLFW_MOUSE_BUTTON_LEFT: mapped = gui::MouseButton::PRIMARY; break;
        case GLFW_MOUSE_BUTTON_RIGHT: mapped = gui::MouseButton::SECONDARY; break;
        case GLFW_MOUSE_BUTTON_MIDDLE: mapped = gui::MouseButton::MIDDLE; break;
        default: return;
    }

    const bool pressed = action == GLFW_PRESS;
    // Releases always go through so a drag never gets stuck.
    if (pressed && imgui_wants_mouse()) return;

    double x = 0.0, y = 0.0;
    glfwGetCursorPos(window, &x, &y);
    gui_ui->getDispatcher().DispatchPointerButton(
        gui::PointerButtonEvent{mapped, pressed, glm::vec2(static_cast<float>(x), static_cast<float>(y))});
}

void cursor_pos_callback(GLFWwindow* window, double xpos, double ypos) {
    gui::GuiInterface* gui_ui = owner(window);
    if (!gui_ui) return;
    gui_ui->getDispatcher().DispatchPointerMove(
        gui::PointerMoveEvent{glm::vec2(static_cast<float>(xpos), static_cast<float>(ypos))});
}

void scroll_callback(GLFWwindow* window, double, double yoffset) {
    gui::GuiInterface* gui_ui = owner(window);
    if (!gui_ui || imgui_wants_mouse()) return;
    gui_ui->getDispatcher().DispatchScroll(gui::ScrollEvent{static_cast<float>(yoffset)});
}

void key_callback(GLFWwindow* window, int key, int, int action, int) {
    gui::GuiInterface* gui_ui = owner(window);
    if (!gui_ui || action == GLFW_REPEAT) return;

    const bool pressed = action == GLFW_PRESS;
    if (pressed && imgui_wants_keyboard()) return;
    gui_ui->getDispatcher().DispatchKey(gui::KeyEvent{translate_key(key), pressed});
}

void window_size_callback(GLFWwindow* window, int width, int height) {
    gui::GuiInterface* gui_ui = owner(window);
    if (!gui_ui) return;
    gui_ui->getDispatcher().DispatchResize(gui::ResizeEvent{width, height});
}

void glfw_error_callback(int error, const char* description) {
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

} // namespace EventDispatch
} // namespace kgview
