#include <kgview/gui/views/gui_interface.h>
#include <kgview/core/event_dispatch.h>
#include <kgview/gui/render/theme_utils.h>

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <iostream>
#include <stdexcept>

namespace kgview {
namespace gui {

GuiInterface::GuiInterface(int width, int height, std::string title)
    : initial_width(width), initial_height(height), window_title(std::move(title)) {}

GuiInterface::~GuiInterface() {
    shutdown();
}

// Tears down whatever initialize() had brought up before the failure.
void GuiInterface::failInitialization(const std::string& message) {
    if (imgui_init_done) {
        ImGui::DestroyContext();
        imgui_init_done = false;
    }
    if (window) {
        glfwDestroyWindow(window);
        window = nullptr;
    }
    glfwTerminate();
    throw std::runtime_error(message);
}

void GuiInterface::initialize() {
    glfwSetErrorCallback(EventDispatch::glfw_error_callback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // The scene shaders are GLSL 330 core.
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_DEPTH_BITS, 24);

    window = glfwCreateWindow(initial_width, initial_height, window_title.c_str(), nullptr, nullptr);
    if (!window) {
        failInitialization("Failed to create GLFW window");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    glewExperimental = GL_TRUE;
    const GLenum glew_status = glewInit();
    if (glew_status != GLEW_OK) {
        failInitialization(std::string("Failed to initialize GLEW: ") +
                           reinterpret_cast<const char*>(glewGetErrorString(glew_status)));
    }

    glfwSetWindowUserPointer(window, this);
    // Installed before the ImGui backend so it chains to them.
    EventDispatch::install_callbacks(window);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_init_done = true;
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ThemeUtils::setTheme(current_theme);

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        failInitialization("Failed to initialize ImGui GLFW backend");
    }
    if (!ImGui_ImplOpenGL3_Init("#version 330")) {
        ImGui_ImplGlfw_Shutdown();
        failInitialization("Failed to initialize ImGui OpenGL3 backend");
    }

    std::cout << "Viewer window ready (" << initial_width << "x" << initial_height << ")." << std::endl;
}

void GuiInterface::shutdown() {
    if (!window) return;

    if (imgui_init_done) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        imgui_init_done = false;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    window = nullptr;
}

bool GuiInterface::shouldClose() const {
    return !window || glfwWindowShouldClose(window);
}

void GuiInterface::requestClose() {
    if (window) glfwSetWindowShouldClose(window, GLFW_TRUE);
}

void GuiInterface::beginFrame() {
    glfwPollEvents();
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void GuiInterface::endFrame() {
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

void GuiInterface::bindFramebufferViewport() {
    if (!window) return;
    int framebuffer_width = 0;
    int framebuffer_height = 0;
    glfwGetFramebufferSize(window, &framebuffer_width, &framebuffer_height);
    glViewport(0, 0, framebuffer_width, framebuffer_height);
}

void GuiInterface::setTheme(ThemeType theme) {
    current_theme = theme;
    if (imgui_init_done) {
        ThemeUtils::setTheme(theme);
    }
}

double GuiInterface::getTime() const {
    return glfwGetTime();
}

SurfaceRect GuiInterface::GetSurfaceRect() const {
    SurfaceRect rect;
    if (!window) {
        rect.width = initial_width;
        rect.height = initial_height;
        return rect;
    }
    glfwGetWindowSize(window, &rect.width, &rect.height);
    return rect;
}

} // namespace gui
} // namespace kgview
