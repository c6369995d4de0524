#include <kgview/graph/render/gl_scene_renderer.h>
#include <kgview/graph/render/camera_utils.h>

#include <glm/gtc/type_ptr.hpp>


namespace kgview {
namespace graph {

namespace {
const char* kVertexShaderSource = R"(#version 330 core
layout(location = 0) in vec3 aPosition;
layout(location = 1) in vec3 aColor;
uniform mat4 uViewProj;
uniform float uPointSize;
out vec3 vColor;
void main() {
    vColor = aColor;
    gl_Position = uViewProj * vec4(aPosition, 1.0);
    gl_PointSize = uPointSize;
}
)";

const char* kFragmentShaderSource = R"(#version 330 core
in vec3 vColor;
uniform bool uRoundPoints;
out vec4 FragColor;
void main() {
    if (uRoundPoints) {
        vec2 d = gl_PointCoord - vec2(0.5);
        if (dot(d, d) > 0.25) discard;
    }
    FragColor = vec4(vColor, 1.0);
}
)";

constexpr float kBackgroundPointSize = 1.5f;
} // anonymous namespace

GlSceneRenderer::GlSceneRenderer(float node_point_size)
    : node_point_size_(node_point_size), clear_color_(0.0f) {}

GlSceneRenderer::~GlSceneRenderer() {
    Shutdown();
}

GLuint GlSceneRenderer::CompileShader(GLenum type, const char* source) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);
    GLint ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[1024];
        glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
        glDeleteShader(shader);
        throw ShaderError(std::string("Shader compile error: ") + log);
    }
    return shader;
}

GLuint GlSceneRenderer::LinkProgram(GLuint vertex_shader, GLuint fragment_shader) {
    GLuint program = glCreateProgram();
    glAttachShader(program, vertex_shader);
    glAttachShader(program, fragment_shader);
    glLinkProgram(program);
    GLint ok = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[1024];
        glGetProgramInfoLog(program, sizeof(log), nullptr, log);
        glDeleteProgram(program);
        throw ShaderError(std::string("Program link error: ") + log);
    }
    return program;
}

void GlSceneRenderer::Initialize() {
    if (program_) return;

    GLuint vs = CompileShader(GL_VERTEX_SHADER, kVertexShaderSource);
    GLuint fs = 0;
    try {
        fs = CompileShader(GL_FRAGMENT_SHADER, kFragmentShaderSource);
        program_ = LinkProgram(vs, fs);
    } catch (const ShaderError&) {
        glDeleteShader(vs);
        if (fs) glDeleteShader(fs);
        throw;
    }
    glDeleteShader(vs);
    glDeleteShader(fs);

    view_proj_location_ = glGetUniformLocation(program_, "uViewProj");
    point_size_location_ = glGetUniformLocation(program_, "uPointSize");
    round_points_location_ = glGetUniformLocation(program_, "uRoundPoints");
}

void GlSceneRenderer::Shutdown() {
    scene_bundle_.reset();
    background_bundle_.reset();
    if (program_) {
        glDeleteProgram(program_);
        program_ = 0;
    }
}

void GlSceneRenderer::InstallPrimitives(std::shared_ptr<const ScenePrimitives> primitives) {
    if (!program_) return;
    // Release the old buffers before uploading the replacement.
    scene_bundle_.reset();
    if (primitives && !primitives->Empty()) {
        scene_bundle_ = std::make_unique<GpuPrimitiveBundle>(*primitives);
    }
}

void GlSceneRenderer::InstallBackground(std::shared_ptr<const ScenePrimitives> background) {
    if (!program_) return;
    background_bundle_.reset();
    if (background && !background->Empty()) {
        background_bundle_ = std::make_unique<GpuPrimitiveBundle>(*background);
    }
}

void GlSceneRenderer::Render(const PerspectiveCamera& camera) {
    if (!program_) return;

    // Draws into the current GL viewport; the caller sizes it to the framebuffer.
    glClearColor(clear_color_.r, clear_color_.g, clear_color_.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    glEnable(GL_PROGRAM_POINT_SIZE);
    glEnable(GL_DEPTH_TEST);
    glUseProgram(program_);
    const glm::mat4 view_proj = camera.GetViewProjectionMatrix();
    glUniformMatrix4fv(view_proj_location_, 1, GL_FALSE, glm::value_ptr(view_proj));

    if (background_bundle_) {
        glDepthMask(GL_FALSE);
        glUniform1f(point_size_location_, kBackgroundPointSize);
        glUniform1i(round_points_location_, 0);
        background_bundle_->DrawPoints();
        glDepthMask(GL_TRUE);
    }

    if (scene_bundle_) {
        scene_bundle_->DrawLines();
        glUniform1f(point_size_location_, node_point_size_);
        glUniform1i(round_points_location_, 1);
        scene_bundle_->DrawPoints();
    }

    glUseProgram(0);
    glDisable(GL_DEPTH_TEST);
}

} // namespace graph
} // namespace kgview
