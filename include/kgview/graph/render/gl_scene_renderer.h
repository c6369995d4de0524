#ifndef KGVIEW_GL_SCENE_RENDERER_H
#define KGVIEW_GL_SCENE_RENDERER_H

#include <kgview/graph/render/gpu_primitive_bundle.h>
#include <kgview/graph/render/scene_renderer.h>

#include <GL/glew.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace kgview {
namespace graph {

class ShaderError : public std::runtime_error {
public:
    explicit ShaderError(const std::string& what) : std::runtime_error(what) {}
};

// OpenGL 3.3 core implementation. Requires a current context and an
// initialised GLEW.
class GlSceneRenderer : public SceneRenderer {
public:
    explicit GlSceneRenderer(float node_point_size);
    ~GlSceneRenderer() override;

    GlSceneRenderer(const GlSceneRenderer&) = delete;
    GlSceneRenderer& operator=(const GlSceneRenderer&) = delete;

    void Initialize() override;
    void Shutdown() override;
    bool IsInitialized() const override { return program_ != 0; }

    void InstallPrimitives(std::shared_ptr<const ScenePrimitives> primitives) override;
    void InstallBackground(std::shared_ptr<const ScenePrimitives> background) override;

    void SetClearColor(const glm::vec3& color) override { clear_color_ = color; }
    void Render(const PerspectiveCamera& camera) override;

private:
    static GLuint CompileShader(GLenum type, const char* source);
    static GLuint LinkProgram(GLuint vertex_shader, GLuint fragment_shader);

    float node_point_size_;
    glm::vec3 clear_color_;
    GLuint program_ = 0;
    GLint view_proj_location_ = -1;
    GLint point_size_location_ = -1;
    GLint round_points_location_ = -1;

    std::unique_ptr<GpuPrimitiveBundle> scene_bundle_;
    std::unique_ptr<GpuPrimitiveBundle> background_bundle_;
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_GL_SCENE_RENDERER_H
