#ifndef KGVIEW_GPU_PRIMITIVE_BUNDLE_H
#define KGVIEW_GPU_PRIMITIVE_BUNDLE_H

#include <kgview/graph/render/scene_primitives.h>

#include <GL/glew.h>

#include <vector>

namespace kgview {
namespace graph {

/*
 * GPU copy of one ScenePrimitives bundle: a VAO/VBO pair for the points and
 * one for the line segments. Buffers are released in the destructor.
 */
class GpuPrimitiveBundle {
public:
    explicit GpuPrimitiveBundle(const ScenePrimitives& primitives);
    ~GpuPrimitiveBundle();

    GpuPrimitiveBundle(const GpuPrimitiveBundle&) = delete;
    GpuPrimitiveBundle& operator=(const GpuPrimitiveBundle&) = delete;
    GpuPrimitiveBundle(GpuPrimitiveBundle&& other) noexcept;
    GpuPrimitiveBundle& operator=(GpuPrimitiveBundle&& other) noexcept;

    void DrawPoints() const;
    void DrawLines() const;

    GLsizei PointCount() const { return points_.count; }
    GLsizei LineVertexCount() const { return lines_.count; }

private:
    struct VertexBuffer {
        GLuint vao = 0;
        GLuint vbo = 0;
        GLsizei count = 0;
    };

    static VertexBuffer Upload(const std::vector<ColoredVertex>& vertices);
    static void Release(VertexBuffer& buffer);

    VertexBuffer points_;
    VertexBuffer lines_;
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_GPU_PRIMITIVE_BUNDLE_H
