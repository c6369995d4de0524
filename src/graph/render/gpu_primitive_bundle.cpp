#include <kgview/graph/render/gpu_primitive_bundle.h>

#include <cstddef>
#include <utility>

namespace kgview {
namespace graph {

GpuPrimitiveBundle::GpuPrimitiveBundle(const ScenePrimitives& primitives)
    : points_(Upload(primitives.points)), lines_(Upload(primitives.lines)) {}

GpuPrimitiveBundle::~GpuPrimitiveBundle() {
    Release(points_);
    Release(lines_);
}

GpuPrimitiveBundle::GpuPrimitiveBundle(GpuPrimitiveBundle&& other) noexcept
    : points_(std::exchange(other.points_, VertexBuffer{})),
      lines_(std::exchange(other.lines_, VertexBuffer{})) {}

GpuPrimitiveBundle& GpuPrimitiveBundle::operator=(GpuPrimitiveBundle&& other) noexcept {
    if (this != &other) {
        Release(points_);
        Release(lines_);
        points_ = std::exchange(other.points_, VertexBuffer{});
        lines_ = std::exchange(other.lines_, VertexBuffer{});
    }
    return *this;
}

GpuPrimitiveBundle::VertexBuffer GpuPrimitiveBundle::Upload(const std::vector<ColoredVertex>& vertices) {
    VertexBuffer buffer;
    if (vertices.empty()) return buffer;

    glGenVertexArrays(1, &buffer.vao);
    glGenBuffers(1, &buffer.vbo);
    glBindVertexArray(buffer.vao);
    glBindBuffer(GL_ARRAY_BUFFER, buffer.vbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(vertices.size() * sizeof(ColoredVertex)),
                 vertices.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(ColoredVertex),
                          reinterpret_cast<void*>(offsetof(ColoredVertex, position)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(ColoredVertex),
                          reinterpret_cast<void*>(offsetof(ColoredVertex, color)));

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    buffer.count = static_cast<GLsizei>(vertices.size());
    return buffer;
}

void GpuPrimitiveBundle::Release(VertexBuffer& buffer) {
    if (buffer.vbo) { glDeleteBuffers(1, &buffer.vbo); buffer.vbo = 0; }
    if (buffer.vao) { glDeleteVertexArrays(1, &buffer.vao); buffer.vao = 0; }
    buffer.count = 0;
}

void GpuPrimitiveBundle::DrawPoints() const {
    if (!points_.vao || points_.count == 0) return;
    glBindVertexArray(points_.vao);
    glDrawArrays(GL_POINTS, 0, points_.count);
    glBindVertexArray(0);
}

void GpuPrimitiveBundle::DrawLines() const {
    if (!lines_.vao || lines_.count == 0) return;
    glBindVertexArray(lines_.vao);
    glDrawArrays(GL_LINES, 0, lines_.count);
    glBindVertexArray(0);
}

} // namespace graph
} // namespace kgview
