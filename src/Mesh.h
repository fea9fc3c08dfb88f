#pragma once
#include <cstdint>
#include <vector>
#include <glad/glad.h>

#include "Vertex.h"

class Mesh {
public:
    Mesh() = default;
    ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;
    Mesh(Mesh&& o) noexcept;
    Mesh& operator=(Mesh&& o) noexcept;

    void upload(const std::vector<ModelVertex>& verts, const std::vector<uint32_t>& idx);
    void upload(const std::vector<SimpleVertex>& verts, const std::vector<uint32_t>& idx);
    void draw() const;
    void destroy();

private:
    template <size_t N>
    void uploadRaw(const void* verts, size_t vertBytes, GLsizei stride,
                   const VertexAttribute (&attrs)[N], const std::vector<uint32_t>& idx);

    GLuint vao=0, vbo=0, ebo=0;
    GLsizei m_indexCount=0;
};
