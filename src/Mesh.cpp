#include "Mesh.h"

#include <utility>

Mesh::~Mesh(){
    destroy();
}

Mesh::Mesh(Mesh&& o) noexcept
    : vao(o.vao), vbo(o.vbo), ebo(o.ebo), m_indexCount(o.m_indexCount)
{
    o.vao = o.vbo = o.ebo = 0;
    o.m_indexCount = 0;
}

Mesh& Mesh::operator=(Mesh&& o) noexcept{
    if(this != &o){
        destroy();
        std::swap(vao, o.vao);
        std::swap(vbo, o.vbo);
        std::swap(ebo, o.ebo);
        std::swap(m_indexCount, o.m_indexCount);
    }
    return *this;
}

void Mesh::destroy(){
    if(ebo) glDeleteBuffers(1, &ebo);
    if(vbo) glDeleteBuffers(1, &vbo);
    if(vao) glDeleteVertexArrays(1, &vao);
    vao = vbo = ebo = 0;
    m_indexCount = 0;
}

void Mesh::upload(const std::vector<ModelVertex>& verts, const std::vector<uint32_t>& idx){
    uploadRaw(verts.data(), verts.size() * sizeof(ModelVertex), (GLsizei)sizeof(ModelVertex),
              ModelVertex::kAttributes, idx);
}

void Mesh::upload(const std::vector<SimpleVertex>& verts, const std::vector<uint32_t>& idx){
    uploadRaw(verts.data(), verts.size() * sizeof(SimpleVertex), (GLsizei)sizeof(SimpleVertex),
              SimpleVertex::kAttributes, idx);
}

template <size_t N>
void Mesh::uploadRaw(const void* verts, size_t vertBytes, GLsizei stride,
                     const VertexAttribute (&attrs)[N], const std::vector<uint32_t>& idx){
    destroy();
    m_indexCount = (GLsizei)idx.size();

    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glGenBuffers(1, &ebo);

    glBindVertexArray(vao);

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)vertBytes, verts, GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, (GLsizeiptr)(idx.size() * sizeof(uint32_t)), idx.data(), GL_STATIC_DRAW);

    for(const VertexAttribute& a : attrs){
        glEnableVertexAttribArray(a.location);
        glVertexAttribPointer(a.location, a.components, GL_FLOAT, GL_FALSE, stride, (void*)a.offset);
    }

    glBindVertexArray(0);
}

void Mesh::draw() const{
    glBindVertexArray(vao);
    glDrawElements(GL_TRIANGLES, m_indexCount, GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}
