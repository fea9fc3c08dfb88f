#pragma once
#include <cstddef>
#include <glad/glad.h>

class UniformBuffer {
public:
    UniformBuffer() = default;
    ~UniformBuffer();

    UniformBuffer(const UniformBuffer&) = delete;
    UniformBuffer& operator=(const UniformBuffer&) = delete;

    void init(size_t size, GLuint binding);
    // Writes past the allocated size are rejected.
    bool write(size_t offset, const void* data, size_t size);

    template <typename T>
    bool write(const T& block) { return write(0, &block, sizeof(T)); }

private:
    GLuint ubo = 0;
    size_t m_size = 0;
};
