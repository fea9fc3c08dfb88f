#include "UniformBuffer.h"
#include <iostream>

UniformBuffer::~UniformBuffer(){
    if(ubo) glDeleteBuffers(1, &ubo);
}

void UniformBuffer::init(size_t size, GLuint binding){
    if(ubo) glDeleteBuffers(1, &ubo);
    m_size = size;

    glGenBuffers(1, &ubo);
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferData(GL_UNIFORM_BUFFER, (GLsizeiptr)size, nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);

    glBindBufferBase(GL_UNIFORM_BUFFER, binding, ubo);
}

bool UniformBuffer::write(size_t offset, const void* data, size_t size){
    if(!ubo || offset + size > m_size){
        std::cerr << "[Uniform] write of " << size << " bytes at " << offset
                  << " exceeds buffer of " << m_size << " bytes\n";
        return false;
    }
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferSubData(GL_UNIFORM_BUFFER, (GLintptr)offset, (GLsizeiptr)size, data);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
    return true;
}
