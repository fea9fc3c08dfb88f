#pragma once
#include <cstddef>
#include <string>
#include <glad/glad.h>

struct Texture2D {
    GLuint id = 0;
    int w=0, h=0, comp=0;
    std::string label;

    bool loadFromFile(const std::string& path, bool srgb=false);
    bool loadFromMemory(const unsigned char* bytes, size_t size, const std::string& debugName, bool srgb=false);
    void bind(int unit) const;
    void destroy();

private:
    bool upload(unsigned char* data, bool srgb);
};
