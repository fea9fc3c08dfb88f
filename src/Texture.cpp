#include "Texture.h"
#include <iostream>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

bool Texture2D::loadFromFile(const std::string& path, bool srgb){
    stbi_set_flip_vertically_on_load(1);
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &comp, 0);
    if(!data){
        std::cerr << "[Texture] load failed: " << path << " (" << stbi_failure_reason() << ")\n";
        return false;
    }
    label = path;
    return upload(data, srgb);
}

bool Texture2D::loadFromMemory(const unsigned char* bytes, size_t size, const std::string& debugName, bool srgb){
    stbi_set_flip_vertically_on_load(1);
    unsigned char* data = stbi_load_from_memory(bytes, (int)size, &w, &h, &comp, 0);
    if(!data){
        std::cerr << "[Texture] decode failed: " << debugName << " (" << stbi_failure_reason() << ")\n";
        return false;
    }
    label = debugName;
    return upload(data, srgb);
}

bool Texture2D::upload(unsigned char* data, bool srgb){
    GLenum fmt;
    switch(comp){
        case 1: fmt = GL_RED; break;
        case 3: fmt = GL_RGB; break;
        case 4: fmt = GL_RGBA; break;
        default:
            std::cerr << "[Texture] unsupported channel count " << comp << ": " << label << "\n";
            stbi_image_free(data);
            return false;
    }
    GLenum internal = (fmt == GL_RED) ? GL_R8 : fmt;
    if(srgb && fmt != GL_RED){
        internal = (fmt == GL_RGBA) ? GL_SRGB8_ALPHA8 : GL_SRGB8;
    }

    destroy();
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);

    // rows of RGB images are not 4-byte aligned in general
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, internal, w, h, 0, fmt, GL_UNSIGNED_BYTE, data);
    glGenerateMipmap(GL_TEXTURE_2D);

    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_REPEAT);

    glBindTexture(GL_TEXTURE_2D, 0);

    stbi_image_free(data);
    std::cout << "[Texture] " << label << ": " << w << "x" << h << " (" << comp << " channels)\n";
    return true;
}

void Texture2D::bind(int unit) const{
    glActiveTexture(GL_TEXTURE0 + unit);
    glBindTexture(GL_TEXTURE_2D, id);
}

void Texture2D::destroy(){
    if(id){
        glDeleteTextures(1, &id);
        id = 0;
    }
}
