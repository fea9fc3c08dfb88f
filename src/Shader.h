#pragma once
#include <string>
#include <unordered_map>
#include <glad/glad.h>

// GLSL program built from a vertex + fragment file pair.
class Shader {
public:
    Shader() = default;
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    // On failure the previously loaded program, if any, stays in use.
    bool load(const std::string& vsPath, const std::string& fsPath);
    void use() const;

    // Attaches the named std140 block to a uniform buffer binding point.
    bool bindUniformBlock(const char* blockName, GLuint binding) const;

    void setInt(const char* name, int v) const;
    void setBool(const char* name, bool v) const;

private:
    GLint location(const char* name) const;

    GLuint m_id = 0;
    std::string m_label;
    mutable std::unordered_map<std::string, GLint> m_locations;
};
