#include "Shader.h"
#include <fstream>
#include <sstream>
#include <iostream>

namespace {

bool readSource(const std::string& path, std::string& out){
    std::ifstream f(path, std::ios::binary);
    if(!f.is_open()){
        std::cerr << "[Shader] cannot open " << path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    if(out.empty()){
        std::cerr << "[Shader] empty source " << path << "\n";
        return false;
    }
    return true;
}

std::string shaderLog(GLuint s){
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::string log((size_t)len, '\0');
    if(len > 0) glGetShaderInfoLog(s, len, nullptr, &log[0]);
    return log;
}

std::string programLog(GLuint p){
    GLint len = 0;
    glGetProgramiv(p, GL_INFO_LOG_LENGTH, &len);
    std::string log((size_t)len, '\0');
    if(len > 0) glGetProgramInfoLog(p, len, nullptr, &log[0]);
    return log;
}

// Returns 0 on failure, with the driver log printed.
GLuint compileStage(GLenum type, const std::string& path){
    std::string src;
    if(!readSource(path, src)) return 0;

    GLuint s = glCreateShader(type);
    const char* c = src.c_str();
    glShaderSource(s, 1, &c, nullptr);
    glCompileShader(s);

    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if(!ok){
        std::cerr << "[Shader] compile failed: " << path << "\n" << shaderLog(s) << "\n";
        glDeleteShader(s);
        return 0;
    }
    return s;
}

} // namespace

Shader::~Shader(){
    if(m_id) glDeleteProgram(m_id);
}

bool Shader::load(const std::string& vsPath, const std::string& fsPath){
    GLuint v = compileStage(GL_VERTEX_SHADER, vsPath);
    GLuint f = v ? compileStage(GL_FRAGMENT_SHADER, fsPath) : 0;
    if(!f){
        if(v) glDeleteShader(v);
        return false;
    }

    GLuint p = glCreateProgram();
    glAttachShader(p, v);
    glAttachShader(p, f);
    glLinkProgram(p);
    glDetachShader(p, v);
    glDetachShader(p, f);
    glDeleteShader(v);
    glDeleteShader(f);

    GLint ok = 0;
    glGetProgramiv(p, GL_LINK_STATUS, &ok);
    if(!ok){
        std::cerr << "[Shader] link failed: " << vsPath << " + " << fsPath << "\n" << programLog(p) << "\n";
        glDeleteProgram(p);
        return false;
    }

    if(m_id) glDeleteProgram(m_id);
    m_id = p;
    m_label = vsPath + " + " + fsPath;
    m_locations.clear();
    return true;
}

void Shader::use() const { glUseProgram(m_id); }

bool Shader::bindUniformBlock(const char* blockName, GLuint binding) const {
    GLuint idx = glGetUniformBlockIndex(m_id, blockName);
    if(idx == GL_INVALID_INDEX){
        std::cerr << "[Shader] " << m_label << " has no uniform block " << blockName << "\n";
        return false;
    }
    glUniformBlockBinding(m_id, idx, binding);
    return true;
}

// -1 for names the linker dropped; glUniform* ignores that location
GLint Shader::location(const char* name) const {
    auto it = m_locations.find(name);
    if(it != m_locations.end()) return it->second;
    GLint loc = glGetUniformLocation(m_id, name);
    m_locations.emplace(name, loc);
    return loc;
}

void Shader::setInt(const char* name, int v) const {
    glUniform1i(location(name), v);
}
void Shader::setBool(const char* name, bool v) const {
    glUniform1i(location(name), v ? 1 : 0);
}
