#pragma once
#include <string>
#include <vector>

struct AppConfig {
    int width = 1280;
    int height = 720;
    std::string title = "obj viewer";

    float fovyDeg = 45.0f;
    float znear = 0.1f;
    float zfar = 100.0f;

    float moveSpeed = 4.0f;
    float sensitivity = 0.4f;
    bool vsync = true;

    std::string shaderDir = "shaders";
    std::string assetDir = "assets";
    std::string modelPath;   // empty: <assetDir>/cube.obj

    std::vector<std::string> textureNames {"road01.png", "dirt01.png"};

    std::string resolvedModelPath() const;
    std::vector<std::string> resolvedTexturePaths() const;
};

enum class ParseResult {
    Ok,
    Help,
    Error,
};

// obj_viewer [model] [--width N] [--height N] [--fov DEG] [--shaders DIR]
//            [--assets DIR] [--speed F] [--sensitivity F] [--no-vsync]
ParseResult parseArgs(int argc, const char* const* argv, AppConfig& cfg, std::string& error);

const char* usageText();
