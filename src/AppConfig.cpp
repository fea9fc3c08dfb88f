#include "AppConfig.h"
#include "ModelData.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

std::string AppConfig::resolvedModelPath() const {
    return modelPath.empty() ? pathJoin(assetDir, "cube.obj") : modelPath;
}

std::vector<std::string> AppConfig::resolvedTexturePaths() const {
    std::vector<std::string> out;
    out.reserve(textureNames.size());
    for (const auto& t : textureNames) out.push_back(pathJoin(assetDir, t));
    return out;
}

const char* usageText() {
    return "usage: obj_viewer [model.obj|model.gltf|model.glb]\n"
           "                  [--width N] [--height N] [--fov DEG]\n"
           "                  [--shaders DIR] [--assets DIR]\n"
           "                  [--speed F] [--sensitivity F] [--no-vsync]\n";
}

static bool parsePositiveInt(const char* s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v <= 0 || v > 16384) return false;
    out = (int)v;
    return true;
}

static bool parsePositiveFloat(const char* s, float& out) {
    char* end = nullptr;
    float v = std::strtof(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v) || !(v > 0.0f)) return false;
    out = v;
    return true;
}

ParseResult parseArgs(int argc, const char* const* argv, AppConfig& cfg, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
            return ParseResult::Help;
        if (std::strcmp(arg, "--no-vsync") == 0) {
            cfg.vsync = false;
            continue;
        }

        if (arg[0] != '-') {
            if (!cfg.modelPath.empty()) {
                error = "more than one model path given";
                return ParseResult::Error;
            }
            cfg.modelPath = arg;
            continue;
        }

        if (i + 1 >= argc) {
            error = std::string("missing value for ") + arg;
            return ParseResult::Error;
        }
        const char* val = argv[++i];
        bool ok = true;

        if (std::strcmp(arg, "--width") == 0) ok = parsePositiveInt(val, cfg.width);
        else if (std::strcmp(arg, "--height") == 0) ok = parsePositiveInt(val, cfg.height);
        else if (std::strcmp(arg, "--fov") == 0) ok = parsePositiveFloat(val, cfg.fovyDeg) && cfg.fovyDeg < 180.0f;
        else if (std::strcmp(arg, "--speed") == 0) ok = parsePositiveFloat(val, cfg.moveSpeed);
        else if (std::strcmp(arg, "--sensitivity") == 0) ok = parsePositiveFloat(val, cfg.sensitivity);
        else if (std::strcmp(arg, "--shaders") == 0) cfg.shaderDir = val;
        else if (std::strcmp(arg, "--assets") == 0) cfg.assetDir = val;
        else {
            error = std::string("unknown option ") + arg;
            return ParseResult::Error;
        }

        if (!ok) {
            error = std::string("invalid value '") + val + "' for " + arg;
            return ParseResult::Error;
        }
    }
    return ParseResult::Ok;
}
