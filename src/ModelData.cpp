#include "ModelData.h"
#include "ObjLoader.h"
#include "GltfLoader.h"

#include <algorithm>
#include <cctype>
#include <iostream>

static std::string lowerExtension(const std::string& path) {
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return {};
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return ext;
}

bool loadModelData(const std::string& path, ModelData& out) {
    const std::string ext = lowerExtension(path);
    if (ext == "obj")
        return loadObjFile(path, out);
    if (ext == "gltf" || ext == "glb")
        return loadGltfFile(path, out);

    std::cerr << "[Model] unsupported model format: " << path << "\n";
    return false;
}

std::string parentDir(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return (slash == std::string::npos) ? std::string() : path.substr(0, slash);
}

std::string pathJoin(const std::string& a, const std::string& b) {
    if (a.empty() || (!b.empty() && (b[0] == '/' || b[0] == '\\')))
        return b;
    char c = a.back();
    if (c == '/' || c == '\\')
        return a + b;
    return a + "/" + b;
}
