#pragma once
#include <string>
#include <vector>
#include <cstdint>

#include "Vertex.h"

struct MeshData {
    std::string name;
    std::vector<ModelVertex> vertices;
    std::vector<uint32_t> indices;
    int materialId = -1;
};

struct MaterialData {
    std::string name;
    std::string diffusePath;                 // absolute or relative to cwd
    std::vector<unsigned char> diffuseBytes; // encoded image embedded in the model file
};

struct ModelData {
    std::vector<MeshData> meshes;
    std::vector<MaterialData> materials;
};

// Picks the loader from the file extension (.obj, .gltf, .glb).
bool loadModelData(const std::string& path, ModelData& out);

std::string parentDir(const std::string& path);
std::string pathJoin(const std::string& a, const std::string& b);
