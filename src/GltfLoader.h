#pragma once
#include <string>

#include "ModelData.h"

// glTF 2.0 (.gltf or .glb) through cgltf. Only triangle primitives are kept;
// node transforms are not applied.
bool loadGltfFile(const std::string& path, ModelData& out);
