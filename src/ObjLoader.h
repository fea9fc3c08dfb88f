#pragma once
#include <istream>
#include <string>
#include <vector>

#include "ModelData.h"

// Wavefront OBJ + MTL through tinyobjloader. Polygons are triangulated and every
// unique v/vt/vn triple becomes one vertex, so each mesh needs a single index buffer.
// A shape is split into one mesh per run of faces sharing a material.
bool loadObjFile(const std::string& path, ModelData& out);

// Same as loadObjFile for in-memory text. mtlText answers every mtllib line;
// baseDir resolves map_Kd paths.
bool parseObj(const std::string& objText, const std::string& mtlText, ModelData& out,
              const std::string& baseDir = "");

// Appends one MaterialData per newmtl.
bool parseMtl(std::istream& in, std::vector<MaterialData>& out, const std::string& baseDir = "");
