#include "ObjLoader.h"

#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <unordered_map>
#include <utility>

#define TINYOBJLOADER_IMPLEMENTATION
#include <tiny_obj_loader.h>

namespace {

struct CornerKey {
    int v;
    int vt;
    int vn;

    bool operator==(const CornerKey& o) const { return v == o.v && vt == o.vt && vn == o.vn; }
};

struct CornerKeyHash {
    size_t operator()(const CornerKey& k) const {
        size_t h = std::hash<int>()(k.v);
        h = h * 31 + std::hash<int>()(k.vt);
        h = h * 31 + std::hash<int>()(k.vn);
        return h;
    }
};

// -1 means "not given"; anything else must address an existing element
bool inRange(int index, size_t count, bool optional) {
    if (index < 0) return optional && index == -1;
    return (size_t)index < count;
}

void convertMaterial(const tinyobj::material_t& src, const std::string& baseDir, MaterialData& dst) {
    dst.name = src.name;
    if (!src.diffuse_texname.empty())
        dst.diffusePath = pathJoin(baseDir, src.diffuse_texname);
}

void logMessages(const tinyobj::ObjReader& reader, const std::string& what) {
    if (!reader.Warning().empty())
        std::cerr << "[Model] " << what << ": " << reader.Warning();
    if (!reader.Error().empty())
        std::cerr << "[Model] " << what << ": " << reader.Error();
}

class MeshBuilder {
public:
    MeshBuilder(const tinyobj::attrib_t& attrib, ModelData& out) : m_attrib(attrib), m_out(out) {}

    void begin(const std::string& name, int materialId) {
        m_out.meshes.emplace_back();
        m_out.meshes.back().name = name;
        m_out.meshes.back().materialId = materialId;
        m_corners.clear();
    }

    bool add(const tinyobj::index_t& idx) {
        const size_t positions = m_attrib.vertices.size() / 3;
        const size_t texcoords = m_attrib.texcoords.size() / 2;
        const size_t normals = m_attrib.normals.size() / 3;
        if (!inRange(idx.vertex_index, positions, false) ||
            !inRange(idx.texcoord_index, texcoords, true) ||
            !inRange(idx.normal_index, normals, true)) {
            std::cerr << "[Model] face index out of range (v " << idx.vertex_index << ", vt "
                      << idx.texcoord_index << ", vn " << idx.normal_index << ")\n";
            return false;
        }

        MeshData& mesh = m_out.meshes.back();
        const CornerKey key{idx.vertex_index, idx.texcoord_index, idx.normal_index};
        auto it = m_corners.find(key);
        if (it == m_corners.end()) {
            it = m_corners.emplace(key, (uint32_t)mesh.vertices.size()).first;
            mesh.vertices.push_back(makeVertex(key));
        }
        mesh.indices.push_back(it->second);
        return true;
    }

private:
    ModelVertex makeVertex(const CornerKey& k) const {
        ModelVertex vert{};
        vert.position[0] = m_attrib.vertices[3 * (size_t)k.v + 0];
        vert.position[1] = m_attrib.vertices[3 * (size_t)k.v + 1];
        vert.position[2] = m_attrib.vertices[3 * (size_t)k.v + 2];
        if (k.vt >= 0) {
            vert.uv[0] = m_attrib.texcoords[2 * (size_t)k.vt + 0];
            vert.uv[1] = m_attrib.texcoords[2 * (size_t)k.vt + 1];
        }
        if (k.vn >= 0) {
            vert.normal[0] = m_attrib.normals[3 * (size_t)k.vn + 0];
            vert.normal[1] = m_attrib.normals[3 * (size_t)k.vn + 1];
            vert.normal[2] = m_attrib.normals[3 * (size_t)k.vn + 2];
        }
        return vert;
    }

    const tinyobj::attrib_t& m_attrib;
    ModelData& m_out;
    std::unordered_map<CornerKey, uint32_t, CornerKeyHash> m_corners;
};

bool buildModel(const tinyobj::ObjReader& reader, const std::string& baseDir, ModelData& out) {
    out = ModelData{};

    const auto& materials = reader.GetMaterials();
    out.materials.resize(materials.size());
    for (size_t i = 0; i < materials.size(); ++i)
        convertMaterial(materials[i], baseDir, out.materials[i]);

    MeshBuilder builder(reader.GetAttrib(), out);
    for (const auto& shape : reader.GetShapes()) {
        const tinyobj::mesh_t& mesh = shape.mesh;
        size_t offset = 0;
        bool started = false;
        int currentMaterial = -1;

        for (size_t f = 0; f < mesh.num_face_vertices.size(); ++f) {
            const size_t corners = mesh.num_face_vertices[f];
            int material = (f < mesh.material_ids.size()) ? mesh.material_ids[f] : -1;
            if (material < 0 || (size_t)material >= out.materials.size())
                material = -1;

            if (!started || material != currentMaterial) {
                builder.begin(shape.name, material);
                currentMaterial = material;
                started = true;
            }
            for (size_t c = 0; c < corners; ++c) {
                if (!builder.add(mesh.indices[offset + c]))
                    return false;
            }
            offset += corners;
        }
    }

    if (out.meshes.empty()) {
        std::cerr << "[Model] no faces\n";
        return false;
    }
    return true;
}

} // namespace

bool parseMtl(std::istream& in, std::vector<MaterialData>& out, const std::string& baseDir) {
    std::map<std::string, int> names;
    std::vector<tinyobj::material_t> materials;
    std::string warn, err;
    tinyobj::LoadMtl(&names, &materials, &in, &warn, &err);
    if (!warn.empty()) std::cerr << "[Model] " << warn;
    if (!err.empty()) {
        std::cerr << "[Model] " << err;
        return false;
    }

    for (const auto& m : materials) {
        MaterialData dst;
        convertMaterial(m, baseDir, dst);
        out.push_back(std::move(dst));
    }
    return true;
}

bool parseObj(const std::string& objText, const std::string& mtlText, ModelData& out,
              const std::string& baseDir) {
    tinyobj::ObjReaderConfig config;
    config.triangulate = true;

    tinyobj::ObjReader reader;
    const bool ok = reader.ParseFromString(objText, mtlText, config);
    logMessages(reader, "OBJ text");
    if (!ok) return false;
    return buildModel(reader, baseDir, out);
}

bool loadObjFile(const std::string& path, ModelData& out) {
    const std::string baseDir = parentDir(path);

    tinyobj::ObjReaderConfig config;
    config.triangulate = true;
    config.mtl_search_path = baseDir;

    tinyobj::ObjReader reader;
    const bool ok = reader.ParseFromFile(path, config);
    logMessages(reader, path);
    if (!ok) {
        std::cerr << "[Model] failed to parse: " << path << "\n";
        return false;
    }
    if (!buildModel(reader, baseDir, out)) {
        std::cerr << "[Model] unusable OBJ: " << path << "\n";
        return false;
    }

    size_t tris = 0;
    for (const auto& m : out.meshes) tris += m.indices.size() / 3;
    std::cout << "[Model] " << path << ": " << out.meshes.size() << " meshes, "
              << out.materials.size() << " materials, " << tris << " triangles\n";
    return true;
}
