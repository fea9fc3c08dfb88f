#include "Model.h"
#include "ModelData.h"
#include "Shader.h"

#include <iostream>
#include <utility>

Model::~Model() {
    destroy();
}

bool Model::loadFromFile(const std::string& path) {
    ModelData data;
    if (!loadModelData(path, data))
        return false;
    return upload(data);
}

bool Model::upload(const ModelData& data) {
    destroy();

    m_materials.resize(data.materials.size());
    for (size_t i = 0; i < data.materials.size(); i++) {
        const MaterialData& src = data.materials[i];
        Material& dst = m_materials[i];
        dst.name = src.name;

        bool ok = true;
        if (!src.diffuseBytes.empty()) {
            ok = dst.diffuse.loadFromMemory(src.diffuseBytes.data(), src.diffuseBytes.size(), src.name, true);
        } else if (!src.diffusePath.empty()) {
            ok = dst.diffuse.loadFromFile(src.diffusePath, true);
        }
        if (!ok)
            std::cerr << "[Model] material " << src.name << " drawn untextured\n";
    }

    m_meshes.reserve(data.meshes.size());
    for (const MeshData& src : data.meshes) {
        if (src.indices.empty()) continue;

        Part part;
        part.mesh.upload(src.vertices, src.indices);
        part.material = (src.materialId >= 0 && (size_t)src.materialId < m_materials.size())
            ? src.materialId : -1;
        m_meshes.push_back(std::move(part));
    }

    return !m_meshes.empty();
}

void Model::draw(const Shader& shader, const Texture2D* overrideTex, int textureUnit) const {
    shader.setInt("uDiffuse", textureUnit);

    for (const auto& p : m_meshes) {
        const Texture2D* tex = overrideTex;
        if (!tex && p.material >= 0)
            tex = &m_materials[(size_t)p.material].diffuse;

        bool hasTex = tex && tex->id != 0;
        shader.setBool("uHasTex", hasTex);
        if (hasTex) tex->bind(textureUnit);

        p.mesh.draw();

        if (hasTex) glBindTexture(GL_TEXTURE_2D, 0);
    }
}

void Model::destroy() {
    m_meshes.clear();

    for (auto& m : m_materials) m.diffuse.destroy();
    m_materials.clear();
}
