#pragma once
#include <string>
#include <vector>

#include "Mesh.h"
#include "Texture.h"

class Shader;
struct ModelData;

class Model {
public:
    Model() = default;
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    bool loadFromFile(const std::string& path);
    bool upload(const ModelData& data);
    void destroy();

    // overrideTex replaces every material's diffuse texture when non-null.
    void draw(const Shader& shader, const Texture2D* overrideTex = nullptr, int textureUnit = 0) const;

    size_t meshCount() const { return m_meshes.size(); }
    size_t materialCount() const { return m_materials.size(); }

private:
    struct Material {
        std::string name;
        Texture2D diffuse;
    };

    struct Part {
        Mesh mesh;
        int material = -1;
    };

    std::vector<Part> m_meshes;
    std::vector<Material> m_materials;
};
