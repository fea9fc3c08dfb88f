#include "GltfLoader.h"

#include <iostream>
#include <cstring>

#define CGLTF_IMPLEMENTATION
#include <cgltf.h>

static cgltf_accessor* findAttr(cgltf_primitive* prim, cgltf_attribute_type type, int index = 0) {
    for (cgltf_size i = 0; i < prim->attributes_count; i++) {
        cgltf_attribute& a = prim->attributes[i];
        if (a.type == type && (int)a.index == index) return a.data;
    }
    return nullptr;
}

static void readMaterials(const cgltf_data* data, const std::string& baseDir, ModelData& out) {
    out.materials.resize(data->materials_count);

    for (cgltf_size i = 0; i < data->materials_count; i++) {
        const cgltf_material& mat = data->materials[i];
        MaterialData& dst = out.materials[i];
        dst.name = mat.name ? mat.name : ("material" + std::to_string(i));

        const cgltf_texture* tex = mat.has_pbr_metallic_roughness
            ? mat.pbr_metallic_roughness.base_color_texture.texture : nullptr;
        if (!tex || !tex->image) continue;

        const cgltf_image* img = tex->image;
        if (img->buffer_view && img->buffer_view->buffer->data) {
            const cgltf_buffer_view* bv = img->buffer_view;
            const unsigned char* bytes = (const unsigned char*)bv->buffer->data + bv->offset;
            dst.diffuseBytes.assign(bytes, bytes + bv->size);
        } else if (img->uri && std::strncmp(img->uri, "data:", 5) != 0) {
            std::string uri = img->uri;
            uri.resize(cgltf_decode_uri(&uri[0]));
            dst.diffusePath = pathJoin(baseDir, uri);
        } else {
            std::cerr << "[Model] skipping inline image for material " << dst.name << "\n";
        }
    }
}

bool loadGltfFile(const std::string& path, ModelData& out) {
    out = ModelData{};

    cgltf_options options{};
    cgltf_data* data = nullptr;

    cgltf_result r = cgltf_parse_file(&options, path.c_str(), &data);
    if (r != cgltf_result_success || !data) {
        std::cerr << "[Model] cgltf_parse_file failed: " << path << "\n";
        return false;
    }

    r = cgltf_load_buffers(&options, data, path.c_str());
    if (r != cgltf_result_success) {
        std::cerr << "[Model] cgltf_load_buffers failed: " << path << "\n";
        cgltf_free(data);
        return false;
    }

    readMaterials(data, parentDir(path), out);

    for (cgltf_size mi = 0; mi < data->meshes_count; mi++) {
        cgltf_mesh* mesh = &data->meshes[mi];

        for (cgltf_size pi = 0; pi < mesh->primitives_count; pi++) {
            cgltf_primitive* prim = &mesh->primitives[pi];
            if (prim->type != cgltf_primitive_type_triangles) continue;

            cgltf_accessor* posAcc = findAttr(prim, cgltf_attribute_type_position, 0);
            if (!posAcc) continue;

            cgltf_accessor* nrmAcc = findAttr(prim, cgltf_attribute_type_normal, 0);
            cgltf_accessor* uvAcc  = findAttr(prim, cgltf_attribute_type_texcoord, 0);

            MeshData dst;
            dst.name = mesh->name ? mesh->name : ("mesh" + std::to_string(mi));
            dst.vertices.resize((size_t)posAcc->count);

            for (cgltf_size v = 0; v < posAcc->count; v++) {
                ModelVertex& vert = dst.vertices[(size_t)v];
                vert = ModelVertex{};
                cgltf_accessor_read_float(posAcc, v, vert.position, 3);
                if (nrmAcc) cgltf_accessor_read_float(nrmAcc, v, vert.normal, 3);
                if (uvAcc) {
                    cgltf_accessor_read_float(uvAcc, v, vert.uv, 2);
                    // glTF puts v=0 at the top row; textures are uploaded bottom row first
                    vert.uv[1] = 1.0f - vert.uv[1];
                }
            }

            if (prim->indices) {
                cgltf_accessor* idxAcc = prim->indices;
                dst.indices.resize((size_t)idxAcc->count);
                for (cgltf_size k = 0; k < idxAcc->count; k++) {
                    dst.indices[(size_t)k] = (uint32_t)cgltf_accessor_read_index(idxAcc, k);
                }
            } else {
                dst.indices.resize(dst.vertices.size());
                for (size_t k = 0; k < dst.indices.size(); k++) dst.indices[k] = (uint32_t)k;
            }

            if (prim->material)
                dst.materialId = (int)(prim->material - data->materials);

            out.meshes.push_back(std::move(dst));
        }
    }

    cgltf_free(data);

    if (out.meshes.empty()) {
        std::cerr << "[Model] no triangle primitives in: " << path << "\n";
        return false;
    }
    std::cout << "[Model] " << path << ": " << out.meshes.size() << " meshes, "
              << out.materials.size() << " materials\n";
    return true;
}
