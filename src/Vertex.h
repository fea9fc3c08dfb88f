#pragma once
#include <cstddef>
#include <cstdint>

struct VertexAttribute {
    uint32_t location;
    int components;   // float count
    size_t offset;
};

// Vertex layout for loaded models
struct ModelVertex {
    float position[3];
    float uv[2];
    float normal[3];

    static constexpr VertexAttribute kAttributes[] = {
        {0, 3, 0},
        {1, 2, sizeof(float) * 3},
        {2, 3, sizeof(float) * 5},
    };
};

// Position + uv only
struct SimpleVertex {
    float position[3];
    float uv[2];

    static constexpr VertexAttribute kAttributes[] = {
        {0, 3, 0},
        {1, 2, sizeof(float) * 3},
    };
};

static_assert(sizeof(ModelVertex) == 32, "ModelVertex must be tightly packed");
static_assert(sizeof(SimpleVertex) == 20, "SimpleVertex must be tightly packed");
