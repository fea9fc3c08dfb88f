#pragma once
#include <cstdint>
#include <glm/glm.hpp>

class Camera;
class Projection;

// std140 block "Camera". Uploaded verbatim, column-major.
struct CameraUniform {
    float viewProj[4][4];

    CameraUniform();
    void updateViewProj(const Camera& cam, const Projection& proj);
    void set(const glm::mat4& m);
};

// std140 block "Light". vec3 members take 16 bytes each.
struct LightUniform {
    float position[3] = {2.0f, 2.0f, 2.0f};
    uint32_t paddingPosition = 0;
    float color[3] = {1.0f, 1.0f, 1.0f};
    uint32_t paddingColor = 0;
};

static_assert(sizeof(CameraUniform) == 64, "CameraUniform must match the std140 mat4 layout");
static_assert(sizeof(LightUniform) == 32, "LightUniform must match the std140 vec3 layout");
