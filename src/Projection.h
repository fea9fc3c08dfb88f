#pragma once
#include <cstdint>
#include <glm/glm.hpp>

// glm builds clip space with z in [-1,1]; this remaps it to [0,1].
// Leaves x, y and w untouched.
extern const glm::mat4 kDepthCorrection;

class Projection {
public:
    // Throws std::invalid_argument unless 0 < fovy < pi and 0 < znear < zfar.
    // A zero width or height is treated as 1.
    Projection(uint32_t width, uint32_t height, float fovyRad, float znear, float zfar);

    void resize(uint32_t width, uint32_t height);

    glm::mat4 matrix() const;

    float aspect() const { return m_aspect; }
    float fovy() const { return m_fovy; }
    float znear() const { return m_znear; }
    float zfar() const { return m_zfar; }

private:
    float m_aspect = 1.0f;
    float m_fovy = 0.785398f;
    float m_znear = 0.1f;
    float m_zfar = 100.0f;
};

class Camera;

glm::mat4 viewProjection(const Camera& cam, const Projection& proj);
