#pragma once
#include <glm/glm.hpp>

// Keeps forward.y strictly inside (-1, 1) so the look basis never degenerates.
constexpr float kSafeFracPi2 = 1.57079632679f - 0.001f;

class Camera {
public:
    glm::vec3 position {0.0f, 1.0f, 2.0f};

    Camera() = default;
    Camera(const glm::vec3& pos, float yawRad, float pitchRad);

    float yaw() const { return m_yaw; }
    float pitch() const { return m_pitch; }

    void setYaw(float yawRad) { m_yaw = yawRad; }
    void setPitch(float pitchRad);
    void rotate(float dYaw, float dPitch);

    glm::vec3 front() const;
    glm::vec3 flatFront() const;
    glm::vec3 flatRight() const;
    glm::mat4 view() const;

private:
    float m_yaw = -1.57079632679f;
    float m_pitch = -0.35f;
};

float clampPitch(float pitchRad);
