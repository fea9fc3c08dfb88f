#include "Camera.h"
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

float clampPitch(float pitchRad) {
    return std::clamp(pitchRad, -kSafeFracPi2, kSafeFracPi2);
}

Camera::Camera(const glm::vec3& pos, float yawRad, float pitchRad)
    : position(pos), m_yaw(yawRad), m_pitch(clampPitch(pitchRad)) {}

void Camera::setPitch(float pitchRad) {
    m_pitch = clampPitch(pitchRad);
}

void Camera::rotate(float dYaw, float dPitch) {
    m_yaw += dYaw;
    m_pitch = clampPitch(m_pitch + dPitch);
}

glm::vec3 Camera::front() const {
    float cy = std::cos(m_yaw);
    float sy = std::sin(m_yaw);
    float cp = std::cos(m_pitch);
    float sp = std::sin(m_pitch);
    glm::vec3 f(cy * cp, sp, sy * cp);
    return glm::normalize(f);
}

// movement ignores pitch so WASD stays on the ground plane
glm::vec3 Camera::flatFront() const {
    return glm::vec3(std::cos(m_yaw), 0.0f, std::sin(m_yaw));
}

glm::vec3 Camera::flatRight() const {
    return glm::vec3(-std::sin(m_yaw), 0.0f, std::cos(m_yaw));
}

glm::mat4 Camera::view() const {
    return glm::lookAt(position, position + front(), glm::vec3(0,1,0));
}
