#include "Projection.h"
#include "Camera.h"

#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

const glm::mat4 kDepthCorrection(
    1.0f, 0.0f, 0.0f, 0.0f,
    0.0f, 1.0f, 0.0f, 0.0f,
    0.0f, 0.0f, 0.5f, 0.0f,
    0.0f, 0.0f, 0.5f, 1.0f);

static float aspectOf(uint32_t width, uint32_t height) {
    return (float)std::max(1u, width) / (float)std::max(1u, height);
}

Projection::Projection(uint32_t width, uint32_t height, float fovyRad, float znear, float zfar)
    : m_aspect(aspectOf(width, height)), m_fovy(fovyRad), m_znear(znear), m_zfar(zfar)
{
    if (!(fovyRad > 0.0f && fovyRad < 3.14159265f))
        throw std::invalid_argument("projection fovy out of range: " + std::to_string(fovyRad));
    if (!(znear > 0.0f))
        throw std::invalid_argument("projection znear must be positive: " + std::to_string(znear));
    if (!(zfar > znear))
        throw std::invalid_argument("projection zfar must exceed znear: " + std::to_string(zfar));
}

void Projection::resize(uint32_t width, uint32_t height) {
    m_aspect = aspectOf(width, height);
}

glm::mat4 Projection::matrix() const {
    return kDepthCorrection * glm::perspective(m_fovy, m_aspect, m_znear, m_zfar);
}

glm::mat4 viewProjection(const Camera& cam, const Projection& proj) {
    return proj.matrix() * cam.view();
}
