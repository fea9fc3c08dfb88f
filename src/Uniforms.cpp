#include "Uniforms.h"
#include "Camera.h"
#include "Projection.h"

#include <glm/gtc/type_ptr.hpp>
#include <cstring>

CameraUniform::CameraUniform() {
    set(glm::mat4(1.0f));
}

void CameraUniform::updateViewProj(const Camera& cam, const Projection& proj) {
    set(viewProjection(cam, proj));
}

void CameraUniform::set(const glm::mat4& m) {
    std::memcpy(viewProj, glm::value_ptr(m), sizeof(viewProj));
}
