#include "CameraController.h"
#include "Camera.h"

#include <algorithm>

static float axis(bool positive, bool negative) {
    return (positive ? 1.0f : 0.0f) - (negative ? 1.0f : 0.0f);
}

bool ControllerFlags::operator==(const ControllerFlags& o) const {
    return moveForward == o.moveForward && moveBackward == o.moveBackward &&
           moveLeft == o.moveLeft && moveRight == o.moveRight &&
           moveUp == o.moveUp && moveDown == o.moveDown &&
           rotateLeft == o.rotateLeft && rotateRight == o.rotateRight &&
           rotateUp == o.rotateUp && rotateDown == o.rotateDown;
}

bool CameraController::onKey(Key key, bool pressed) {
    switch (key) {
    case Key::W:
    case Key::Up:
        m_flags.moveForward = pressed;
        return true;
    case Key::S:
    case Key::Down:
        m_flags.moveBackward = pressed;
        return true;
    case Key::A:
    case Key::Left:
        m_flags.moveLeft = pressed;
        return true;
    case Key::D:
    case Key::Right:
        m_flags.moveRight = pressed;
        return true;
    case Key::Space:
        m_flags.moveUp = pressed;
        return true;
    case Key::LeftShift:
        m_flags.moveDown = pressed;
        return true;
    case Key::J:
        m_flags.rotateLeft = pressed;
        return true;
    case Key::L:
        m_flags.rotateRight = pressed;
        return true;
    case Key::I:
        m_flags.rotateUp = pressed;
        return true;
    case Key::K:
        m_flags.rotateDown = pressed;
        return true;
    default:
        return false;
    }
}

void CameraController::onMouseMove(float dx, float dy) {
    m_rotateHorizontal += dx;
    m_rotateVertical += dy;
}

void CameraController::onScroll(float delta, ScrollUnit unit) {
    m_scroll += (unit == ScrollUnit::Lines) ? delta * kPixelsPerScrollLine : delta;
}

void CameraController::tick(Camera& cam, float dt) {
    dt = std::max(dt, 0.0f);

    cam.position += cam.flatFront() * axis(m_flags.moveForward, m_flags.moveBackward) * moveSpeed * dt;
    cam.position += cam.flatRight() * axis(m_flags.moveRight, m_flags.moveLeft) * moveSpeed * dt;

    // dolly along the full view direction, not a fov zoom
    cam.position += cam.front() * m_scroll * moveSpeed * sensitivity * dt;

    // no roll, so vertical motion is straight along world Y
    cam.position.y += axis(m_flags.moveUp, m_flags.moveDown) * moveSpeed * dt;

    float dYaw = m_rotateHorizontal * sensitivity + axis(m_flags.rotateRight, m_flags.rotateLeft) * rotateSpeed;
    float dPitch = -m_rotateVertical * sensitivity + axis(m_flags.rotateUp, m_flags.rotateDown) * rotateSpeed;
    cam.rotate(dYaw * dt, dPitch * dt);

    m_rotateHorizontal = 0.0f;
    m_rotateVertical = 0.0f;
    m_scroll = 0.0f;
}
