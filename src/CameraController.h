#pragma once

class Camera;

enum class Key {
    Unknown,
    W, A, S, D,
    Up, Down, Left, Right,
    Space, LeftShift,
    I, J, K, L,
};

enum class ScrollUnit {
    Lines,
    Pixels,
};

constexpr float kPixelsPerScrollLine = 100.0f;

struct ControllerFlags {
    bool moveForward = false;
    bool moveBackward = false;
    bool moveLeft = false;
    bool moveRight = false;
    bool moveUp = false;
    bool moveDown = false;

    bool rotateLeft = false;
    bool rotateRight = false;
    bool rotateUp = false;
    bool rotateDown = false;

    bool operator==(const ControllerFlags& o) const;
    bool operator!=(const ControllerFlags& o) const { return !(*this == o); }
};

// Turns held keys and accumulated mouse/scroll input into camera motion.
// Input handlers only record state; tick() applies it once per frame and
// clears the mouse and scroll accumulators whether or not new input arrived.
class CameraController {
public:
    float moveSpeed = 4.0f;    // units/sec
    float rotateSpeed = 1.0f;  // rad/sec for keyboard look
    float sensitivity = 0.4f;  // mouse and scroll scale

    CameraController() = default;
    CameraController(float speed, float sens) : moveSpeed(speed), sensitivity(sens) {}

    // Returns false for keys with no binding.
    bool onKey(Key key, bool pressed);
    void onMouseMove(float dx, float dy);
    void onScroll(float delta, ScrollUnit unit = ScrollUnit::Lines);

    void tick(Camera& cam, float dt);

    const ControllerFlags& flags() const { return m_flags; }
    float rotateHorizontal() const { return m_rotateHorizontal; }
    float rotateVertical() const { return m_rotateVertical; }
    float scroll() const { return m_scroll; }

private:
    ControllerFlags m_flags;

    float m_rotateHorizontal = 0.0f;
    float m_rotateVertical = 0.0f;
    float m_scroll = 0.0f;
};
