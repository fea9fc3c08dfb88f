#include "CameraController.h"
#include "Camera.h"

#include <gtest/gtest.h>
#include <glm/glm.hpp>

namespace {

void expectSameCamera(const Camera& a, const Camera& b) {
    EXPECT_EQ(a.position.x, b.position.x);
    EXPECT_EQ(a.position.y, b.position.y);
    EXPECT_EQ(a.position.z, b.position.z);
    EXPECT_EQ(a.yaw(), b.yaw());
    EXPECT_EQ(a.pitch(), b.pitch());
}

} // namespace

TEST(CameraController, TickWithoutInputIsIdentity) {
    CameraController ctl;
    Camera cam(glm::vec3(1.0f, 2.0f, 3.0f), 0.4f, -0.3f);
    const Camera before = cam;

    ctl.tick(cam, 0.016f);
    expectSameCamera(cam, before);
    ctl.tick(cam, 1.0f);
    expectSameCamera(cam, before);
}

TEST(CameraController, KeyDownThenUpRestoresFlags) {
    const Key keys[] = {Key::W, Key::A, Key::S, Key::D, Key::Up, Key::Down, Key::Left,
                        Key::Right, Key::Space, Key::LeftShift, Key::I, Key::J, Key::K, Key::L};
    for (Key k : keys) {
        CameraController ctl;
        const ControllerFlags before = ctl.flags();
        EXPECT_TRUE(ctl.onKey(k, true));
        EXPECT_NE(ctl.flags(), before);
        EXPECT_TRUE(ctl.onKey(k, false));
        EXPECT_EQ(ctl.flags(), before);
    }
}

TEST(CameraController, ReleaseClearsEveryMovementFlag) {
    CameraController ctl;
    for (Key k : {Key::D, Key::Space, Key::LeftShift}) ctl.onKey(k, true);
    EXPECT_TRUE(ctl.flags().moveRight);
    EXPECT_TRUE(ctl.flags().moveUp);
    EXPECT_TRUE(ctl.flags().moveDown);

    for (Key k : {Key::D, Key::Space, Key::LeftShift}) ctl.onKey(k, false);
    EXPECT_EQ(ctl.flags(), ControllerFlags{});
}

TEST(CameraController, UnknownKeyIsIgnored) {
    CameraController ctl;
    EXPECT_FALSE(ctl.onKey(Key::Unknown, true));
    EXPECT_EQ(ctl.flags(), ControllerFlags{});
}

TEST(CameraController, ArrowKeysAliasWasd) {
    CameraController ctl;
    ctl.onKey(Key::Up, true);
    EXPECT_TRUE(ctl.flags().moveForward);
    ctl.onKey(Key::Left, true);
    EXPECT_TRUE(ctl.flags().moveLeft);
}

TEST(CameraController, ForwardForOneSecond) {
    CameraController ctl;
    ctl.moveSpeed = 2.0f;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);

    ctl.onKey(Key::W, true);
    ctl.tick(cam, 1.0f);

    EXPECT_FLOAT_EQ(cam.position.x, 2.0f);
    EXPECT_FLOAT_EQ(cam.position.y, 0.0f);
    EXPECT_FLOAT_EQ(cam.position.z, 0.0f);
    EXPECT_FLOAT_EQ(cam.yaw(), 0.0f);
    EXPECT_FLOAT_EQ(cam.pitch(), 0.0f);
}

TEST(CameraController, ForwardIgnoresPitch) {
    CameraController ctl;
    ctl.moveSpeed = 1.0f;
    Camera cam(glm::vec3(0.0f), 0.0f, 1.0f);

    ctl.onKey(Key::W, true);
    ctl.tick(cam, 0.5f);
    EXPECT_FLOAT_EQ(cam.position.x, 0.5f);
    EXPECT_FLOAT_EQ(cam.position.y, 0.0f);
}

TEST(CameraController, StrafeAndVertical) {
    CameraController ctl;
    ctl.moveSpeed = 3.0f;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);

    ctl.onKey(Key::D, true);
    ctl.onKey(Key::Space, true);
    ctl.tick(cam, 1.0f);
    EXPECT_NEAR(cam.position.x, 0.0f, 1e-6f);
    EXPECT_FLOAT_EQ(cam.position.y, 3.0f);
    EXPECT_FLOAT_EQ(cam.position.z, 3.0f);

    // opposite keys cancel
    ctl.onKey(Key::A, true);
    ctl.onKey(Key::LeftShift, true);
    ctl.tick(cam, 1.0f);
    EXPECT_FLOAT_EQ(cam.position.y, 3.0f);
    EXPECT_FLOAT_EQ(cam.position.z, 3.0f);
}

TEST(CameraController, MouseDeltaAccumulatesUntilTick) {
    CameraController ctl;
    ctl.onMouseMove(10.0f, 5.0f);
    ctl.onMouseMove(10.0f, 5.0f);
    EXPECT_FLOAT_EQ(ctl.rotateHorizontal(), 20.0f);
    EXPECT_FLOAT_EQ(ctl.rotateVertical(), 10.0f);

    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);
    ctl.tick(cam, 0.1f);
    EXPECT_FLOAT_EQ(ctl.rotateHorizontal(), 0.0f);
    EXPECT_FLOAT_EQ(ctl.rotateVertical(), 0.0f);

    EXPECT_FLOAT_EQ(cam.yaw(), 20.0f * ctl.sensitivity * 0.1f);
    EXPECT_FLOAT_EQ(cam.pitch(), -10.0f * ctl.sensitivity * 0.1f);
}

TEST(CameraController, StaleMouseDeltaDoesNotRotateLaterTicks) {
    CameraController ctl;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);

    ctl.onMouseMove(4.0f, 0.0f);
    ctl.tick(cam, 0.5f);
    const float yawAfterMove = cam.yaw();

    // no new mouse input; movement must not pick up the old delta
    ctl.onKey(Key::W, true);
    ctl.tick(cam, 0.5f);
    EXPECT_FLOAT_EQ(cam.yaw(), yawAfterMove);
}

TEST(CameraController, PitchClampedThroughController) {
    CameraController ctl;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);

    ctl.onMouseMove(0.0f, -100000.0f);
    ctl.tick(cam, 1.0f);
    EXPECT_FLOAT_EQ(cam.pitch(), kSafeFracPi2);

    ctl.onMouseMove(0.0f, 100000.0f);
    ctl.tick(cam, 1.0f);
    EXPECT_FLOAT_EQ(cam.pitch(), -kSafeFracPi2);
}

TEST(CameraController, KeyboardLook) {
    CameraController ctl;
    ctl.rotateSpeed = 0.5f;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);

    ctl.onKey(Key::L, true);
    ctl.onKey(Key::I, true);
    ctl.tick(cam, 1.0f);
    EXPECT_FLOAT_EQ(cam.yaw(), 0.5f);
    EXPECT_FLOAT_EQ(cam.pitch(), 0.5f);

    // held keys keep rotating, unlike mouse deltas
    ctl.tick(cam, 1.0f);
    EXPECT_FLOAT_EQ(cam.yaw(), 1.0f);
}

TEST(CameraController, ScrollDollyIsConsumedOnce) {
    CameraController ctl;
    ctl.moveSpeed = 1.0f;
    ctl.sensitivity = 0.5f;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);

    ctl.onScroll(1.0f, ScrollUnit::Lines);
    EXPECT_FLOAT_EQ(ctl.scroll(), kPixelsPerScrollLine);
    ctl.onScroll(20.0f, ScrollUnit::Pixels);
    EXPECT_FLOAT_EQ(ctl.scroll(), kPixelsPerScrollLine + 20.0f);

    ctl.tick(cam, 0.01f);
    EXPECT_FLOAT_EQ(ctl.scroll(), 0.0f);
    EXPECT_NEAR(cam.position.x, 120.0f * 1.0f * 0.5f * 0.01f, 1e-5f);

    const glm::vec3 afterDolly = cam.position;
    ctl.tick(cam, 0.01f);
    EXPECT_EQ(cam.position, afterDolly);
}

TEST(CameraController, NegativeDtDoesNothing) {
    CameraController ctl;
    Camera cam(glm::vec3(0.0f), 0.0f, 0.0f);
    ctl.onKey(Key::W, true);
    ctl.onMouseMove(5.0f, 5.0f);
    ctl.tick(cam, -1.0f);

    EXPECT_EQ(cam.position, glm::vec3(0.0f));
    EXPECT_FLOAT_EQ(cam.yaw(), 0.0f);
    EXPECT_FLOAT_EQ(ctl.rotateHorizontal(), 0.0f);
}
