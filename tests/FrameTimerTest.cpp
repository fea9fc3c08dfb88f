#include "FrameTimer.h"

#include <gtest/gtest.h>

TEST(FrameTimer, ReturnsDeltaSincePreviousTick) {
    FrameTimer timer(2.0);
    EXPECT_FLOAT_EQ(timer.tick(2.5), 0.5f);
    EXPECT_FLOAT_EQ(timer.tick(2.75), 0.25f);
    EXPECT_DOUBLE_EQ(timer.elapsed(), 0.75);
}

TEST(FrameTimer, KeepsPrecisionAfterLongUptime) {
    // three days of uptime; a float timestamp here has a resolution of 1/64 s
    const double start = 3.0 * 24.0 * 3600.0;
    FrameTimer timer(start);
    const double frame = 1.0 / 144.0;
    for (int i = 1; i <= 10; ++i)
        EXPECT_NEAR(timer.tick(start + frame * i), frame, 1e-6);
}

TEST(FrameTimer, RepeatedTimestampGivesZero) {
    FrameTimer timer(10.0);
    timer.tick(11.0);
    EXPECT_EQ(timer.tick(11.0), 0.0f);
}
