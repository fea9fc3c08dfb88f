#include "FrameTimer.h"

float FrameTimer::tick(double now) {
    const double dt = now - m_last;
    m_last = now;
    return (float)dt;
}
