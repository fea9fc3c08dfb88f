#pragma once

// Turns absolute timestamps (seconds, from glfwGetTime) into per-frame deltas.
// Timestamps stay in double; only the delta is narrowed, so dt keeps its
// precision however long the window has been open.
class FrameTimer {
public:
    explicit FrameTimer(double start) : m_start(start), m_last(start) {}

    // Seconds since the previous call, or since construction for the first one.
    float tick(double now);

    double elapsed() const { return m_last - m_start; }

private:
    double m_start;
    double m_last;
};
