#pragma once

#include <chrono>

namespace mapgen {

/**
 * @brief Measures frame deltas, total time and a smoothed FPS
 */
class FrameClock {
public:
    FrameClock();

    /// Start/restart the clock
    void start();

    /// Mark the end of a frame and return delta time in seconds
    float tick();

    /// Last frame's delta time in seconds
    float deltaTime() const { return deltaTime_; }

    /// FPS averaged over the last sample window (0 until the first window completes)
    float fps() const { return fps_; }

    /// Seconds since start()
    float totalTime() const;

    /// Number of ticks since start()
    unsigned long long tickCount() const { return tickCount_; }

    static void sleep(float seconds);

private:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    TimePoint startTime_;
    TimePoint lastFrameTime_;
    float deltaTime_ = 0.0f;
    float fps_ = 0.0f;
    unsigned long long tickCount_ = 0;

    static constexpr int FPS_SAMPLE_COUNT = 60;
    float fpsAccumulator_ = 0.0f;
    int fpsFrameCount_ = 0;
};

} // namespace mapgen
