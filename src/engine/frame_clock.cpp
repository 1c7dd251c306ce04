#include "mapgen/engine/frame_clock.hpp"
#include <thread>

namespace mapgen {

FrameClock::FrameClock() {
    start();
}

void FrameClock::start() {
    startTime_ = Clock::now();
    lastFrameTime_ = startTime_;
    deltaTime_ = 0.0f;
    fps_ = 0.0f;
    tickCount_ = 0;
    fpsAccumulator_ = 0.0f;
    fpsFrameCount_ = 0;
}

float FrameClock::tick() {
    TimePoint now = Clock::now();
    deltaTime_ = std::chrono::duration<float>(now - lastFrameTime_).count();
    lastFrameTime_ = now;
    tickCount_++;

    fpsAccumulator_ += deltaTime_;
    if (++fpsFrameCount_ >= FPS_SAMPLE_COUNT) {
        if (fpsAccumulator_ > 0.0f) {
            fps_ = static_cast<float>(fpsFrameCount_) / fpsAccumulator_;
        }
        fpsAccumulator_ = 0.0f;
        fpsFrameCount_ = 0;
    }

    return deltaTime_;
}

float FrameClock::totalTime() const {
    return std::chrono::duration<float>(Clock::now() - startTime_).count();
}

void FrameClock::sleep(float seconds) {
    if (seconds > 0.0f) {
        std::this_thread::sleep_for(std::chrono::duration<float>(seconds));
    }
}

} // namespace mapgen
