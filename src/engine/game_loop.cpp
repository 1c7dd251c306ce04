#include "mapgen/engine/game_loop.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>
#include <string>

namespace mapgen {

GameLoop::~GameLoop() {
    if (isSetup_ && !isShutdown_) {
        shutdown();
    }
}

void GameLoop::setFixedTimestep(float seconds) {
    if (!(seconds > 0.0f)) {
        throw std::invalid_argument("GameLoop: fixed timestep must be positive");
    }
    fixedTimestep_ = seconds;
}

// =============================================================================
// Lifecycle
// =============================================================================

void GameLoop::setup() {
    if (isSetup_) {
        return;
    }

    onInitialize();
    onLoadContent();

    clock_.start();
    accumulator_ = 0.0f;
    simulatedTime_ = 0.0f;
    drawTime_ = 0.0f;
    isSetup_ = true;
    isShutdown_ = false;

    MAPGEN_DEBUG(LogCategory::Game, "GameLoop setup complete");
}

void GameLoop::run() {
    if (isRunning_) {
        MAPGEN_WARN(LogCategory::Game, "GameLoop::run() called while already running");
        return;
    }

    if (!isSetup_) {
        setup();
    }

    isRunning_ = true;
    shouldQuit_ = false;

    MAPGEN_INFO(LogCategory::Game, "GameLoop started");

    while (!shouldQuit()) {
        float dt = clock_.tick();
        step(dt);

        if (targetFrameTime_ > 0.0f) {
            FrameClock::sleep(targetFrameTime_ - clock_.deltaTime());
        }
    }

    isRunning_ = false;
    MAPGEN_INFO(LogCategory::Game, "GameLoop exited after " +
                std::to_string(frameNumber_) + " frames");

    shutdown();
}

void GameLoop::shutdown() {
    if (!isSetup_ || isShutdown_) {
        return;
    }

    // Mark first so a throwing unload is never retried from the destructor
    isShutdown_ = true;
    isSetup_ = false;

    try {
        onUnloadContent();
    } catch (const std::exception& e) {
        MAPGEN_ERROR(LogCategory::Game,
            "GameLoop: unloading content failed: " + std::string(e.what()));
    }

    MAPGEN_DEBUG(LogCategory::Game, "GameLoop shutdown complete");
}

// =============================================================================
// Frame Execution
// =============================================================================

template <typename Fn>
bool GameLoop::guarded(Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        if (!onError(e)) {
            quit();
            return false;
        }
    }
    return true;
}

void GameLoop::step(float dt) {
    if (!guarded([this] { onProcessEvents(); })) {
        return;
    }

    if (isSuspended()) {
        if (!suspended_) {
            MAPGEN_DEBUG(LogCategory::Game, "GameLoop suspended");
        }
        suspended_ = true;
        guarded([this] { onWaitForEvents(); });
        return;
    }
    if (suspended_) {
        // Time spent suspended is dropped, not caught up
        suspended_ = false;
        dt = 0.0f;
        MAPGEN_DEBUG(LogCategory::Game, "GameLoop resumed");
    }

    accumulator_ += dt;
    int updates = 0;
    bool runningSlowly = false;

    while (accumulator_ >= fixedTimestep_) {
        simulatedTime_ += fixedTimestep_;
        GameTime time{fixedTimestep_, simulatedTime_, false};

        bool keepGoing = guarded([this, &time] { onUpdate(time); });
        accumulator_ -= fixedTimestep_;
        updates++;
        updateCount_++;

        if (!keepGoing) {
            return;
        }

        // Prevent spiral of death
        if (updates >= maxUpdatesPerFrame_ && accumulator_ >= fixedTimestep_) {
            accumulator_ = 0.0f;
            runningSlowly = true;
            MAPGEN_WARN(LogCategory::Game, "GameLoop: Falling behind, skipping updates");
            break;
        }
    }

    drawTime_ += dt;
    GameTime drawTime{dt, drawTime_, runningSlowly};
    if (!guarded([this, &drawTime] { onDraw(drawTime); })) {
        return;
    }

    frameNumber_++;
}

bool GameLoop::onError(const std::exception& e) {
    MAPGEN_ERROR(LogCategory::Game, "GameLoop error: " + std::string(e.what()));
    return true;
}

} // namespace mapgen
