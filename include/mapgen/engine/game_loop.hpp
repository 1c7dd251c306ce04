#pragma once

#include "mapgen/engine/frame_clock.hpp"

#include <cstdint>
#include <exception>

namespace mapgen {

/// Timing snapshot handed to update and draw
struct GameTime {
    float elapsed = 0.0f;       // seconds covered by this call
    float total = 0.0f;         // simulated seconds since the loop started
    bool runningSlowly = false; // updates were dropped to catch up
};

/**
 * @brief Fixed-timestep game loop with a content lifecycle
 *
 * Lifecycle:
 * 1. setup(): onInitialize(), then onLoadContent()
 * 2. run(): per frame onProcessEvents(), zero or more fixed-step onUpdate(),
 *    then one onDraw(). While isSuspended() holds, a frame is only
 *    onProcessEvents() then onWaitForEvents(), and the suspended time is
 *    never simulated.
 * 3. shutdown(): onUnloadContent() exactly once
 *
 * Exceptions thrown from per-frame hooks are passed to onError(); returning
 * false from it ends the loop. Exceptions from setup() propagate to the caller.
 *
 * The loop owns no window. Derived classes poll their event source in
 * onProcessEvents() and override shouldQuit() to observe it closing.
 *
 * Example:
 * @code
 * class MyGame : public GameLoop {
 * protected:
 *     void onUpdate(const GameTime& time) override { ... }
 *     void onDraw(const GameTime& time) override { ... }
 * };
 *
 * MyGame game;
 * game.run();   // Blocks until quit()
 * @endcode
 *
 * Derived classes that override onUnloadContent() should call shutdown() from
 * their own destructor; the base destructor can no longer reach the override.
 */
class GameLoop {
public:
    GameLoop() = default;

    /// Calls shutdown() if setup() ran and shutdown() did not
    virtual ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Fixed timestep for onUpdate() in seconds (default: 1/60)
    void setFixedTimestep(float seconds);

    /// Maximum onUpdate() calls per frame before dropping time (default: 5)
    void setMaxUpdatesPerFrame(int count) { maxUpdatesPerFrame_ = count; }

    /// Target framerate for sleep-based pacing (0 = unlimited) (default: 0)
    void setTargetFramerate(float fps) {
        targetFrameTime_ = (fps > 0.0f) ? (1.0f / fps) : 0.0f;
    }

    float fixedTimestep() const { return fixedTimestep_; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Run onInitialize() and onLoadContent(); no-op if already set up
    void setup();

    /**
     * @brief Run frames until shouldQuit() returns true (blocks)
     *
     * Calls setup() first if needed, and shutdown() on exit.
     */
    void run();

    /**
     * @brief Advance one frame by dt seconds
     *
     * run() calls this with the measured frame time. Exposed so a frame can
     * be driven with a chosen delta.
     */
    void step(float dt);

    /// Run onUnloadContent() once; no-op if never set up or already shut down
    void shutdown();

    /// Request exit after the current frame
    void quit() { shouldQuit_ = true; }

    // =========================================================================
    // State Queries
    // =========================================================================

    bool isSetup() const { return isSetup_; }
    bool isRunning() const { return isRunning_; }
    bool isShutdown() const { return isShutdown_; }
    bool quitRequested() const { return shouldQuit_; }

    const FrameClock& clock() const { return clock_; }
    uint64_t frameNumber() const { return frameNumber_; }
    uint64_t updateCount() const { return updateCount_; }

protected:
    /// Non-graphics initialization
    virtual void onInitialize() {}

    /// Create graphics content
    virtual void onLoadContent() {}

    /// Release graphics content
    virtual void onUnloadContent() {}

    /// Poll input/window events
    virtual void onProcessEvents() {}

    /// True while there is nothing to show (e.g. a minimized window)
    virtual bool isSuspended() const { return false; }

    /// Block until something may have changed; called instead of update/draw while suspended
    virtual void onWaitForEvents() {}

    /// Game logic at the fixed timestep
    virtual void onUpdate(const GameTime& time) { (void)time; }

    /// Render one frame
    virtual void onDraw(const GameTime& time) { (void)time; }

    /**
     * @brief Handle an exception from a per-frame hook
     *
     * Default: logs the error and continues.
     *
     * @return true to continue running, false to exit the loop
     */
    virtual bool onError(const std::exception& e);

    /// Default: returns true once quit() was called
    virtual bool shouldQuit() const { return shouldQuit_; }

private:
    // Run a hook, routing exceptions to onError(). Returns false to stop the frame.
    template <typename Fn>
    bool guarded(Fn&& fn);

    FrameClock clock_;
    float fixedTimestep_ = 1.0f / 60.0f;
    float targetFrameTime_ = 0.0f;
    float accumulator_ = 0.0f;
    float simulatedTime_ = 0.0f;
    float drawTime_ = 0.0f;
    int maxUpdatesPerFrame_ = 5;

    bool isSetup_ = false;
    bool isRunning_ = false;
    bool isShutdown_ = false;
    bool shouldQuit_ = false;
    bool suspended_ = false;
    uint64_t frameNumber_ = 0;
    uint64_t updateCount_ = 0;
};

} // namespace mapgen
