/**
 * @file test_game_loop.cpp
 * @brief Game loop lifecycle and fixed-step timing (no window required)
 *
 * This test verifies:
 * - setup/run/shutdown hook ordering and single unload
 * - Fixed timestep update counts and the catch-up cap
 * - Error routing: continue vs. stop
 * - Suspended frames wait for events and drop their time
 * - FrameClock delta and total time
 */

#undef NDEBUG
#include <mapgen/engine/game_loop.hpp>
#include <mapgen/engine/frame_clock.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mapgen;

namespace {

class ScriptedGame : public GameLoop {
public:
    ~ScriptedGame() override { shutdown(); }

    std::vector<std::string> calls;
    int updates = 0;
    int draws = 0;
    int errors = 0;
    int quitAfterDraws = -1;
    int waits = 0;
    bool suspended = false;
    int throwOnUpdate = -1;
    bool continueOnError = true;
    GameTime lastDraw;
    GameTime lastUpdate;

protected:
    void onInitialize() override { calls.push_back("initialize"); }
    void onLoadContent() override { calls.push_back("load"); }
    void onUnloadContent() override { calls.push_back("unload"); }

    bool isSuspended() const override { return suspended; }
    void onWaitForEvents() override { waits++; }

    void onUpdate(const GameTime& time) override {
        lastUpdate = time;
        if (updates++ == throwOnUpdate) {
            throw std::runtime_error("update failed");
        }
    }

    void onDraw(const GameTime& time) override {
        lastDraw = time;
        if (++draws == quitAfterDraws) {
            quit();
        }
    }

    bool onError(const std::exception& e) override {
        errors++;
        GameLoop::onError(e);
        return continueOnError;
    }
};

bool near(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) <= eps;
}

} // anonymous namespace

void test_lifecycle_order() {
    std::cout << "Testing: Lifecycle hook order... ";

    ScriptedGame game;
    game.quitAfterDraws = 3;
    game.run();

    assert(game.calls.size() == 3);
    assert(game.calls[0] == "initialize");
    assert(game.calls[1] == "load");
    assert(game.calls[2] == "unload");
    assert(game.draws == 3);
    assert(game.frameNumber() == 3);
    assert(game.isShutdown());
    assert(!game.isRunning());

    // Further shutdown calls do not unload again
    game.shutdown();
    assert(game.calls.size() == 3);

    std::cout << "PASSED\n";
}

void test_unload_on_destruction() {
    std::cout << "Testing: Unload runs once when only set up... ";

    std::vector<std::string> calls;
    {
        ScriptedGame game;
        game.setup();
        game.setup();
        assert(game.isSetup());
        assert(game.calls.size() == 2);
        game.shutdown();
        calls = game.calls;
    }
    assert(calls.size() == 3);
    assert(calls[2] == "unload");

    std::cout << "PASSED\n";
}

void test_fixed_timestep_updates() {
    std::cout << "Testing: Fixed timestep update count... ";

    ScriptedGame game;
    game.setFixedTimestep(0.01f);
    game.setup();

    game.step(0.035f);
    assert(game.updates == 3);
    assert(game.draws == 1);
    assert(near(game.lastUpdate.elapsed, 0.01f));
    assert(near(game.lastUpdate.total, 0.03f));

    // Leftover 5ms plus 6ms crosses one more step
    game.step(0.006f);
    assert(game.updates == 4);
    assert(game.draws == 2);
    assert(near(game.lastDraw.elapsed, 0.006f));
    assert(!game.lastDraw.runningSlowly);

    // Too small for a step: draw only
    game.step(0.001f);
    assert(game.updates == 4);
    assert(game.draws == 3);

    std::cout << "PASSED\n";
}

void test_catch_up_cap() {
    std::cout << "Testing: Updates capped when falling behind... ";

    ScriptedGame game;
    game.setFixedTimestep(0.01f);
    game.setMaxUpdatesPerFrame(4);
    game.setup();

    game.step(1.0f);
    assert(game.updates == 4);
    assert(game.lastDraw.runningSlowly);

    // Dropped time is not replayed
    game.step(0.0f);
    assert(game.updates == 4);
    assert(!game.lastDraw.runningSlowly);

    std::cout << "PASSED\n";
}

void test_error_continues() {
    std::cout << "Testing: Errors routed to onError and loop continues... ";

    ScriptedGame game;
    game.setFixedTimestep(0.01f);
    game.throwOnUpdate = 0;
    game.setup();

    game.step(0.015f);
    assert(game.errors == 1);
    assert(game.draws == 1);
    assert(!game.quitRequested());

    std::cout << "PASSED\n";
}

void test_error_stops() {
    std::cout << "Testing: onError returning false ends the loop... ";

    ScriptedGame game;
    game.setFixedTimestep(0.01f);
    game.throwOnUpdate = 0;
    game.continueOnError = false;
    game.setup();

    game.step(0.015f);
    assert(game.errors == 1);
    assert(game.draws == 0);
    assert(game.quitRequested());

    std::cout << "PASSED\n";
}

void test_suspended_waits_for_events() {
    std::cout << "Testing: Suspended frames block on events... ";

    ScriptedGame game;
    game.setFixedTimestep(0.01f);
    game.setup();

    game.step(0.01f);
    assert(game.updates == 1);
    assert(game.draws == 1);

    game.suspended = true;
    game.step(0.5f);
    game.step(0.5f);
    assert(game.waits == 2);
    assert(game.updates == 1);
    assert(game.draws == 1);
    assert(game.frameNumber() == 1);

    // The first frame after resuming simulates nothing that passed meanwhile
    game.suspended = false;
    game.step(0.5f);
    assert(game.waits == 2);
    assert(game.updates == 1);
    assert(game.draws == 2);
    assert(near(game.lastDraw.elapsed, 0.0f));
    assert(!game.lastDraw.runningSlowly);

    game.step(0.01f);
    assert(game.updates == 2);
    assert(game.draws == 3);

    std::cout << "PASSED\n";
}

void test_invalid_timestep() {
    std::cout << "Testing: Non-positive timestep rejected... ";

    ScriptedGame game;
    bool threw = false;
    try {
        game.setFixedTimestep(0.0f);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(near(game.fixedTimestep(), 1.0f / 60.0f));

    std::cout << "PASSED\n";
}

void test_frame_clock() {
    std::cout << "Testing: FrameClock delta and total... ";

    FrameClock clock;
    FrameClock::sleep(0.01f);
    float dt = clock.tick();
    assert(dt >= 0.009f);
    assert(clock.deltaTime() == dt);
    assert(clock.tickCount() == 1);
    assert(clock.totalTime() >= dt);
    assert(clock.fps() == 0.0f);

    clock.start();
    assert(clock.tickCount() == 0);
    assert(clock.deltaTime() == 0.0f);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "==============================================\n";
    std::cout << "MapGen - Game Loop Tests\n";
    std::cout << "==============================================\n\n";

    int passed = 0;
    int failed = 0;

    try {
        test_lifecycle_order(); passed++;
        test_unload_on_destruction(); passed++;
        test_fixed_timestep_updates(); passed++;
        test_catch_up_cap(); passed++;
        test_error_continues(); passed++;
        test_error_stops(); passed++;
        test_suspended_waits_for_events(); passed++;
        test_invalid_timestep(); passed++;
        test_frame_clock(); passed++;
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        failed++;
    }

    std::cout << "\n==============================================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << "==============================================\n";

    return failed > 0 ? 1 : 0;
}
