/**
 * @file test_primitives2d.cpp
 * @brief Primitives2D line/shape rendering against a recording batch
 *
 * This test verifies:
 * - Construction requirements (batch, texture provider, pixel texture)
 * - drawLine submits one stretched, rotated pixel quad
 * - drawPoints/drawCircle/drawArc segment counts and offsets
 * - dispose() releases the pixel once and blocks further drawing
 * - A second dispose() is reported as a warning
 */

#undef NDEBUG
#include <mapgen/primitives/primitives2d.hpp>
#include <mapgen/core/errors.hpp>
#include <mapgen/core/logging.hpp>

#include "support/recording_batch.hpp"

#include <glm/gtc/constants.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <string_view>

using namespace mapgen;
using mapgen::testing::FakeTexture;
using mapgen::testing::RecordingBatch;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

} // anonymous namespace

void test_construction_creates_white_pixel() {
    std::cout << "Testing: Construction creates a 1x1 white pixel... ";

    RecordingBatch batch;
    {
        Primitives2D primitives(&batch);
        assert(batch.provider.created == 1);
        assert(FakeTexture::liveCount() == 1);

        const auto* pixel = dynamic_cast<const FakeTexture*>(primitives.pixel());
        assert(pixel != nullptr);
        assert(pixel->width() == 1);
        assert(pixel->height() == 1);
        assert(pixel->color() == colors::White);
        assert(!primitives.isDisposed());
    }
    assert(FakeTexture::liveCount() == 0);

    std::cout << "PASSED\n";
}

void test_construction_rejects_missing_dependencies() {
    std::cout << "Testing: Construction rejects missing dependencies... ";

    bool threw = false;
    try {
        Primitives2D primitives(nullptr);
    } catch (const InvalidDependencyError&) {
        threw = true;
    }
    assert(threw);

    RecordingBatch noProvider;
    noProvider.hasProvider = false;
    threw = false;
    try {
        Primitives2D primitives(&noProvider);
    } catch (const InvalidDependencyError&) {
        threw = true;
    }
    assert(threw);

    RecordingBatch failing;
    failing.provider.failCreation = true;
    threw = false;
    try {
        Primitives2D primitives(&failing);
    } catch (const InvalidDependencyError&) {
        threw = true;
    }
    assert(threw);

    RecordingBatch batch;
    threw = false;
    try {
        Primitives2D primitives(&batch, nullptr);
    } catch (const InvalidDependencyError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_draw_line() {
    std::cout << "Testing: drawLine submits one stretched quad... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);

    primitives.drawLine({0.0f, 0.0f}, {3.0f, 4.0f}, colors::Red, 2.0f);

    assert(batch.draws.size() == 1);
    const QuadDraw& quad = batch.draws[0];
    assert(quad.texture == primitives.pixel());
    assert(quad.position == Point2D(0.0f, 0.0f));
    assert(!quad.sourceRect.has_value());
    assert(quad.color == colors::Red);
    assert(near(quad.rotation, std::atan2(4.0f, 3.0f)));
    assert(quad.origin == Point2D(0.0f, 0.0f));
    assert(near(quad.scale.x, 5.0f));
    assert(near(quad.scale.y, 2.0f));
    assert(quad.effects == SpriteEffects::None);
    assert(quad.layerDepth == 0.0f);

    std::cout << "PASSED\n";
}

void test_draw_line_directions() {
    std::cout << "Testing: drawLine rotation follows direction... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);

    primitives.drawLine({10.0f, 10.0f}, {10.0f, 0.0f}, colors::White, 1.0f);
    primitives.drawLine({10.0f, 10.0f}, {0.0f, 10.0f}, colors::White, 1.0f);
    primitives.drawLine({5.0f, 5.0f}, {5.0f, 5.0f}, colors::White, 1.0f);

    assert(batch.draws.size() == 3);
    assert(near(batch.draws[0].rotation, -glm::half_pi<float>()));
    assert(near(batch.draws[0].scale.x, 10.0f));
    assert(near(batch.draws[1].rotation, glm::pi<float>()));
    assert(batch.draws[1].position == Point2D(10.0f, 10.0f));

    // Degenerate segment still submits, with zero length
    assert(batch.draws[2].scale.x == 0.0f);
    assert(batch.draws[2].rotation == 0.0f);

    std::cout << "PASSED\n";
}

void test_draw_points() {
    std::cout << "Testing: drawPoints draws N-1 offset segments... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);

    primitives.drawPoints({0.0f, 0.0f}, {}, colors::White, 1.0f);
    primitives.drawPoints({0.0f, 0.0f}, {{1.0f, 1.0f}}, colors::White, 1.0f);
    assert(batch.draws.empty());

    PointSequence points = {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}, {0.0f, 10.0f}};
    primitives.drawPoints({100.0f, 50.0f}, points, colors::Yellow, 3.0f);

    assert(batch.draws.size() == 3);
    assert(batch.draws[0].position == Point2D(100.0f, 50.0f));
    assert(batch.draws[1].position == Point2D(110.0f, 50.0f));
    assert(batch.draws[2].position == Point2D(110.0f, 60.0f));
    for (const auto& quad : batch.draws) {
        assert(near(quad.scale.x, 10.0f));
        assert(quad.scale.y == 3.0f);
        assert(quad.color == colors::Yellow);
    }

    std::cout << "PASSED\n";
}

void test_draw_circle() {
    std::cout << "Testing: drawCircle draws one segment per side... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);

    primitives.drawCircle({200.0f, 100.0f}, 50.0f, 16, colors::White, 1.0f);
    assert(batch.draws.size() == 16);
    assert(batch.draws[0].position == Point2D(250.0f, 100.0f));

    // Second call reuses the cached outline
    primitives.drawCircle({0.0f, 0.0f}, 50.0f, 16, colors::White, 1.0f);
    assert(batch.draws.size() == 32);
    assert(primitives.geometry().cache()->size() == 1);

    std::cout << "PASSED\n";
}

void test_draw_arc() {
    std::cout << "Testing: drawArc segment count... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);

    primitives.drawArc({0.0f, 0.0f}, 20.0f, 8, 0.0f, glm::pi<float>(), colors::White, 1.0f);
    assert(batch.draws.size() == 4);

    batch.draws.clear();
    primitives.drawArc({0.0f, 0.0f}, 20.0f, 8, 0.0f, glm::two_pi<float>(), colors::White, 1.0f);
    assert(batch.draws.size() == 8);

    std::cout << "PASSED\n";
}

void test_invalid_geometry_propagates() {
    std::cout << "Testing: Invalid geometry surfaces as an error... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);

    bool threw = false;
    try {
        primitives.drawCircle({0.0f, 0.0f}, 10.0f, 0, colors::White, 1.0f);
    } catch (const InvalidGeometryError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        primitives.drawArc({0.0f, 0.0f}, 10.0f, 4, 0.0f, 10.0f, colors::White, 1.0f);
    } catch (const InvalidGeometryError&) {
        threw = true;
    }
    assert(threw);
    assert(batch.draws.empty());

    std::cout << "PASSED\n";
}

void test_shared_cache_between_renderers() {
    std::cout << "Testing: Renderers share an injected cache... ";

    auto cache = std::make_shared<CircleCache>();
    RecordingBatch batchA;
    RecordingBatch batchB;
    Primitives2D a(&batchA, cache);
    Primitives2D b(&batchB, cache);

    a.drawCircle({0.0f, 0.0f}, 30.0f, 12, colors::White, 1.0f);
    b.drawCircle({0.0f, 0.0f}, 30.0f, 12, colors::White, 1.0f);
    assert(cache->size() == 1);
    assert(batchA.draws.size() == 12);
    assert(batchB.draws.size() == 12);

    std::cout << "PASSED\n";
}

void test_dispose() {
    std::cout << "Testing: dispose() is idempotent and blocks drawing... ";

    RecordingBatch batch;
    Primitives2D primitives(&batch);
    assert(FakeTexture::liveCount() == 1);

    primitives.dispose();
    assert(primitives.isDisposed());
    assert(primitives.pixel() == nullptr);
    assert(FakeTexture::liveCount() == 0);

    primitives.dispose();
    assert(FakeTexture::liveCount() == 0);

    bool threw = false;
    try {
        primitives.drawLine({0.0f, 0.0f}, {1.0f, 1.0f}, colors::White, 1.0f);
    } catch (const DisposedResourceError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        primitives.drawCircle({0.0f, 0.0f}, 5.0f, 8, colors::White, 1.0f);
    } catch (const DisposedResourceError&) {
        threw = true;
    }
    assert(threw);
    assert(batch.draws.empty());

    std::cout << "PASSED\n";
}

void test_second_dispose_warns() {
    std::cout << "Testing: A second dispose() logs a warning... ";

    int warnings = 0;
    Logger::global().setSink([&](LogLevel level, LogCategory category, std::string_view) {
        if (level == LogLevel::Warning && category == LogCategory::Render) {
            warnings++;
        }
    });

    {
        RecordingBatch batch;
        Primitives2D primitives(&batch);
        primitives.dispose();
        assert(warnings == 0);

        primitives.dispose();
        assert(warnings == 1);
        assert(FakeTexture::liveCount() == 0);
    }

    // Destruction after dispose() is silent
    assert(warnings == 1);
    Logger::global().setSink(nullptr);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "==============================================\n";
    std::cout << "MapGen - Primitives2D Tests\n";
    std::cout << "==============================================\n\n";

    int passed = 0;
    int failed = 0;

    try {
        test_construction_creates_white_pixel(); passed++;
        test_construction_rejects_missing_dependencies(); passed++;
        test_draw_line(); passed++;
        test_draw_line_directions(); passed++;
        test_draw_points(); passed++;
        test_draw_circle(); passed++;
        test_draw_arc(); passed++;
        test_invalid_geometry_propagates(); passed++;
        test_shared_cache_between_renderers(); passed++;
        test_dispose(); passed++;
        test_second_dispose_warns(); passed++;
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        failed++;
    }

    std::cout << "\n==============================================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << "==============================================\n";

    return failed > 0 ? 1 : 0;
}
