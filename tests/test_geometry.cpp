/**
 * @file test_geometry.cpp
 * @brief Circle/arc generation and the circle cache
 *
 * This test verifies:
 * - Circle point count, closure and radius
 * - Arc start rotation, span and rejection of bad spans
 * - Cache identity per key and thread-safe population
 */

#undef NDEBUG
#include <mapgen/primitives/geometry_generator.hpp>
#include <mapgen/core/errors.hpp>

#include <glm/gtc/constants.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

using namespace mapgen;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

bool near(Point2D a, Point2D b, float eps = 1e-4f) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps);
}

template <typename Fn>
bool throwsGeometryError(Fn&& fn) {
    try {
        fn();
    } catch (const InvalidGeometryError&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_circle_point_count() {
    std::cout << "Testing: Circle point count and closure... ";

    for (int sides : {1, 3, 4, 16, 100}) {
        PointSequence circle = GeometryGenerator::generateCircle(10.0, sides);
        assert(circle.size() == static_cast<size_t>(sides) + 1);
        assert(circle.front() == circle.back());
    }

    std::cout << "PASSED\n";
}

void test_circle_points_on_radius() {
    std::cout << "Testing: Circle points lie on the radius... ";

    PointSequence circle = GeometryGenerator::generateCircle(25.0, 37);
    for (const auto& p : circle) {
        assert(near(glm::length(p), 25.0f, 1e-3f));
    }

    PointSequence square = GeometryGenerator::generateCircle(10.0, 4);
    assert(near(square[0], Point2D(10.0f, 0.0f)));
    assert(near(square[1], Point2D(0.0f, 10.0f)));
    assert(near(square[2], Point2D(-10.0f, 0.0f)));
    assert(near(square[3], Point2D(0.0f, -10.0f)));

    std::cout << "PASSED\n";
}

void test_circle_rejects_bad_parameters() {
    std::cout << "Testing: Circle rejects bad parameters... ";

    assert(throwsGeometryError([] { GeometryGenerator::generateCircle(10.0, 0); }));
    assert(throwsGeometryError([] { GeometryGenerator::generateCircle(10.0, -3); }));
    assert(throwsGeometryError([] { GeometryGenerator::generateCircle(0.0, 8); }));
    assert(throwsGeometryError([] { GeometryGenerator::generateCircle(-1.0, 8); }));
    assert(throwsGeometryError([] { GeometryGenerator::generateCircle(std::nan(""), 8); }));
    assert(throwsGeometryError([] { GeometryGenerator::generateCircle(INFINITY, 8); }));

    std::cout << "PASSED\n";
}

void test_cache_identity() {
    std::cout << "Testing: Cache returns one instance per key... ";

    GeometryGenerator generator;
    auto a = generator.createCircle(10.0, 16);
    auto b = generator.createCircle(10.0, 16);
    assert(a.get() == b.get());
    assert(generator.cache()->size() == 1);

    auto c = generator.createCircle(10.0, 17);
    auto d = generator.createCircle(10.5, 16);
    assert(c.get() != a.get());
    assert(d.get() != a.get());
    assert(c->size() == 18);
    assert(generator.cache()->size() == 3);
    assert(generator.cache()->contains(10.5, 16));
    assert(!generator.cache()->contains(11.0, 16));

    std::cout << "PASSED\n";
}

void test_cache_rejected_key_not_stored() {
    std::cout << "Testing: Rejected circle is not cached... ";

    CircleCache cache;
    assert(throwsGeometryError([&] { cache.getOrCreate(5.0, 0); }));
    assert(cache.size() == 0);

    std::cout << "PASSED\n";
}

void test_cache_shared_between_generators() {
    std::cout << "Testing: Generators share an injected cache... ";

    auto cache = std::make_shared<CircleCache>();
    GeometryGenerator first(cache);
    GeometryGenerator second(cache);

    auto a = first.createCircle(42.0, 12);
    auto b = second.createCircle(42.0, 12);
    assert(a.get() == b.get());
    assert(cache->size() == 1);

    std::cout << "PASSED\n";
}

void test_cache_concurrent_population() {
    std::cout << "Testing: Concurrent requests share one entry... ";

    CircleCache cache;
    std::vector<PointSequenceRef> results(8);
    std::vector<std::thread> threads;

    for (size_t i = 0; i < results.size(); i++) {
        threads.emplace_back([&cache, &results, i] {
            results[i] = cache.getOrCreate(64.0, 256);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& r : results) {
        assert(r.get() == results[0].get());
    }
    assert(cache.size() == 1);

    std::cout << "PASSED\n";
}

void test_arc_full_sweep() {
    std::cout << "Testing: Full-sweep arc closes on itself... ";

    GeometryGenerator generator;
    PointSequence arc = generator.createArc(10.0, 8, 0.0, glm::two_pi<double>());
    assert(arc.size() == 9);
    assert(arc.front() == arc.back());

    auto circle = generator.createCircle(10.0, 8);
    for (size_t i = 0; i < arc.size(); i++) {
        assert(arc[i] == (*circle)[i]);
    }

    std::cout << "PASSED\n";
}

void test_arc_single_side() {
    std::cout << "Testing: One-side arc has two points... ";

    GeometryGenerator generator;
    const double anglePerSide = glm::two_pi<double>() / 6;
    PointSequence arc = generator.createArc(10.0, 6, 0.0, anglePerSide);
    assert(arc.size() == 2);
    assert(near(arc[0], Point2D(10.0f, 0.0f)));

    // A span rounding to zero sides collapses to the start point
    PointSequence empty = generator.createArc(10.0, 6, 0.0, anglePerSide * 0.4);
    assert(empty.size() == 1);

    std::cout << "PASSED\n";
}

void test_arc_starting_angle() {
    std::cout << "Testing: Arc starts at the nearest side boundary... ";

    GeometryGenerator generator;
    const double quarter = glm::half_pi<double>();

    // Exactly on a boundary
    PointSequence arc = generator.createArc(10.0, 4, quarter, quarter);
    assert(arc.size() == 2);
    assert(near(arc[0], Point2D(0.0f, 10.0f)));
    assert(near(arc[1], Point2D(-10.0f, 0.0f)));

    // Just short of the midpoint between 0 and 90 degrees stays at 0
    PointSequence early = generator.createArc(10.0, 4, quarter * 0.49, quarter);
    assert(near(early[0], Point2D(10.0f, 0.0f)));

    // Just past the midpoint moves to 90 degrees
    PointSequence late = generator.createArc(10.0, 4, quarter * 0.51, quarter);
    assert(near(late[0], Point2D(0.0f, 10.0f)));

    // Negative start angles begin at 0
    PointSequence negative = generator.createArc(10.0, 4, -1.0, quarter);
    assert(near(negative[0], Point2D(10.0f, 0.0f)));

    std::cout << "PASSED\n";
}

void test_arc_wraps_around_ring() {
    std::cout << "Testing: Arc wraps past the ring end... ";

    GeometryGenerator generator;
    const double quarter = glm::half_pi<double>();

    // Start at 270 degrees, sweep 180 degrees: 270 -> 0 -> 90
    PointSequence arc = generator.createArc(10.0, 4, 3.0 * quarter, 2.0 * quarter);
    assert(arc.size() == 3);
    assert(near(arc[0], Point2D(0.0f, -10.0f)));
    assert(near(arc[1], Point2D(10.0f, 0.0f)));
    assert(near(arc[2], Point2D(0.0f, 10.0f)));

    // Start angles beyond a full turn wrap modulo the ring
    PointSequence wrapped = generator.createArc(10.0, 4, glm::two_pi<double>() + quarter, quarter);
    assert(near(wrapped[0], Point2D(0.0f, 10.0f)));

    std::cout << "PASSED\n";
}

void test_arc_rejects_overrun() {
    std::cout << "Testing: Arc rejects spans outside the circle... ";

    GeometryGenerator generator;
    const double pi = glm::pi<double>();

    assert(throwsGeometryError([&] { generator.createArc(10.0, 4, 0.0, 3.0 * pi); }));
    assert(throwsGeometryError([&] { generator.createArc(10.0, 4, 0.0, -pi); }));
    assert(throwsGeometryError([&] { generator.createArc(10.0, 4, std::nan(""), pi); }));
    assert(throwsGeometryError([&] { generator.createArc(10.0, 0, 0.0, pi); }));

    std::cout << "PASSED\n";
}

void test_arc_does_not_touch_cache_entry() {
    std::cout << "Testing: Arc leaves the cached circle intact... ";

    GeometryGenerator generator;
    auto before = *generator.createCircle(10.0, 8);
    generator.createArc(10.0, 8, 1.0, 2.0);
    auto after = generator.createCircle(10.0, 8);
    assert(before == *after);
    assert(generator.cache()->size() == 1);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "==============================================\n";
    std::cout << "MapGen - Geometry Tests\n";
    std::cout << "==============================================\n\n";

    int passed = 0;
    int failed = 0;

    try {
        test_circle_point_count(); passed++;
        test_circle_points_on_radius(); passed++;
        test_circle_rejects_bad_parameters(); passed++;

        test_cache_identity(); passed++;
        test_cache_rejected_key_not_stored(); passed++;
        test_cache_shared_between_generators(); passed++;
        test_cache_concurrent_population(); passed++;

        test_arc_full_sweep(); passed++;
        test_arc_single_side(); passed++;
        test_arc_starting_angle(); passed++;
        test_arc_wraps_around_ring(); passed++;
        test_arc_rejects_overrun(); passed++;
        test_arc_does_not_touch_cache_entry(); passed++;
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        failed++;
    }

    std::cout << "\n==============================================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << "==============================================\n";

    return failed > 0 ? 1 : 0;
}
