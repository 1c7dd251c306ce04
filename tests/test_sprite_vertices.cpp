/**
 * @file test_sprite_vertices.cpp
 * @brief CPU quad expansion used by the sprite batch
 *
 * This test verifies:
 * - Stretched 1x1 quads (the line case) land on the expected pixels
 * - Rotation pivots about the quad position
 * - Origin, source rectangles and flip effects
 * - Invalid texture sizes are rejected
 * - The pixel projection maps window corners onto clip space corners
 */

#undef NDEBUG
#include <mapgen/primitives/sprite_vertex.hpp>

#include <glm/gtc/constants.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace mapgen;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

bool near(const glm::vec3& p, float x, float y) {
    return near(p.x, x) && near(p.y, y);
}

// Vertex order is TL, TR, BL, TR, BR, BL
const SpriteVertex& topLeft(const std::vector<SpriteVertex>& v) { return v[0]; }
const SpriteVertex& topRight(const std::vector<SpriteVertex>& v) { return v[1]; }
const SpriteVertex& bottomLeft(const std::vector<SpriteVertex>& v) { return v[2]; }
const SpriteVertex& bottomRight(const std::vector<SpriteVertex>& v) { return v[4]; }

} // anonymous namespace

void test_stretched_pixel() {
    std::cout << "Testing: Stretched 1x1 quad covers distance x thickness... ";

    QuadDraw quad;
    quad.position = {10.0f, 20.0f};
    quad.scale = {5.0f, 2.0f};
    quad.color = colors::Red;
    quad.layerDepth = 0.25f;

    std::vector<SpriteVertex> vertices;
    appendQuadVertices(quad, 1, 1, vertices);

    assert(vertices.size() == kVerticesPerQuad);
    assert(near(topLeft(vertices).position, 10.0f, 20.0f));
    assert(near(topRight(vertices).position, 15.0f, 20.0f));
    assert(near(bottomLeft(vertices).position, 10.0f, 22.0f));
    assert(near(bottomRight(vertices).position, 15.0f, 22.0f));

    // Shared corners of the two triangles are identical
    assert(vertices[1].position == vertices[3].position);
    assert(vertices[2].position == vertices[5].position);

    for (const auto& v : vertices) {
        assert(v.color == colors::Red);
        assert(near(v.position.z, 0.25f));
    }
    assert(topLeft(vertices).texCoord == glm::vec2(0.0f, 0.0f));
    assert(bottomRight(vertices).texCoord == glm::vec2(1.0f, 1.0f));

    std::cout << "PASSED\n";
}

void test_rotation_pivots_on_position() {
    std::cout << "Testing: Rotation pivots about the position... ";

    QuadDraw quad;
    quad.position = {50.0f, 50.0f};
    quad.scale = {4.0f, 1.0f};
    quad.rotation = glm::half_pi<float>();

    std::vector<SpriteVertex> vertices;
    appendQuadVertices(quad, 1, 1, vertices);

    // +x maps to +y (downwards on screen), +y maps to -x
    assert(near(topLeft(vertices).position, 50.0f, 50.0f));
    assert(near(topRight(vertices).position, 50.0f, 54.0f));
    assert(near(bottomLeft(vertices).position, 49.0f, 50.0f));
    assert(near(bottomRight(vertices).position, 49.0f, 54.0f));

    std::cout << "PASSED\n";
}

void test_origin_centers_quad() {
    std::cout << "Testing: Origin places the pivot texel on the position... ";

    QuadDraw quad;
    quad.position = {100.0f, 100.0f};
    quad.origin = {5.0f, 5.0f};

    std::vector<SpriteVertex> vertices;
    appendQuadVertices(quad, 10, 10, vertices);

    assert(near(topLeft(vertices).position, 95.0f, 95.0f));
    assert(near(bottomRight(vertices).position, 105.0f, 105.0f));

    std::cout << "PASSED\n";
}

void test_source_rect_and_flips() {
    std::cout << "Testing: Source rectangle and flip effects... ";

    QuadDraw quad;
    quad.sourceRect = Rect{2, 0, 4, 4};

    std::vector<SpriteVertex> plain;
    appendQuadVertices(quad, 8, 4, plain);
    assert(near(topLeft(plain).texCoord.x, 0.25f));
    assert(near(topRight(plain).texCoord.x, 0.75f));
    assert(near(bottomLeft(plain).texCoord.y, 1.0f));
    // Quad size follows the source rectangle, not the texture
    assert(near(bottomRight(plain).position, 4.0f, 4.0f));

    quad.effects = SpriteEffects::FlipHorizontally | SpriteEffects::FlipVertically;
    std::vector<SpriteVertex> flipped;
    appendQuadVertices(quad, 8, 4, flipped);
    assert(near(topLeft(flipped).texCoord.x, 0.75f));
    assert(near(topLeft(flipped).texCoord.y, 1.0f));
    assert(near(bottomRight(flipped).texCoord.x, 0.25f));
    assert(near(bottomRight(flipped).texCoord.y, 0.0f));
    // Positions are unchanged by flips
    assert(topLeft(flipped).position == topLeft(plain).position);

    std::cout << "PASSED\n";
}

void test_appends_and_rejects_empty_texture() {
    std::cout << "Testing: Vertices append; zero-size textures rejected... ";

    QuadDraw quad;
    std::vector<SpriteVertex> vertices;
    appendQuadVertices(quad, 1, 1, vertices);
    appendQuadVertices(quad, 1, 1, vertices);
    assert(vertices.size() == 2 * kVerticesPerQuad);

    bool threw = false;
    try {
        appendQuadVertices(quad, 0, 1, vertices);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(vertices.size() == 2 * kVerticesPerQuad);

    std::cout << "PASSED\n";
}

void test_pixel_projection_corners() {
    std::cout << "Testing: Pixel projection maps window corners to clip corners... ";

    glm::mat4 projection = pixelProjection(800, 480);

    glm::vec4 windowOrigin = projection * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    glm::vec4 windowCorner = projection * glm::vec4(800.0f, 480.0f, 0.0f, 1.0f);
    glm::vec4 center = projection * glm::vec4(400.0f, 240.0f, 0.0f, 1.0f);

    // Vulkan clip space: y = -1 is the top edge
    assert(near(windowOrigin.x, -1.0f) && near(windowOrigin.y, -1.0f));
    assert(near(windowCorner.x, 1.0f) && near(windowCorner.y, 1.0f));
    assert(near(center.x, 0.0f) && near(center.y, 0.0f));
    assert(near(windowOrigin.w, 1.0f));

    for (float depth : {0.0f, 0.5f, 1.0f}) {
        float z = (projection * glm::vec4(0.0f, 0.0f, depth, 1.0f)).z;
        assert(z >= 0.0f && z <= 1.0f);
    }

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "==============================================\n";
    std::cout << "MapGen - Sprite Vertex Tests\n";
    std::cout << "==============================================\n\n";

    int passed = 0;
    int failed = 0;

    try {
        test_stretched_pixel(); passed++;
        test_rotation_pivots_on_position(); passed++;
        test_origin_centers_quad(); passed++;
        test_source_rect_and_flips(); passed++;
        test_appends_and_rejects_empty_texture(); passed++;
        test_pixel_projection_corners(); passed++;
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        failed++;
    }

    std::cout << "\n==============================================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << "==============================================\n";

    return failed > 0 ? 1 : 0;
}
