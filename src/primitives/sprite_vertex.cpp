#include "mapgen/primitives/sprite_vertex.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace mapgen {

void appendQuadVertices(const QuadDraw& quad, uint32_t textureWidth, uint32_t textureHeight,
                        std::vector<SpriteVertex>& out) {
    if (textureWidth == 0 || textureHeight == 0) {
        throw std::invalid_argument("Quad texture has zero size");
    }

    Rect source = quad.sourceRect.value_or(
        Rect{0, 0, static_cast<int32_t>(textureWidth), static_cast<int32_t>(textureHeight)});

    float texW = static_cast<float>(textureWidth);
    float texH = static_cast<float>(textureHeight);
    float u0 = static_cast<float>(source.x) / texW;
    float v0 = static_cast<float>(source.y) / texH;
    float u1 = static_cast<float>(source.x + source.width) / texW;
    float v1 = static_cast<float>(source.y + source.height) / texH;

    if (hasEffect(quad.effects, SpriteEffects::FlipHorizontally)) {
        std::swap(u0, u1);
    }
    if (hasEffect(quad.effects, SpriteEffects::FlipVertically)) {
        std::swap(v0, v1);
    }

    float w = static_cast<float>(source.width);
    float h = static_cast<float>(source.height);
    float c = std::cos(quad.rotation);
    float s = std::sin(quad.rotation);

    auto corner = [&](float x, float y, float u, float v) {
        glm::vec2 local = (glm::vec2(x, y) - quad.origin) * quad.scale;
        glm::vec2 rotated(local.x * c - local.y * s, local.x * s + local.y * c);
        glm::vec2 p = quad.position + rotated;
        return SpriteVertex{glm::vec3(p, quad.layerDepth), glm::vec2(u, v), quad.color};
    };

    SpriteVertex topLeft = corner(0.0f, 0.0f, u0, v0);
    SpriteVertex topRight = corner(w, 0.0f, u1, v0);
    SpriteVertex bottomLeft = corner(0.0f, h, u0, v1);
    SpriteVertex bottomRight = corner(w, h, u1, v1);

    out.push_back(topLeft);
    out.push_back(topRight);
    out.push_back(bottomLeft);
    out.push_back(topRight);
    out.push_back(bottomRight);
    out.push_back(bottomLeft);
}

glm::mat4 pixelProjection(uint32_t width, uint32_t height) {
    // Vulkan clip space already points y down, so no flip is needed
    return glm::ortho(0.0f, static_cast<float>(width),
                      0.0f, static_cast<float>(height),
                      -1.0f, 1.0f);
}

} // namespace mapgen
