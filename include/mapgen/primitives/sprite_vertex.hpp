#pragma once

#include "mapgen/primitives/quad_batch.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace mapgen {

/// Vertex layout shared by the quad expansion and the sprite pipeline
struct SpriteVertex {
    glm::vec3 position;   // window pixels, z = layer depth
    glm::vec2 texCoord;
    glm::vec4 color;
};

/// Two triangles per quad, no index buffer
constexpr uint32_t kVerticesPerQuad = 6;

/**
 * @brief Append the six vertices of one quad
 *
 * The source rectangle (whole texture when absent) is placed so that
 * @c quad.origin lands on @c quad.position, then scaled and rotated about
 * that point. Flip effects swap texture coordinates, not positions.
 *
 * @throws std::invalid_argument if either texture dimension is zero
 */
void appendQuadVertices(const QuadDraw& quad, uint32_t textureWidth, uint32_t textureHeight,
                        std::vector<SpriteVertex>& out);

/**
 * @brief Maps window pixels to Vulkan clip space
 *
 * (0, 0) is the top-left pixel corner and (width, height) the bottom-right.
 * Layer depths 0..1 stay inside the clip volume.
 */
glm::mat4 pixelProjection(uint32_t width, uint32_t height);

} // namespace mapgen
