#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace mapgen {

/// 2D coordinate in window pixels (x right, y down)
using Point2D = glm::vec2;

/// Ordered list of points; a closed outline repeats its first point at the end
using PointSequence = std::vector<Point2D>;

/// Linear RGBA tint, components in [0, 1]
using Color = glm::vec4;

/// Named colors used by the application and tests
namespace colors {
    inline const Color White{1.0f, 1.0f, 1.0f, 1.0f};
    inline const Color Red{1.0f, 0.0f, 0.0f, 1.0f};
    inline const Color Yellow{1.0f, 1.0f, 0.0f, 1.0f};
    inline const Color DarkGreen{0.0f, 100.0f / 255.0f, 0.0f, 1.0f};
    inline const Color CornflowerBlue{100.0f / 255.0f, 149.0f / 255.0f, 237.0f / 255.0f, 1.0f};
} // namespace colors

/// Pack a color into R8G8B8A8 bytes, clamping each channel
inline uint32_t packRGBA8(const Color& color) {
    glm::vec4 c = glm::clamp(color, 0.0f, 1.0f) * 255.0f + 0.5f;
    return static_cast<uint32_t>(c.r)
         | (static_cast<uint32_t>(c.g) << 8)
         | (static_cast<uint32_t>(c.b) << 16)
         | (static_cast<uint32_t>(c.a) << 24);
}

/// Integer rectangle in texel coordinates
struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

} // namespace mapgen
