#pragma once

#include "mapgen/primitives/geometry.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace mapgen {

/// Mirroring applied to a quad's texture coordinates
enum class SpriteEffects : uint32_t {
    None = 0,
    FlipHorizontally = 1,
    FlipVertically = 2
};

inline SpriteEffects operator|(SpriteEffects a, SpriteEffects b) {
    return static_cast<SpriteEffects>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool hasEffect(SpriteEffects effects, SpriteEffects flag) {
    return (static_cast<uint32_t>(effects) & static_cast<uint32_t>(flag)) != 0;
}

/**
 * @brief A texture a QuadBatch can draw
 *
 * Ownership stays with whoever created it; batches only hold raw pointers
 * for the duration of a frame.
 */
class SpriteTexture {
public:
    virtual ~SpriteTexture() = default;

    virtual uint32_t width() const = 0;
    virtual uint32_t height() const = 0;
};

using SpriteTexturePtr = std::unique_ptr<SpriteTexture>;

/// Creates textures on the device a batch draws with
class TextureProvider {
public:
    virtual ~TextureProvider() = default;

    /**
     * @brief Create a width x height texture filled with one color
     *
     * The returned handle owns the device resource; destroying it releases it.
     */
    virtual SpriteTexturePtr createSolidColor(uint32_t width, uint32_t height,
                                              const Color& color) = 0;
};

/// One textured quad submission
struct QuadDraw {
    const SpriteTexture* texture = nullptr;
    Point2D position{0.0f, 0.0f};
    std::optional<Rect> sourceRect;     // nullopt = whole texture
    Color color = colors::White;
    float rotation = 0.0f;              // radians about origin
    Point2D origin{0.0f, 0.0f};         // pivot in source texels
    Point2D scale{1.0f, 1.0f};
    SpriteEffects effects = SpriteEffects::None;
    float layerDepth = 0.0f;
};

/**
 * @brief Sink for batched quad submissions
 *
 * Implementations append each draw to the current frame's batch. A batch
 * also exposes the texture provider of the device it renders with so that
 * helpers built on top of it can create their own textures.
 */
class QuadBatch {
public:
    virtual ~QuadBatch() = default;

    virtual void draw(const QuadDraw& quad) = 0;

    /// Provider for textures usable with this batch (may be null if unbound)
    virtual TextureProvider* textureProvider() = 0;
};

} // namespace mapgen
