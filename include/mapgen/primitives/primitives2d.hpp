#pragma once

#include "mapgen/primitives/geometry_generator.hpp"
#include "mapgen/primitives/quad_batch.hpp"

namespace mapgen {

/**
 * @brief Draws lines, polylines, circles and arcs through a QuadBatch
 *
 * Every segment is a 1x1 white texture stretched to the segment's length and
 * thickness and rotated to its direction, so a batch needs no line pipeline.
 * The pixel texture is created at construction from the batch's texture
 * provider and owned by this object until dispose() or destruction.
 *
 * Example:
 * @code
 * Primitives2D primitives(&spriteBatch);
 * primitives.drawCircle({400, 240}, 100.0f, 32, colors::White, 2.0f);
 * primitives.drawArc({400, 240}, 60.0f, 32, 0.0f, glm::pi<float>(), colors::Red, 1.0f);
 * @endcode
 */
class Primitives2D {
public:
    /**
     * @brief Bind to a batch using a private circle cache
     * @throws InvalidDependencyError if batch is null, has no texture provider,
     *         or the provider fails to create the pixel texture
     */
    explicit Primitives2D(QuadBatch* batch);

    /// Bind to a batch, sharing a circle cache with other instances
    Primitives2D(QuadBatch* batch, CircleCacheRef cache);

    /// Releases the pixel texture if dispose() was not called
    ~Primitives2D();

    // Non-copyable, non-movable (owns the pixel texture, pinned to one batch)
    Primitives2D(const Primitives2D&) = delete;
    Primitives2D& operator=(const Primitives2D&) = delete;
    Primitives2D(Primitives2D&&) = delete;
    Primitives2D& operator=(Primitives2D&&) = delete;

    /**
     * @brief Draw a segment from point1 to point2
     *
     * Submits exactly one quad: position point1, rotation atan2(dy, dx),
     * origin (0, 0), scale (distance, thickness).
     */
    void drawLine(Point2D point1, Point2D point2, const Color& color, float thickness);

    /// Connect consecutive points, each offset by position. Fewer than two points draws nothing.
    void drawPoints(Point2D position, const PointSequence& points,
                    const Color& color, float thickness);

    /// Draw a circle outline from the cached (radius, sides) outline
    void drawCircle(Point2D center, float radius, int sides,
                    const Color& color, float thickness);

    /// Draw an arc; see GeometryGenerator::createArc() for the angle conventions
    void drawArc(Point2D center, float radius, int sides,
                 float startingAngle, float radians,
                 const Color& color, float thickness);

    /// Release the pixel texture. Calling it again has no effect.
    void dispose();

    /// Check whether dispose() has run
    bool isDisposed() const { return pixel_ == nullptr; }

    /// The 1x1 texture used for every segment (null after dispose)
    const SpriteTexture* pixel() const { return pixel_.get(); }

    GeometryGenerator& geometry() { return geometry_; }

private:
    void ensureNotDisposed(const char* operation) const;

    QuadBatch* batch_ = nullptr;
    SpriteTexturePtr pixel_;
    GeometryGenerator geometry_;
};

} // namespace mapgen
