#pragma once

#include "mapgen/primitives/circle_cache.hpp"

namespace mapgen {

/**
 * @brief Produces point sequences approximating circles and arcs
 *
 * Circles are centered on the origin and start at (radius, 0), with angle
 * increasing towards +y. Because the y axis points down in window space this
 * walks clockwise on screen. Circle requests go through a CircleCache;
 * arcs are derived from the cached circle and returned as fresh sequences.
 */
class GeometryGenerator {
public:
    /// Use a private cache
    GeometryGenerator();

    /// Share an existing cache (must not be null)
    explicit GeometryGenerator(CircleCacheRef cache);

    /**
     * @brief Generate an uncached circle outline
     *
     * Returns sides + 1 points; the last point repeats the first.
     *
     * @throws InvalidGeometryError if sides < 1 or radius is not a finite positive value
     */
    static PointSequence generateCircle(double radius, int sides);

    /**
     * @brief Get the cached circle outline for (radius, sides)
     * @throws InvalidGeometryError as generateCircle()
     */
    PointSequenceRef createCircle(double radius, int sides);

    /**
     * @brief Cut an arc out of the circle for (radius, sides)
     *
     * The arc begins at the circle point nearest to startingAngle and spans
     * round(radians / anglePerSide) sides, so the result holds that many
     * sides plus one points. A full sweep ends on its starting point.
     *
     * @param startingAngle Start angle in radians, 0 being +x
     * @param radians Angle to cover, in the direction of increasing angle
     * @throws InvalidGeometryError if the span is negative or exceeds the circle
     */
    PointSequence createArc(double radius, int sides, double startingAngle, double radians);

    /// Cache used for circle requests
    const CircleCacheRef& cache() const { return cache_; }

private:
    CircleCacheRef cache_;
};

} // namespace mapgen
