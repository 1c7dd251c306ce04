#include "mapgen/primitives/geometry_generator.hpp"
#include "mapgen/core/errors.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <string>

namespace mapgen {

GeometryGenerator::GeometryGenerator()
    : cache_(std::make_shared<CircleCache>()) {
}

GeometryGenerator::GeometryGenerator(CircleCacheRef cache)
    : cache_(std::move(cache)) {
    if (!cache_) {
        throw InvalidDependencyError("GeometryGenerator: cache cannot be null");
    }
}

PointSequence GeometryGenerator::generateCircle(double radius, int sides) {
    if (sides < 1) {
        throw InvalidGeometryError("Circle needs at least one side, got " +
                                   std::to_string(sides));
    }
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw InvalidGeometryError("Circle radius must be finite and positive, got " +
                                   std::to_string(radius));
    }

    const double step = glm::two_pi<double>() / sides;

    PointSequence points;
    points.reserve(static_cast<size_t>(sides) + 1);

    // Angle derived from the index so the count never drifts
    for (int i = 0; i < sides; i++) {
        double theta = step * i;
        points.emplace_back(static_cast<float>(radius * std::cos(theta)),
                            static_cast<float>(radius * std::sin(theta)));
    }

    // Close the loop
    points.push_back(points.front());
    return points;
}

PointSequenceRef GeometryGenerator::createCircle(double radius, int sides) {
    return cache_->getOrCreate(radius, sides);
}

PointSequence GeometryGenerator::createArc(double radius, int sides,
                                           double startingAngle, double radians) {
    if (!std::isfinite(startingAngle) || !std::isfinite(radians)) {
        throw InvalidGeometryError("Arc angles must be finite");
    }

    PointSequenceRef circle = createCircle(radius, sides);

    // Ring of `sides` points, closing duplicate excluded
    const size_t ringSize = circle->size() - 1;
    const double anglePerSide = glm::two_pi<double>() / sides;
    const double halfSide = anglePerSide / 2.0;

    // Advance to the first side boundary whose midpoint reaches startingAngle
    size_t offset = 0;
    if (startingAngle > halfSide) {
        double steps = std::ceil((startingAngle - halfSide) / anglePerSide);
        offset = static_cast<size_t>(std::fmod(steps, static_cast<double>(ringSize)));
    }

    double span = std::trunc(radians / anglePerSide + 0.5);
    if (span < 0.0 || span > static_cast<double>(sides)) {
        throw InvalidGeometryError("Arc of " + std::to_string(radians) +
                                   " radians does not fit a circle of " +
                                   std::to_string(sides) + " sides");
    }

    const int sidesInArc = static_cast<int>(span);

    PointSequence arc;
    arc.reserve(static_cast<size_t>(sidesInArc) + 1);
    for (int i = 0; i <= sidesInArc; i++) {
        arc.push_back((*circle)[(offset + static_cast<size_t>(i)) % ringSize]);
    }

    return arc;
}

} // namespace mapgen
