#include "mapgen/primitives/primitives2d.hpp"
#include "mapgen/core/errors.hpp"
#include "mapgen/core/logging.hpp"

#include <cmath>
#include <string>

namespace mapgen {

namespace {

CircleCacheRef requireCache(CircleCacheRef cache) {
    if (!cache) {
        throw InvalidDependencyError("Primitives2D: cache cannot be null");
    }
    return cache;
}

} // anonymous namespace

Primitives2D::Primitives2D(QuadBatch* batch)
    : Primitives2D(batch, std::make_shared<CircleCache>()) {
}

Primitives2D::Primitives2D(QuadBatch* batch, CircleCacheRef cache)
    : batch_(batch)
    , geometry_(requireCache(std::move(cache))) {
    if (!batch_) {
        throw InvalidDependencyError("Primitives2D: batch cannot be null");
    }

    TextureProvider* provider = batch_->textureProvider();
    if (!provider) {
        throw InvalidDependencyError("Primitives2D: batch has no texture provider");
    }

    pixel_ = provider->createSolidColor(1, 1, colors::White);
    if (!pixel_) {
        throw InvalidDependencyError("Primitives2D: failed to create pixel texture");
    }

    MAPGEN_DEBUG(LogCategory::Render, "Primitives2D created");
}

Primitives2D::~Primitives2D() {
    if (pixel_) {
        dispose();
    }
}

void Primitives2D::dispose() {
    if (!pixel_) {
        MAPGEN_WARN(LogCategory::Render, "Primitives2D::dispose() called twice, ignoring");
        return;
    }

    pixel_.reset();
    MAPGEN_DEBUG(LogCategory::Render, "Primitives2D disposed");
}

void Primitives2D::ensureNotDisposed(const char* operation) const {
    if (!pixel_) {
        throw DisposedResourceError(std::string("Primitives2D::") + operation +
                                    " called after dispose()");
    }
}

// =============================================================================
// Drawing
// =============================================================================

void Primitives2D::drawLine(Point2D point1, Point2D point2, const Color& color,
                            float thickness) {
    ensureNotDisposed("drawLine");

    float distance = glm::distance(point1, point2);
    float angle = std::atan2(point2.y - point1.y, point2.x - point1.x);

    QuadDraw quad;
    quad.texture = pixel_.get();
    quad.position = point1;
    quad.sourceRect = std::nullopt;
    quad.color = color;
    quad.rotation = angle;
    quad.origin = Point2D(0.0f, 0.0f);
    quad.scale = Point2D(distance, thickness);
    quad.effects = SpriteEffects::None;
    quad.layerDepth = 0.0f;

    batch_->draw(quad);
}

void Primitives2D::drawPoints(Point2D position, const PointSequence& points,
                              const Color& color, float thickness) {
    ensureNotDisposed("drawPoints");

    if (points.size() < 2) {
        return;
    }

    for (size_t i = 1; i < points.size(); i++) {
        drawLine(points[i - 1] + position, points[i] + position, color, thickness);
    }
}

void Primitives2D::drawCircle(Point2D center, float radius, int sides,
                              const Color& color, float thickness) {
    ensureNotDisposed("drawCircle");

    PointSequenceRef circle = geometry_.createCircle(radius, sides);
    drawPoints(center, *circle, color, thickness);
}

void Primitives2D::drawArc(Point2D center, float radius, int sides,
                           float startingAngle, float radians,
                           const Color& color, float thickness) {
    ensureNotDisposed("drawArc");

    PointSequence arc = geometry_.createArc(radius, sides, startingAngle, radians);
    drawPoints(center, arc, color, thickness);
}

} // namespace mapgen
