#include "mapgen/primitives/circle_cache.hpp"
#include "mapgen/primitives/geometry_generator.hpp"
#include "mapgen/core/logging.hpp"

#include <functional>

namespace mapgen {

size_t CircleKeyHash::operator()(const CircleKey& key) const noexcept {
    size_t seed = std::hash<double>{}(key.radius);
    // boost::hash_combine mixing
    seed ^= std::hash<int>{}(key.sides) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

PointSequenceRef CircleCache::getOrCreate(double radius, int sides) {
    std::lock_guard<std::mutex> lock(mutex_);

    CircleKey key{radius, sides};
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }

    auto points = std::make_shared<const PointSequence>(
        GeometryGenerator::generateCircle(radius, sides));
    entries_.emplace(key, points);

    MAPGEN_TRACE(LogCategory::Geometry,
        "Cached circle r=" + std::to_string(radius) +
        " sides=" + std::to_string(sides) +
        " (" + std::to_string(entries_.size()) + " entries)");

    return points;
}

bool CircleCache::contains(double radius, int sides) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(CircleKey{radius, sides}) != entries_.end();
}

size_t CircleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace mapgen
