#pragma once

#include "mapgen/primitives/geometry.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace mapgen {

/// Exact (radius, sides) pair identifying one circle outline
struct CircleKey {
    double radius = 0.0;
    int sides = 0;

    bool operator==(const CircleKey& other) const {
        return radius == other.radius && sides == other.sides;
    }
};

struct CircleKeyHash {
    size_t operator()(const CircleKey& key) const noexcept;
};

/// Shared, immutable point sequence handed out by the cache
using PointSequenceRef = std::shared_ptr<const PointSequence>;

/**
 * @brief Memoizes circle outlines keyed by exact (radius, sides)
 *
 * Entries are created on first request and never evicted. Each distinct key
 * maps to exactly one sequence instance for the lifetime of the cache, so
 * repeated requests return the same pointer. Lookup and insertion happen
 * under one lock, which makes a cache safe to share between renderers.
 *
 * Example:
 * @code
 * auto cache = std::make_shared<CircleCache>();
 * auto a = cache->getOrCreate(10.0, 16);
 * auto b = cache->getOrCreate(10.0, 16);
 * // a.get() == b.get()
 * @endcode
 */
class CircleCache {
public:
    CircleCache() = default;

    // Non-copyable (owns a mutex)
    CircleCache(const CircleCache&) = delete;
    CircleCache& operator=(const CircleCache&) = delete;

    /**
     * @brief Get the cached outline for (radius, sides), generating it if absent
     * @throws InvalidGeometryError if the parameters are rejected by the generator
     */
    PointSequenceRef getOrCreate(double radius, int sides);

    /// Check whether an exact key is cached
    bool contains(double radius, int sides) const;

    /// Number of distinct cached outlines
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<CircleKey, PointSequenceRef, CircleKeyHash> entries_;
};

using CircleCacheRef = std::shared_ptr<CircleCache>;

} // namespace mapgen
