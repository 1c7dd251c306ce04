#pragma once

#include <stdexcept>
#include <string>

namespace mapgen {

/// Geometry parameters out of range (sides < 1, bad radius, arc overrun)
class InvalidGeometryError : public std::invalid_argument {
public:
    explicit InvalidGeometryError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A required collaborator was null or unusable at construction time
class InvalidDependencyError : public std::invalid_argument {
public:
    explicit InvalidDependencyError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Use of a resource after dispose()
class DisposedResourceError : public std::logic_error {
public:
    explicit DisposedResourceError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace mapgen
