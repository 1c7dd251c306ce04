#pragma once

#include "mapgen/core/logging.hpp"
#include "mapgen/primitives/geometry.hpp"

#include <cstdint>
#include <string>

namespace mapgen {

/**
 * @brief Startup settings for MapGenApp
 *
 * Defaults match the original harness: an 800x480 back buffer cleared to
 * cornflower blue.
 */
struct AppConfig {
    std::string title = "MapGen";
    uint32_t width = 800;
    uint32_t height = 480;
    bool resizable = true;
    bool vsync = true;
    uint32_t framesInFlight = 2;
    bool enableValidation = validationByDefault();
    Color clearColor = colors::CornflowerBlue;
    float fixedTimestep = 1.0f / 60.0f;
    LogLevel logLevel = LogLevel::Info;

    /**
     * @brief Build a config from command-line flags
     *
     * Recognized: --title <text>, --width <px>, --height <px>, --no-vsync,
     * --validation, --no-validation, --log-level <name>, --frames-in-flight <n>.
     *
     * @throws std::invalid_argument on unknown flags, missing or malformed values
     */
    static AppConfig fromArgs(int argc, const char* const* argv);

    /// One-line summary for logging
    std::string describe() const;

    /// True when the library was built without NDEBUG
    static bool validationByDefault();
};

} // namespace mapgen
