#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace mapgen {

// Log levels
enum class LogLevel {
    Trace,      // Very verbose debugging
    Debug,      // Debug information
    Info,       // Informational messages
    Warning,    // Potential problems
    Error,      // Errors that allow recovery
    Fatal       // Unrecoverable errors
};

// Log categories
enum class LogCategory {
    Core,       // Library core systems
    Vulkan,     // Vulkan API calls and validation messages
    Resource,   // Textures, buffers, shaders
    Render,     // Frame and batch submission
    Geometry,   // Circle/arc generation and the circle cache
    Game        // Application lifecycle
};

/**
 * @brief Process-wide logger
 *
 * Messages at Warning and above go to stderr, everything else to stdout.
 * Output is flushed per message so interleaving with validation output
 * stays readable.
 */
class Logger {
public:
    static Logger& global();

    /// Messages below @p level are dropped before formatting
    void setMinLevel(LogLevel level) { minLevel_ = level; }

    /// Receives every message that passes the level filter, after the console
    using Sink = std::function<void(LogLevel, LogCategory, std::string_view)>;

    /// Install an extra sink; an empty Sink removes it
    void setSink(Sink sink) { sink_ = std::move(sink); }

    /// Usually reached through the MAPGEN_* macros, which add file and line
    void log(LogLevel level, LogCategory category, std::string_view message,
             const char* file = nullptr, int line = 0);

    /// Parse "trace", "debug", "info", "warning", "error" or "fatal"
    /// @throws std::invalid_argument for any other name
    static LogLevel parseLevel(std::string_view name);

    static const char* levelToString(LogLevel level);
    static const char* categoryToString(LogCategory category);

private:
    Logger() = default;
    LogLevel minLevel_ = LogLevel::Info;
    Sink sink_;
};

// Logging macros with file/line info
#define MAPGEN_LOG(level, category, msg) \
    mapgen::Logger::global().log(level, category, msg, __FILE__, __LINE__)

#define MAPGEN_TRACE(category, msg)   MAPGEN_LOG(mapgen::LogLevel::Trace, category, msg)
#define MAPGEN_DEBUG(category, msg)   MAPGEN_LOG(mapgen::LogLevel::Debug, category, msg)
#define MAPGEN_INFO(category, msg)    MAPGEN_LOG(mapgen::LogLevel::Info, category, msg)
#define MAPGEN_WARN(category, msg)    MAPGEN_LOG(mapgen::LogLevel::Warning, category, msg)
#define MAPGEN_ERROR(category, msg)   MAPGEN_LOG(mapgen::LogLevel::Error, category, msg)
#define MAPGEN_FATAL(category, msg)   MAPGEN_LOG(mapgen::LogLevel::Fatal, category, msg)

} // namespace mapgen
