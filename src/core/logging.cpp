#include "mapgen/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace mapgen {

Logger& Logger::global() {
    static Logger instance;
    return instance;
}

void Logger::log(LogLevel level, LogCategory category, std::string_view message,
                 const char* file, int line) {
    if (level < minLevel_) {
        return;
    }

    using Clock = std::chrono::system_clock;
    Clock::time_point now = Clock::now();
    std::time_t seconds = Clock::to_time_t(now);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    char clock[16];
    std::strftime(clock, sizeof(clock), "%H:%M:%S", std::localtime(&seconds));

    // 12:04:31.207 WARNING Render   message  [file:line]
    FILE* out = level >= LogLevel::Warning ? stderr : stdout;
    std::fprintf(out, "%s.%03ld %-7s %-8s %.*s", clock, millis,
                 levelToString(level), categoryToString(category),
                 static_cast<int>(message.size()), message.data());
    if (file && line > 0) {
        std::fprintf(out, "  [%s:%d]", file, line);
    }
    std::fputc('\n', out);
    std::fflush(out);

    if (sink_) {
        sink_(level, category, message);
    }
}

LogLevel Logger::parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")   return LogLevel::Trace;
    if (lower == "debug")   return LogLevel::Debug;
    if (lower == "info")    return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error")   return LogLevel::Error;
    if (lower == "fatal")   return LogLevel::Fatal;

    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* Logger::categoryToString(LogCategory category) {
    switch (category) {
        case LogCategory::Core:     return "Core";
        case LogCategory::Vulkan:   return "Vulkan";
        case LogCategory::Resource: return "Resource";
        case LogCategory::Render:   return "Render";
        case LogCategory::Geometry: return "Geometry";
        case LogCategory::Game:     return "Game";
    }
    return "Unknown";
}

} // namespace mapgen
