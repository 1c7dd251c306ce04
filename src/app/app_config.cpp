#include "mapgen/app/app_config.hpp"

#include <stdexcept>
#include <string_view>

namespace mapgen {

namespace {

uint32_t parseDimension(std::string_view flag, const std::string& value,
                        uint32_t minValue, uint32_t maxValue) {
    size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(flag) + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || value.front() == '-' ||
        parsed < minValue || parsed > maxValue) {
        throw std::invalid_argument(std::string(flag) + " must be in [" +
                                    std::to_string(minValue) + ", " +
                                    std::to_string(maxValue) + "], got '" + value + "'");
    }
    return static_cast<uint32_t>(parsed);
}

} // anonymous namespace

bool AppConfig::validationByDefault() {
#ifdef NDEBUG
    return false;
#else
    return true;
#endif
}

AppConfig AppConfig::fromArgs(int argc, const char* const* argv) {
    AppConfig config;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string(arg) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--title") {
            config.title = nextValue();
        } else if (arg == "--width") {
            config.width = parseDimension(arg, nextValue(), 1, 16384);
        } else if (arg == "--height") {
            config.height = parseDimension(arg, nextValue(), 1, 16384);
        } else if (arg == "--frames-in-flight") {
            config.framesInFlight = parseDimension(arg, nextValue(), 1, 4);
        } else if (arg == "--no-vsync") {
            config.vsync = false;
        } else if (arg == "--validation") {
            config.enableValidation = true;
        } else if (arg == "--no-validation") {
            config.enableValidation = false;
        } else if (arg == "--log-level") {
            config.logLevel = Logger::parseLevel(nextValue());
        } else {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        }
    }

    return config;
}

std::string AppConfig::describe() const {
    return "'" + title + "' " + std::to_string(width) + "x" + std::to_string(height) +
           (vsync ? " vsync" : " no-vsync") +
           (enableValidation ? " validation" : "") +
           " frames-in-flight=" + std::to_string(framesInFlight) +
           " log=" + Logger::levelToString(logLevel);
}

} // namespace mapgen
