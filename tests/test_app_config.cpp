/**
 * @file test_app_config.cpp
 * @brief Command-line configuration and log level parsing
 */

#undef NDEBUG
#include <mapgen/app/app_config.hpp>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace mapgen;

namespace {

AppConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "map_gen");
    return AppConfig::fromArgs(static_cast<int>(args.size()), args.data());
}

bool rejects(std::vector<const char*> args) {
    try {
        parse(std::move(args));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_defaults() {
    std::cout << "Testing: Default configuration... ";

    AppConfig config = parse({});
    assert(config.title == "MapGen");
    assert(config.width == 800);
    assert(config.height == 480);
    assert(config.vsync);
    assert(config.framesInFlight == 2);
    assert(config.clearColor == colors::CornflowerBlue);
    assert(config.logLevel == LogLevel::Info);
    assert(config.enableValidation == AppConfig::validationByDefault());

    std::cout << "PASSED\n";
}

void test_flags() {
    std::cout << "Testing: Flags override defaults... ";

    AppConfig config = parse({"--title", "Map Test", "--width", "1024", "--height", "768",
                              "--no-vsync", "--no-validation", "--log-level", "DEBUG",
                              "--frames-in-flight", "3"});
    assert(config.title == "Map Test");
    assert(config.width == 1024);
    assert(config.height == 768);
    assert(!config.vsync);
    assert(!config.enableValidation);
    assert(config.logLevel == LogLevel::Debug);
    assert(config.framesInFlight == 3);
    assert(!config.describe().empty());

    std::cout << "PASSED\n";
}

void test_rejects_bad_input() {
    std::cout << "Testing: Malformed options rejected... ";

    assert(rejects({"--bogus"}));
    assert(rejects({"--width"}));
    assert(rejects({"--width", "abc"}));
    assert(rejects({"--width", "12px"}));
    assert(rejects({"--width", "0"}));
    assert(rejects({"--height", "-5"}));
    assert(rejects({"--frames-in-flight", "9"}));
    assert(rejects({"--log-level", "loud"}));

    std::cout << "PASSED\n";
}

void test_log_level_names() {
    std::cout << "Testing: Log level names... ";

    assert(Logger::parseLevel("trace") == LogLevel::Trace);
    assert(Logger::parseLevel("Warning") == LogLevel::Warning);
    assert(Logger::parseLevel("warn") == LogLevel::Warning);
    assert(Logger::parseLevel("fatal") == LogLevel::Fatal);
    assert(std::string(Logger::levelToString(LogLevel::Error)) == "ERROR");
    assert(std::string(Logger::categoryToString(LogCategory::Geometry)) == "Geometry");

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "==============================================\n";
    std::cout << "MapGen - Configuration Tests\n";
    std::cout << "==============================================\n\n";

    int passed = 0;
    int failed = 0;

    try {
        test_defaults(); passed++;
        test_flags(); passed++;
        test_rejects_bad_input(); passed++;
        test_log_level_names(); passed++;
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        failed++;
    }

    std::cout << "\n==============================================\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << "==============================================\n";

    return failed > 0 ? 1 : 0;
}
