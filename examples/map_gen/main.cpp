/**
 * @file main.cpp
 * @brief Map generator harness
 *
 * Opens an 800x480 window cleared to cornflower blue and draws the outline
 * primitives. Flags are described on AppConfig::fromArgs.
 */

#include <mapgen/app/app_config.hpp>
#include <mapgen/app/map_gen_app.hpp>
#include <mapgen/core/logging.hpp>

#include <cstdlib>
#include <exception>
#include <string>

#ifndef MAPGEN_SHADER_DIR
#define MAPGEN_SHADER_DIR "shaders"
#endif

int main(int argc, char** argv) {
    try {
        mapgen::AppConfig config = mapgen::AppConfig::fromArgs(argc, argv);
        mapgen::Logger::global().setMinLevel(config.logLevel);

        const char* shaderOverride = std::getenv("MAPGEN_SHADER_DIR");
        std::string shaderDirectory = shaderOverride ? shaderOverride : MAPGEN_SHADER_DIR;

        MAPGEN_INFO(mapgen::LogCategory::Core, "Starting: " + config.describe());

        mapgen::MapGenApp app(config, shaderDirectory);
        app.run();
    } catch (const std::exception& e) {
        MAPGEN_FATAL(mapgen::LogCategory::Core, std::string("Fatal error: ") + e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
