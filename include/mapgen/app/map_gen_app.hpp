#pragma once

#include "mapgen/app/app_config.hpp"
#include "mapgen/core/types.hpp"
#include "mapgen/engine/game_loop.hpp"
#include "mapgen/primitives/circle_cache.hpp"

#include <memory>
#include <string>

namespace mapgen {

class Primitives2D;

/**
 * @brief Windowed harness for the map generator
 *
 * Opens a window, clears it to the configured color every frame and draws
 * a small showcase of outline primitives. Escape or the gamepad Back
 * button quits.
 */
class MapGenApp : public GameLoop {
public:
    /**
     * @param config Startup settings
     * @param shaderDirectory Directory holding the compiled sprite shaders
     */
    MapGenApp(AppConfig config, std::string shaderDirectory);
    ~MapGenApp() override;

    const AppConfig& config() const { return config_; }

    /// Null before content is loaded and after it is unloaded
    Primitives2D* primitives() const { return primitives_.get(); }

protected:
    void onInitialize() override;
    void onLoadContent() override;
    void onUnloadContent() override;
    void onProcessEvents() override;
    void onUpdate(const GameTime& time) override;
    void onDraw(const GameTime& time) override;
    bool shouldQuit() const override;
    bool isSuspended() const override;
    void onWaitForEvents() override;

private:
    void drawShowcase(const GameTime& time);

    /// Destroy GPU objects children-first; safe to call more than once
    void releaseGraphics();

    AppConfig config_;
    std::string shaderDirectory_;
    CircleCacheRef circleCache_;

    InstancePtr instance_;
    WindowPtr window_;
    LogicalDevicePtr device_;
    FrameRendererPtr renderer_;
    SpriteBatchPtr batch_;
    std::unique_ptr<Primitives2D> primitives_;
};

} // namespace mapgen
