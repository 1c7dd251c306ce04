#include "mapgen/app/map_gen_app.hpp"
#include "mapgen/core/instance.hpp"
#include "mapgen/core/logging.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/device/physical_device.hpp"
#include "mapgen/high/frame_renderer.hpp"
#include "mapgen/high/sprite_batch.hpp"
#include "mapgen/primitives/primitives2d.hpp"
#include "mapgen/window/window.hpp"

#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>

namespace mapgen {

MapGenApp::MapGenApp(AppConfig config, std::string shaderDirectory)
    : config_(std::move(config))
    , shaderDirectory_(std::move(shaderDirectory))
    , circleCache_(std::make_shared<CircleCache>()) {
}

MapGenApp::~MapGenApp() {
    // The base destructor cannot reach onUnloadContent()
    shutdown();
    releaseGraphics();
}

// ============================================================================
// Lifecycle hooks
// ============================================================================

void MapGenApp::onInitialize() {
    setFixedTimestep(config_.fixedTimestep);

    instance_ = Instance::create()
        .applicationName(config_.title)
        .enableValidation(config_.enableValidation)
        .build();

    window_ = Window::create(instance_.get())
        .title(config_.title)
        .size(config_.width, config_.height)
        .resizable(config_.resizable)
        .build();

    PhysicalDevice physical = PhysicalDevice::selectBest(instance_.get(), window_->surface());
    device_ = LogicalDevice::create(physical)
        .surface(window_->surface())
        .build();

    renderer_ = FrameRenderer::create(window_.get(), device_.get())
        .vsync(config_.vsync)
        .framesInFlight(config_.framesInFlight)
        .build();

    MAPGEN_INFO(LogCategory::Game, "MapGenApp initialized on " + std::string(physical.name()));
}

void MapGenApp::onLoadContent() {
    batch_ = SpriteBatch::create(device_.get(), renderer_->renderPass())
        .shaderDirectory(shaderDirectory_)
        .framesInFlight(config_.framesInFlight)
        .build();

    primitives_ = std::make_unique<Primitives2D>(batch_.get(), circleCache_);
}

void MapGenApp::onUnloadContent() {
    if (primitives_) {
        primitives_->dispose();
        primitives_.reset();
    }
    releaseGraphics();
}

void MapGenApp::releaseGraphics() {
    if (device_) {
        device_->waitIdle();
    }

    primitives_.reset();
    batch_.reset();
    renderer_.reset();
    device_.reset();
    window_.reset();
    instance_.reset();
}

// ============================================================================
// Frame hooks
// ============================================================================

void MapGenApp::onProcessEvents() {
    window_->pollEvents();
}

void MapGenApp::onUpdate(const GameTime& /*time*/) {
    if (window_->isKeyPressed(GLFW_KEY_ESCAPE) ||
        window_->isGamepadButtonPressed(GLFW_GAMEPAD_BUTTON_BACK)) {
        MAPGEN_INFO(LogCategory::Game, "Exit requested");
        quit();
    }
}

void MapGenApp::onDraw(const GameTime& time) {
    CommandBuffer* cmd = renderer_->beginFrame(config_.clearColor);
    if (!cmd) {
        return;
    }

    // The frame's fence was reset, so the frame is submitted even if drawing fails
    batch_->begin();
    try {
        drawShowcase(time);
    } catch (const std::exception&) {
        batch_->end(*cmd, renderer_->extent(), renderer_->frameIndex());
        renderer_->endFrame();
        throw;
    }
    batch_->end(*cmd, renderer_->extent(), renderer_->frameIndex());
    renderer_->endFrame();
}

bool MapGenApp::shouldQuit() const {
    return GameLoop::shouldQuit() || !window_ || !window_->isOpen();
}

bool MapGenApp::isSuspended() const {
    return window_ && window_->isMinimized();
}

void MapGenApp::onWaitForEvents() {
    window_->waitEvents();
}

void MapGenApp::drawShowcase(const GameTime& time) {
    VkExtent2D extent = renderer_->extent();
    Point2D center(extent.width * 0.5f, extent.height * 0.5f);
    float radius = 0.3f * static_cast<float>(std::min(extent.width, extent.height));

    primitives_->drawCircle(center, radius, 48, colors::White, 2.0f);

    // A quarter arc sweeping around the circle
    float sweepStart = std::fmod(time.total, glm::two_pi<float>());
    primitives_->drawArc(center, radius + 12.0f, 48, sweepStart,
                         glm::half_pi<float>(), colors::Yellow, 3.0f);

    PointSequence zigzag = {
        {-120.0f, 0.0f}, {-60.0f, -40.0f}, {0.0f, 0.0f}, {60.0f, -40.0f}, {120.0f, 0.0f}
    };
    primitives_->drawPoints(center + Point2D(0.0f, radius * 0.5f), zigzag,
                            colors::DarkGreen, 2.0f);

    primitives_->drawLine(Point2D(10.0f, 10.0f),
                          Point2D(static_cast<float>(extent.width) - 10.0f, 10.0f),
                          colors::Red, 1.0f);
}

} // namespace mapgen
