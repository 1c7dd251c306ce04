#include "mapgen/high/frame_renderer.hpp"
#include "mapgen/device/command.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/rendering/present_pass.hpp"
#include "mapgen/rendering/swapchain.hpp"
#include "mapgen/rendering/sync.hpp"
#include "mapgen/window/window.hpp"
#include "mapgen/core/logging.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace mapgen {

// ============================================================================
// Builder
// ============================================================================

FrameRenderer::Builder::Builder(Window* window, LogicalDevice* device)
    : window_(window), device_(device) {
}

FrameRenderer::Builder& FrameRenderer::Builder::vsync(bool enabled) {
    vsync_ = enabled;
    return *this;
}

FrameRenderer::Builder& FrameRenderer::Builder::framesInFlight(uint32_t count) {
    framesInFlight_ = count;
    return *this;
}

FrameRendererPtr FrameRenderer::Builder::build() {
    if (!window_ || !device_) {
        throw std::runtime_error("FrameRenderer requires a window and a device");
    }
    if (framesInFlight_ == 0) {
        throw std::runtime_error("FrameRenderer needs at least one frame in flight");
    }

    auto renderer = FrameRendererPtr(new FrameRenderer());
    renderer->window_ = window_;
    renderer->device_ = device_;
    renderer->vsync_ = vsync_;
    renderer->swapChain_ = SwapChain::create(device_, window_->surface(), window_->extent(), vsync_);
    renderer->presentPass_ = std::make_unique<PresentPass>(device_, *renderer->swapChain_);

    std::vector<CommandBufferPtr> commands = device_->commandPool()->allocate(framesInFlight_);
    for (CommandBufferPtr& cmd : commands) {
        FrameSlot slot;
        slot.commands = std::move(cmd);
        slot.imageReady = std::make_unique<Semaphore>(device_);
        slot.renderDone = std::make_unique<Semaphore>(device_);
        slot.finished = std::make_unique<Fence>(device_);
        renderer->slots_.push_back(std::move(slot));
    }

    MAPGEN_INFO(LogCategory::Render, "Frame renderer ready with " +
                std::to_string(framesInFlight_) + " frames in flight");
    return renderer;
}

// ============================================================================
// FrameRenderer
// ============================================================================

FrameRenderer::Builder FrameRenderer::create(Window* window, LogicalDevice* device) {
    return Builder(window, device);
}

FrameRenderer::~FrameRenderer() {
    if (device_) {
        device_->waitIdle();
    }
}

VkRenderPass FrameRenderer::renderPass() const {
    return presentPass_->handle();
}

VkExtent2D FrameRenderer::extent() const {
    return swapChain_->extent();
}

void FrameRenderer::rebuildSwapChain() {
    VkExtent2D size = window_->extent();
    if (size.width == 0 || size.height == 0) {
        return;
    }

    device_->waitIdle();
    swapChain_ = SwapChain::create(device_, window_->surface(), size, vsync_, swapChain_.get());
    presentPass_->attach(*swapChain_);
}

CommandBuffer* FrameRenderer::beginFrame(const Color& clearColor) {
    if (inFrame_) {
        throw std::logic_error("FrameRenderer::beginFrame called twice without endFrame");
    }
    if (window_->isMinimized()) {
        return nullptr;
    }

    FrameSlot& frame = slots_[slot_];
    frame.finished->wait();

    std::optional<uint32_t> image = swapChain_->acquire(frame.imageReady->handle());
    if (!image) {
        rebuildSwapChain();
        return nullptr;
    }
    image_ = *image;

    // Reset only once a submit is certain, or the next wait on this slot would hang
    frame.finished->reset();
    frame.commands->reset();
    frame.commands->begin();
    presentPass_->begin(*frame.commands, image_, clearColor);

    inFrame_ = true;
    return frame.commands.get();
}

void FrameRenderer::endFrame() {
    if (!inFrame_) {
        throw std::logic_error("FrameRenderer::endFrame called without beginFrame");
    }
    inFrame_ = false;

    FrameSlot& frame = slots_[slot_];
    presentPass_->end(*frame.commands);
    frame.commands->end();

    device_->graphicsQueue()->submitFrame(*frame.commands, frame.imageReady->handle(),
                                          frame.renderDone->handle(), frame.finished->handle());
    VkResult presented = device_->presentQueue()->present(swapChain_->handle(), image_,
                                                          frame.renderDone->handle());
    slot_ = (slot_ + 1) % static_cast<uint32_t>(slots_.size());

    bool stale = presented == VK_ERROR_OUT_OF_DATE_KHR || presented == VK_SUBOPTIMAL_KHR;
    if (!stale && presented != VK_SUCCESS) {
        throw std::runtime_error("Failed to present swap chain image");
    }
    // Always consume the resize flag so it does not linger past a rebuild
    if (window_->consumeResize() || stale) {
        rebuildSwapChain();
    }
}

} // namespace mapgen
