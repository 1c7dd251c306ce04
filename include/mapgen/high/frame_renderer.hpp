#pragma once

#include "mapgen/core/types.hpp"
#include "mapgen/primitives/geometry.hpp"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace mapgen {

/**
 * @brief Acquire, clear, submit and present for one window
 *
 * Owns the swap chain, the present pass and a ring of frame slots. Each slot
 * has its own command buffer, semaphores and fence, so the CPU records frame
 * N+1 while the GPU still draws frame N. The swap chain is rebuilt when the
 * window resizes or presentation reports it stale.
 *
 * Usage:
 * @code
 * auto renderer = FrameRenderer::create(window.get(), device.get())
 *     .vsync(true)
 *     .framesInFlight(2)
 *     .build();
 *
 * if (CommandBuffer* cmd = renderer->beginFrame(colors::CornflowerBlue)) {
 *     batch->end(*cmd, renderer->extent(), renderer->frameIndex());
 *     renderer->endFrame();
 * }
 * @endcode
 */
class FrameRenderer {
public:
    class Builder {
    public:
        Builder(Window* window, LogicalDevice* device);

        /// FIFO presentation when enabled (default true)
        Builder& vsync(bool enabled);

        /// Frame slots recorded ahead of the GPU (default 2)
        Builder& framesInFlight(uint32_t count);

        /// @throws std::runtime_error on a zero slot count or a Vulkan failure
        FrameRendererPtr build();

    private:
        Window* window_;
        LogicalDevice* device_;
        bool vsync_ = true;
        uint32_t framesInFlight_ = 2;
    };

    static Builder create(Window* window, LogicalDevice* device);

    VkRenderPass renderPass() const;

    /**
     * @brief Acquire an image and begin the clearing pass
     * @return Command buffer to record into, or nullptr if this frame is skipped
     *         (window minimized or swap chain rebuilt)
     * @throws std::logic_error if a frame is already open
     */
    CommandBuffer* beginFrame(const Color& clearColor);

    /// End the pass, submit and present; @throws std::logic_error without beginFrame
    void endFrame();

    bool inFrame() const { return inFrame_; }
    VkExtent2D extent() const;

    /// Slot of the open frame, in [0, framesInFlight)
    uint32_t frameIndex() const { return slot_; }

    /// Waits for the GPU before releasing anything
    ~FrameRenderer();

    FrameRenderer(const FrameRenderer&) = delete;
    FrameRenderer& operator=(const FrameRenderer&) = delete;

private:
    struct FrameSlot {
        CommandBufferPtr commands;
        SemaphorePtr imageReady;
        SemaphorePtr renderDone;
        FencePtr finished;
    };

    FrameRenderer() = default;

    void rebuildSwapChain();

    Window* window_ = nullptr;
    LogicalDevice* device_ = nullptr;
    bool vsync_ = true;

    SwapChainPtr swapChain_;
    PresentPassPtr presentPass_;
    std::vector<FrameSlot> slots_;

    uint32_t slot_ = 0;
    uint32_t image_ = 0;
    bool inFrame_ = false;
};

} // namespace mapgen
