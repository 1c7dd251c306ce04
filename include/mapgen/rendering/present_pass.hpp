#pragma once

#include "mapgen/core/types.hpp"
#include "mapgen/primitives/geometry.hpp"

#include <vulkan/vulkan.h>
#include <vector>

namespace mapgen {

/**
 * @brief Single-subpass render pass that clears a swap chain image and
 * leaves it ready to present, with one framebuffer per image
 *
 * The pass depends only on the color format, so it outlives swap chain
 * rebuilds; attach() swaps the framebuffers over to the new images.
 */
class PresentPass {
public:
    /// @throws std::runtime_error on Vulkan failure
    PresentPass(LogicalDevice* device, const SwapChain& swapChain);
    ~PresentPass();

    VkRenderPass handle() const { return renderPass_; }

    /// Rebuild the framebuffers for @p swapChain, which must keep the original format
    void attach(const SwapChain& swapChain);

    void begin(CommandBuffer& cmd, uint32_t imageIndex, const Color& clearColor);
    void end(CommandBuffer& cmd);

    PresentPass(const PresentPass&) = delete;
    PresentPass& operator=(const PresentPass&) = delete;

private:
    void destroyFramebuffers();

    LogicalDevice* device_;
    VkRenderPass renderPass_ = VK_NULL_HANDLE;
    VkFormat format_;
    VkExtent2D extent_{};
    std::vector<VkFramebuffer> framebuffers_;
};

} // namespace mapgen
