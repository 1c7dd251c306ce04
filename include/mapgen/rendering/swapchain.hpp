#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <optional>
#include <vector>

namespace mapgen {

/**
 * @brief Presentable images for one window surface
 *
 * Immutable once created. A resize builds a new SwapChain from the old one
 * and drops the old one:
 * @code
 * device->waitIdle();
 * swapChain = SwapChain::create(device, surface, window->extent(), vsync, swapChain.get());
 * @endcode
 */
class SwapChain {
public:
    /**
     * @param extent Used only when the surface leaves the size to the application
     * @param vsync FIFO when true; mailbox, then immediate, when false
     * @param previous Chain being replaced, or null
     * @throws std::runtime_error on Vulkan failure
     */
    static SwapChainPtr create(LogicalDevice* device, VkSurfaceKHR surface, VkExtent2D extent,
                               bool vsync, const SwapChain* previous = nullptr);

    VkSwapchainKHR handle() const { return swapChain_; }
    VkFormat format() const { return format_; }
    VkExtent2D extent() const { return extent_; }
    const std::vector<ImageViewPtr>& views() const { return views_; }

    /**
     * @brief Index of the next image, signaling @p imageReady once it is free
     * @return nullopt when the chain is out of date and must be rebuilt
     * @throws std::runtime_error on any other failure
     */
    std::optional<uint32_t> acquire(VkSemaphore imageReady);

    ~SwapChain();

    SwapChain(const SwapChain&) = delete;
    SwapChain& operator=(const SwapChain&) = delete;

private:
    SwapChain() = default;

    LogicalDevice* device_ = nullptr;
    VkSwapchainKHR swapChain_ = VK_NULL_HANDLE;
    VkFormat format_ = VK_FORMAT_UNDEFINED;
    VkExtent2D extent_{};
    std::vector<ImageViewPtr> views_;
};

} // namespace mapgen
