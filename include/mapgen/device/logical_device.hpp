#pragma once

#include "mapgen/core/types.hpp"
#include "mapgen/device/physical_device.hpp"

#include <vulkan/vulkan.h>
#include <memory>

namespace mapgen {

/// One device queue and the family it came from
class Queue {
public:
    VkQueue handle() const { return queue_; }
    uint32_t familyIndex() const { return family_; }

    /// Submit without synchronization; pair with waitIdle() for one-shot work
    void submit(const CommandBuffer& cmd);

    /**
     * @brief Submit a frame's commands
     *
     * Color output waits on @p imageReady; @p renderDone and @p fence are
     * signaled when the commands finish.
     */
    void submitFrame(const CommandBuffer& cmd, VkSemaphore imageReady,
                     VkSemaphore renderDone, VkFence fence);

    /// Returns the raw result so the caller can react to out-of-date swap chains
    VkResult present(VkSwapchainKHR swapChain, uint32_t imageIndex, VkSemaphore renderDone);

    void waitIdle();

private:
    friend class LogicalDevice;
    Queue(VkQueue queue, uint32_t family) : queue_(queue), family_(family) {}

    void submit(const VkSubmitInfo& info, VkFence fence);

    VkQueue queue_;
    uint32_t family_;
};

/**
 * @brief VkDevice with the swap chain extension, its queues and a command pool
 *
 * Usage:
 * @code
 * auto gpu = PhysicalDevice::selectBest(instance.get(), window->surface());
 * auto device = LogicalDevice::create(gpu).surface(window->surface()).build();
 * @endcode
 */
class LogicalDevice {
public:
    class Builder {
    public:
        explicit Builder(const PhysicalDevice& gpu) : gpu_(gpu) {}

        /// Surface the present queue must support (required)
        Builder& surface(VkSurfaceKHR surface);

        /// @throws std::runtime_error on a missing surface or a Vulkan failure
        LogicalDevicePtr build();

    private:
        PhysicalDevice gpu_;
        VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    };

    static Builder create(const PhysicalDevice& gpu);

    VkDevice handle() const { return device_; }
    const PhysicalDevice& physicalDevice() const { return gpu_; }

    Queue* graphicsQueue() const { return graphics_.get(); }

    /// Same object as graphicsQueue() when one family does both
    Queue* presentQueue() const { return present_ ? present_.get() : graphics_.get(); }

    /// Resettable pool on the graphics queue, created on first use
    CommandPool* commandPool();

    /**
     * @brief Dedicated allocation for one buffer or image
     * @throws std::runtime_error if no memory type fits or allocation fails
     */
    VkDeviceMemory allocateMemory(const VkMemoryRequirements& requirements,
                                  VkMemoryPropertyFlags properties);

    /// Logs instead of throwing so destructors can call it
    void waitIdle();

    ~LogicalDevice();

    LogicalDevice(const LogicalDevice&) = delete;
    LogicalDevice& operator=(const LogicalDevice&) = delete;

private:
    LogicalDevice() = default;

    VkDevice device_ = VK_NULL_HANDLE;
    PhysicalDevice gpu_;
    std::unique_ptr<Queue> graphics_;
    std::unique_ptr<Queue> present_;
    CommandPoolPtr commandPool_;
};

} // namespace mapgen
