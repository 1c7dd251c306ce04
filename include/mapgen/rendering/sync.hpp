#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>

namespace mapgen {

/// GPU-side signal between acquire, submit and present
class Semaphore {
public:
    explicit Semaphore(LogicalDevice* device);
    ~Semaphore();

    VkSemaphore handle() const { return semaphore_; }

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

private:
    LogicalDevice* device_;
    VkSemaphore semaphore_ = VK_NULL_HANDLE;
};

/// CPU-side wait for a frame slot's previous submission; starts signaled
class Fence {
public:
    explicit Fence(LogicalDevice* device);
    ~Fence();

    VkFence handle() const { return fence_; }

    /// Blocks without timeout; @throws std::runtime_error on device loss
    void wait();
    void reset();

    Fence(const Fence&) = delete;
    Fence& operator=(const Fence&) = delete;

private:
    LogicalDevice* device_;
    VkFence fence_ = VK_NULL_HANDLE;
};

} // namespace mapgen
