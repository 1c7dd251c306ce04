#include "mapgen/rendering/sync.hpp"
#include "mapgen/device/logical_device.hpp"

#include <cstdint>
#include <stdexcept>

namespace mapgen {

Semaphore::Semaphore(LogicalDevice* device)
    : device_(device) {
    VkSemaphoreCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    if (vkCreateSemaphore(device_->handle(), &info, nullptr, &semaphore_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create semaphore");
    }
}

Semaphore::~Semaphore() {
    vkDestroySemaphore(device_->handle(), semaphore_, nullptr);
}

Fence::Fence(LogicalDevice* device)
    : device_(device) {
    // Signaled so the first wait on a fresh frame slot returns at once
    VkFenceCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    info.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    if (vkCreateFence(device_->handle(), &info, nullptr, &fence_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create fence");
    }
}

Fence::~Fence() {
    vkDestroyFence(device_->handle(), fence_, nullptr);
}

void Fence::wait() {
    if (vkWaitForFences(device_->handle(), 1, &fence_, VK_TRUE, UINT64_MAX) != VK_SUCCESS) {
        throw std::runtime_error("Failed to wait for frame fence");
    }
}

void Fence::reset() {
    if (vkResetFences(device_->handle(), 1, &fence_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to reset frame fence");
    }
}

} // namespace mapgen
