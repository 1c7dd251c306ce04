#include "mapgen/device/logical_device.hpp"
#include "mapgen/device/command.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace mapgen {

// ============================================================================
// Queue
// ============================================================================

void Queue::submit(const VkSubmitInfo& info, VkFence fence) {
    if (vkQueueSubmit(queue_, 1, &info, fence) != VK_SUCCESS) {
        throw std::runtime_error("Failed to submit command buffer");
    }
}

void Queue::submit(const CommandBuffer& cmd) {
    VkCommandBuffer handle = cmd.handle();

    VkSubmitInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    info.commandBufferCount = 1;
    info.pCommandBuffers = &handle;
    submit(info, VK_NULL_HANDLE);
}

void Queue::submitFrame(const CommandBuffer& cmd, VkSemaphore imageReady,
                        VkSemaphore renderDone, VkFence fence) {
    VkCommandBuffer handle = cmd.handle();
    VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores = &imageReady;
    info.pWaitDstStageMask = &waitStage;
    info.commandBufferCount = 1;
    info.pCommandBuffers = &handle;
    info.signalSemaphoreCount = 1;
    info.pSignalSemaphores = &renderDone;
    submit(info, fence);
}

VkResult Queue::present(VkSwapchainKHR swapChain, uint32_t imageIndex, VkSemaphore renderDone) {
    VkPresentInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores = &renderDone;
    info.swapchainCount = 1;
    info.pSwapchains = &swapChain;
    info.pImageIndices = &imageIndex;
    return vkQueuePresentKHR(queue_, &info);
}

void Queue::waitIdle() {
    if (vkQueueWaitIdle(queue_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to wait for queue idle");
    }
}

// ============================================================================
// Builder
// ============================================================================

LogicalDevice::Builder& LogicalDevice::Builder::surface(VkSurfaceKHR surface) {
    surface_ = surface;
    return *this;
}

LogicalDevicePtr LogicalDevice::Builder::build() {
    if (surface_ == VK_NULL_HANDLE) {
        throw std::runtime_error("LogicalDevice needs the window surface");
    }

    QueueFamilies families = gpu_.findQueueFamilies(surface_);
    if (!families.isComplete()) {
        throw std::runtime_error("GPU has no graphics or present queue for this surface");
    }
    uint32_t graphicsFamily = *families.graphics;
    uint32_t presentFamily = *families.present;

    float priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queues;
    for (uint32_t family : {graphicsFamily, presentFamily}) {
        if (!queues.empty() && queues.front().queueFamilyIndex == family) {
            continue;
        }
        VkDeviceQueueCreateInfo queue{};
        queue.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queue.queueFamilyIndex = family;
        queue.queueCount = 1;
        queue.pQueuePriorities = &priority;
        queues.push_back(queue);
    }

    std::vector<const char*> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};
#ifdef VK_USE_PLATFORM_MACOS_MVK
    if (gpu_.supportsExtension("VK_KHR_portability_subset")) {
        extensions.push_back("VK_KHR_portability_subset");
    }
#endif

    // Sprites need no optional features
    VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    info.queueCreateInfoCount = static_cast<uint32_t>(queues.size());
    info.pQueueCreateInfos = queues.data();
    info.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    info.ppEnabledExtensionNames = extensions.data();
    info.pEnabledFeatures = &features;

    auto device = LogicalDevicePtr(new LogicalDevice());
    device->gpu_ = gpu_;
    if (vkCreateDevice(gpu_.handle(), &info, nullptr, &device->device_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create logical device");
    }

    VkQueue queue = VK_NULL_HANDLE;
    vkGetDeviceQueue(device->device_, graphicsFamily, 0, &queue);
    device->graphics_.reset(new Queue(queue, graphicsFamily));
    if (presentFamily != graphicsFamily) {
        vkGetDeviceQueue(device->device_, presentFamily, 0, &queue);
        device->present_.reset(new Queue(queue, presentFamily));
    }

    MAPGEN_INFO(LogCategory::Vulkan, "Logical device created (graphics family " +
                std::to_string(graphicsFamily) + ", present family " +
                std::to_string(presentFamily) + ")");
    return device;
}

// ============================================================================
// LogicalDevice
// ============================================================================

LogicalDevice::Builder LogicalDevice::create(const PhysicalDevice& gpu) {
    return Builder(gpu);
}

LogicalDevice::~LogicalDevice() {
    if (device_ == VK_NULL_HANDLE) {
        return;
    }
    waitIdle();
    commandPool_.reset();
    vkDestroyDevice(device_, nullptr);
    MAPGEN_DEBUG(LogCategory::Vulkan, "Logical device destroyed");
}

CommandPool* LogicalDevice::commandPool() {
    if (!commandPool_) {
        commandPool_ = std::make_unique<CommandPool>(this, graphics_.get());
    }
    return commandPool_.get();
}

VkDeviceMemory LogicalDevice::allocateMemory(const VkMemoryRequirements& requirements,
                                             VkMemoryPropertyFlags properties) {
    VkMemoryAllocateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    info.allocationSize = requirements.size;
    info.memoryTypeIndex = gpu_.findMemoryType(requirements.memoryTypeBits, properties);

    VkDeviceMemory memory = VK_NULL_HANDLE;
    if (vkAllocateMemory(device_, &info, nullptr, &memory) != VK_SUCCESS) {
        throw std::runtime_error("Failed to allocate " + std::to_string(requirements.size) +
                                 " bytes of device memory");
    }
    return memory;
}

void LogicalDevice::waitIdle() {
    if (device_ != VK_NULL_HANDLE && vkDeviceWaitIdle(device_) != VK_SUCCESS) {
        MAPGEN_WARN(LogCategory::Vulkan, "vkDeviceWaitIdle failed");
    }
}

} // namespace mapgen
