#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <optional>
#include <vector>

namespace mapgen {

/// What a surface offers for swap chain creation on one device
struct SwapChainSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;

    bool isAdequate() const { return !formats.empty() && !presentModes.empty(); }
};

/// Queue families used to draw and to present
struct QueueFamilies {
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool isComplete() const { return graphics && present; }
};

/**
 * @brief A GPU and the properties queried once at enumeration
 *
 * A device qualifies when it can draw, present to the window surface and
 * create a swap chain. Discrete GPUs rank above integrated ones; ties go to
 * the larger device-local heap.
 */
class PhysicalDevice {
public:
    /// @throws std::runtime_error if no GPU qualifies
    static PhysicalDevice selectBest(Instance* instance, VkSurfaceKHR surface);

    VkPhysicalDevice handle() const { return device_; }
    const char* name() const { return properties_.deviceName; }

    QueueFamilies findQueueFamilies(VkSurfaceKHR surface) const;
    SwapChainSupport querySwapChainSupport(VkSurfaceKHR surface) const;
    bool supportsExtension(const char* name) const;

    /**
     * @brief Index of a memory type allowed by @p typeBits that has @p properties
     * @throws std::runtime_error if none matches
     */
    uint32_t findMemoryType(uint32_t typeBits, VkMemoryPropertyFlags properties) const;

    PhysicalDevice() = default;

private:
    explicit PhysicalDevice(VkPhysicalDevice device);

    int rank() const;

    VkPhysicalDevice device_ = VK_NULL_HANDLE;
    VkPhysicalDeviceProperties properties_{};
    VkPhysicalDeviceMemoryProperties memory_{};
    std::vector<VkQueueFamilyProperties> queueFamilies_;
    std::vector<VkExtensionProperties> extensions_;
};

} // namespace mapgen
