#include "mapgen/device/physical_device.hpp"
#include "mapgen/core/instance.hpp"
#include "mapgen/core/logging.hpp"

#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace mapgen {

namespace {

// Two-call Vulkan enumeration into a vector; VkResult-returning queries are checked
template <typename T, typename Query>
std::vector<T> enumerateAll(const char* what, Query&& query) {
    uint32_t count = 0;
    std::vector<T> items;
    if constexpr (std::is_void_v<std::invoke_result_t<Query&, uint32_t*, T*>>) {
        query(&count, nullptr);
        items.resize(count);
        query(&count, items.data());
    } else {
        if (query(&count, nullptr) != VK_SUCCESS) {
            throw std::runtime_error(std::string("Failed to enumerate ") + what);
        }
        items.resize(count);
        VkResult result = query(&count, items.data());
        if (result != VK_SUCCESS && result != VK_INCOMPLETE) {
            throw std::runtime_error(std::string("Failed to enumerate ") + what);
        }
    }
    items.resize(count);
    return items;
}

} // namespace

PhysicalDevice::PhysicalDevice(VkPhysicalDevice device)
    : device_(device) {
    vkGetPhysicalDeviceProperties(device_, &properties_);
    vkGetPhysicalDeviceMemoryProperties(device_, &memory_);

    queueFamilies_ = enumerateAll<VkQueueFamilyProperties>("queue families",
        [this](uint32_t* count, VkQueueFamilyProperties* out) {
            vkGetPhysicalDeviceQueueFamilyProperties(device_, count, out);
        });
    extensions_ = enumerateAll<VkExtensionProperties>("device extensions",
        [this](uint32_t* count, VkExtensionProperties* out) {
            return vkEnumerateDeviceExtensionProperties(device_, nullptr, count, out);
        });
}

PhysicalDevice PhysicalDevice::selectBest(Instance* instance, VkSurfaceKHR surface) {
    if (!instance || surface == VK_NULL_HANDLE) {
        throw std::runtime_error("PhysicalDevice::selectBest needs an instance and a surface");
    }

    auto handles = enumerateAll<VkPhysicalDevice>("GPUs",
        [instance](uint32_t* count, VkPhysicalDevice* out) {
            return vkEnumeratePhysicalDevices(instance->handle(), count, out);
        });
    if (handles.empty()) {
        throw std::runtime_error("No Vulkan-capable GPUs found");
    }

    std::optional<PhysicalDevice> best;
    for (VkPhysicalDevice handle : handles) {
        PhysicalDevice candidate(handle);
        bool usable = candidate.findQueueFamilies(surface).isComplete()
                   && candidate.supportsExtension(VK_KHR_SWAPCHAIN_EXTENSION_NAME)
                   && candidate.querySwapChainSupport(surface).isAdequate();
        if (!usable) {
            MAPGEN_DEBUG(LogCategory::Vulkan, std::string("Skipping GPU ") + candidate.name());
            continue;
        }
        if (!best || candidate.rank() > best->rank()) {
            best = candidate;
        }
    }

    if (!best) {
        throw std::runtime_error("No GPU can present to this window");
    }
    MAPGEN_INFO(LogCategory::Vulkan, std::string("Selected GPU: ") + best->name());
    return *best;
}

QueueFamilies PhysicalDevice::findQueueFamilies(VkSurfaceKHR surface) const {
    QueueFamilies families;
    for (uint32_t index = 0; index < queueFamilies_.size(); index++) {
        bool graphics = (queueFamilies_[index].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
        if (graphics && !families.graphics) {
            families.graphics = index;
        }

        VkBool32 canPresent = VK_FALSE;
        if (vkGetPhysicalDeviceSurfaceSupportKHR(device_, index, surface, &canPresent) != VK_SUCCESS) {
            canPresent = VK_FALSE;
        }

        // One family doing both saves the concurrent sharing mode
        if (canPresent && (!families.present || (graphics && families.graphics == index))) {
            families.present = index;
        }
    }
    return families;
}

SwapChainSupport PhysicalDevice::querySwapChainSupport(VkSurfaceKHR surface) const {
    SwapChainSupport support;
    if (vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device_, surface, &support.capabilities) != VK_SUCCESS) {
        throw std::runtime_error("Failed to query surface capabilities");
    }
    support.formats = enumerateAll<VkSurfaceFormatKHR>("surface formats",
        [&](uint32_t* count, VkSurfaceFormatKHR* out) {
            return vkGetPhysicalDeviceSurfaceFormatsKHR(device_, surface, count, out);
        });
    support.presentModes = enumerateAll<VkPresentModeKHR>("present modes",
        [&](uint32_t* count, VkPresentModeKHR* out) {
            return vkGetPhysicalDeviceSurfacePresentModesKHR(device_, surface, count, out);
        });
    return support;
}

bool PhysicalDevice::supportsExtension(const char* name) const {
    for (const VkExtensionProperties& extension : extensions_) {
        if (std::strcmp(extension.extensionName, name) == 0) {
            return true;
        }
    }
    return false;
}

uint32_t PhysicalDevice::findMemoryType(uint32_t typeBits, VkMemoryPropertyFlags properties) const {
    for (uint32_t index = 0; index < memory_.memoryTypeCount; index++) {
        bool allowed = (typeBits & (1u << index)) != 0;
        bool matches = (memory_.memoryTypes[index].propertyFlags & properties) == properties;
        if (allowed && matches) {
            return index;
        }
    }
    throw std::runtime_error("No memory type with the requested properties");
}

int PhysicalDevice::rank() const {
    int rank = 0;
    switch (properties_.deviceType) {
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:   rank += 10000; break;
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: rank += 1000;  break;
        default: break;
    }

    // One point per 64 MiB of device-local memory
    for (uint32_t heap = 0; heap < memory_.memoryHeapCount; heap++) {
        if (memory_.memoryHeaps[heap].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT) {
            rank += static_cast<int>(memory_.memoryHeaps[heap].size >> 26);
        }
    }
    return rank;
}

} // namespace mapgen
