#include "mapgen/rendering/swapchain.hpp"
#include "mapgen/device/image.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/core/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mapgen {

namespace {

// Sprite colors are already display values, so a UNORM target keeps them exact
VkSurfaceFormatKHR pickFormat(const std::vector<VkSurfaceFormatKHR>& available) {
    auto unorm = std::find_if(available.begin(), available.end(),
        [](const VkSurfaceFormatKHR& candidate) {
            return candidate.format == VK_FORMAT_B8G8R8A8_UNORM &&
                   candidate.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        });
    return unorm != available.end() ? *unorm : available.front();
}

VkPresentModeKHR pickPresentMode(const std::vector<VkPresentModeKHR>& available, bool vsync) {
    if (vsync) {
        return VK_PRESENT_MODE_FIFO_KHR;
    }
    for (VkPresentModeKHR preferred : {VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR}) {
        if (std::find(available.begin(), available.end(), preferred) != available.end()) {
            return preferred;
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D pickExtent(const VkSurfaceCapabilitiesKHR& caps, VkExtent2D wanted) {
    if (caps.currentExtent.width != UINT32_MAX) {
        return caps.currentExtent;
    }
    return {std::clamp(wanted.width, caps.minImageExtent.width, caps.maxImageExtent.width),
            std::clamp(wanted.height, caps.minImageExtent.height, caps.maxImageExtent.height)};
}

} // namespace

SwapChainPtr SwapChain::create(LogicalDevice* device, VkSurfaceKHR surface, VkExtent2D extent,
                               bool vsync, const SwapChain* previous) {
    if (!device || surface == VK_NULL_HANDLE) {
        throw std::runtime_error("SwapChain needs a device and a surface");
    }

    SwapChainSupport support = device->physicalDevice().querySwapChainSupport(surface);
    if (!support.isAdequate()) {
        throw std::runtime_error("Surface offers no formats or present modes");
    }
    const VkSurfaceCapabilitiesKHR& caps = support.capabilities;
    VkSurfaceFormatKHR format = pickFormat(support.formats);

    // One spare image so acquire rarely blocks on the presentation engine
    uint32_t minImages = caps.minImageCount + 1;
    if (caps.maxImageCount > 0) {
        minImages = std::min(minImages, caps.maxImageCount);
    }

    auto chain = SwapChainPtr(new SwapChain());
    chain->device_ = device;
    chain->format_ = format.format;
    chain->extent_ = pickExtent(caps, extent);

    VkSwapchainCreateInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    info.surface = surface;
    info.minImageCount = minImages;
    info.imageFormat = format.format;
    info.imageColorSpace = format.colorSpace;
    info.imageExtent = chain->extent_;
    info.imageArrayLayers = 1;
    info.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    info.preTransform = caps.currentTransform;
    info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    info.presentMode = pickPresentMode(support.presentModes, vsync);
    info.clipped = VK_TRUE;
    info.oldSwapchain = previous ? previous->swapChain_ : VK_NULL_HANDLE;

    uint32_t families[] = {device->graphicsQueue()->familyIndex(),
                           device->presentQueue()->familyIndex()};
    if (families[0] != families[1]) {
        info.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        info.queueFamilyIndexCount = 2;
        info.pQueueFamilyIndices = families;
    } else {
        info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    if (vkCreateSwapchainKHR(device->handle(), &info, nullptr, &chain->swapChain_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create swap chain");
    }

    uint32_t count = 0;
    std::vector<VkImage> images;
    if (vkGetSwapchainImagesKHR(device->handle(), chain->swapChain_, &count, nullptr) == VK_SUCCESS) {
        images.resize(count);
    }
    if (images.empty() ||
        vkGetSwapchainImagesKHR(device->handle(), chain->swapChain_, &count, images.data()) != VK_SUCCESS) {
        throw std::runtime_error("Failed to get swap chain images");
    }
    for (VkImage image : images) {
        chain->views_.push_back(ImageView::create(device, image, chain->format_));
    }

    MAPGEN_INFO(LogCategory::Vulkan, std::string(previous ? "Swap chain rebuilt: " : "Swap chain created: ") +
        std::to_string(chain->extent_.width) + "x" + std::to_string(chain->extent_.height) +
        ", " + std::to_string(count) + " images");
    return chain;
}

SwapChain::~SwapChain() {
    views_.clear();
    if (swapChain_ != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_->handle(), swapChain_, nullptr);
    }
}

std::optional<uint32_t> SwapChain::acquire(VkSemaphore imageReady) {
    uint32_t index = 0;
    VkResult result = vkAcquireNextImageKHR(device_->handle(), swapChain_, UINT64_MAX,
                                            imageReady, VK_NULL_HANDLE, &index);
    if (result == VK_ERROR_OUT_OF_DATE_KHR) {
        return std::nullopt;
    }
    // Suboptimal still presents; the renderer rebuilds after present reports it
    if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR) {
        throw std::runtime_error("Failed to acquire swap chain image");
    }
    return index;
}

} // namespace mapgen
