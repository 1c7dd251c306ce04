#include "mapgen/device/image.hpp"
#include "mapgen/device/logical_device.hpp"

#include <stdexcept>

namespace mapgen {

namespace {

constexpr VkFormat kTextureFormat = VK_FORMAT_R8G8B8A8_UNORM;

} // namespace

// ============================================================================
// ImageView
// ============================================================================

ImageViewPtr ImageView::create(LogicalDevice* device, VkImage image, VkFormat format) {
    VkImageViewCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    info.image = image;
    info.viewType = VK_IMAGE_VIEW_TYPE_2D;
    info.format = format;
    info.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    VkImageView view = VK_NULL_HANDLE;
    if (vkCreateImageView(device->handle(), &info, nullptr, &view) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create image view");
    }
    return ImageViewPtr(new ImageView(device, view));
}

ImageView::~ImageView() {
    vkDestroyImageView(device_->handle(), view_, nullptr);
}

// ============================================================================
// Image
// ============================================================================

ImagePtr Image::sampled(LogicalDevice* device, uint32_t width, uint32_t height) {
    if (!device) {
        throw std::runtime_error("Image needs a device");
    }
    if (width == 0 || height == 0) {
        throw std::runtime_error("Image size must be non-zero");
    }

    auto image = ImagePtr(new Image());
    image->device_ = device;
    image->width_ = width;
    image->height_ = height;

    VkImageCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    info.imageType = VK_IMAGE_TYPE_2D;
    info.format = kTextureFormat;
    info.extent = {width, height, 1};
    info.mipLevels = 1;
    info.arrayLayers = 1;
    info.samples = VK_SAMPLE_COUNT_1_BIT;
    info.tiling = VK_IMAGE_TILING_OPTIMAL;
    info.usage = VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
    info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    info.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    if (vkCreateImage(device->handle(), &info, nullptr, &image->image_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create image");
    }

    VkMemoryRequirements requirements;
    vkGetImageMemoryRequirements(device->handle(), image->image_, &requirements);
    image->memory_ = device->allocateMemory(requirements, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    if (vkBindImageMemory(device->handle(), image->image_, image->memory_, 0) != VK_SUCCESS) {
        throw std::runtime_error("Failed to bind image memory");
    }

    image->view_ = ImageView::create(device, image->image_, kTextureFormat);
    return image;
}

Image::~Image() {
    view_.reset();
    if (image_ != VK_NULL_HANDLE) {
        vkDestroyImage(device_->handle(), image_, nullptr);
    }
    if (memory_ != VK_NULL_HANDLE) {
        vkFreeMemory(device_->handle(), memory_, nullptr);
    }
}

} // namespace mapgen
