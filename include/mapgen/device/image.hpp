#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>

namespace mapgen {

/// View over the single color subresource of a 2D image; does not own the image
class ImageView {
public:
    /// @throws std::runtime_error on Vulkan failure
    static ImageViewPtr create(LogicalDevice* device, VkImage image, VkFormat format);

    VkImageView handle() const { return view_; }

    ~ImageView();

    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

private:
    ImageView(LogicalDevice* device, VkImageView view) : device_(device), view_(view) {}

    LogicalDevice* device_;
    VkImageView view_;
};

/**
 * @brief RGBA8 image in device-local memory that shaders sample
 *
 * Filled once through CommandBuffer::uploadImage().
 */
class Image {
public:
    /// @throws std::runtime_error on Vulkan failure or a zero dimension
    static ImagePtr sampled(LogicalDevice* device, uint32_t width, uint32_t height);

    VkImage handle() const { return image_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    const ImageView& view() const { return *view_; }

    ~Image();

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

private:
    Image() = default;

    LogicalDevice* device_ = nullptr;
    VkImage image_ = VK_NULL_HANDLE;
    VkDeviceMemory memory_ = VK_NULL_HANDLE;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    ImageViewPtr view_;
};

} // namespace mapgen
