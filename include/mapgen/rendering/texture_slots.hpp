#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>

namespace mapgen {

/**
 * @brief Fixed number of bindable texture descriptor sets
 *
 * Each live texture holds one slot. Every slot samples with the same
 * nearest-filter, clamp-to-edge sampler so one-texel lines stay crisp when
 * stretched.
 */
class TextureSlots {
public:
    /// @throws std::runtime_error on Vulkan failure or zero capacity
    TextureSlots(LogicalDevice* device, VkDescriptorSetLayout layout, uint32_t capacity);
    ~TextureSlots();

    /**
     * @brief Take a slot and point it at @p view
     * @throws std::runtime_error when every slot is taken
     */
    VkDescriptorSet acquire(const ImageView& view);

    /// Return a slot; VK_NULL_HANDLE is ignored
    void release(VkDescriptorSet slot);

    uint32_t capacity() const { return capacity_; }
    uint32_t inUse() const { return inUse_; }

    TextureSlots(const TextureSlots&) = delete;
    TextureSlots& operator=(const TextureSlots&) = delete;

private:
    LogicalDevice* device_;
    VkDescriptorSetLayout layout_;
    VkDescriptorPool pool_ = VK_NULL_HANDLE;
    VkSampler sampler_ = VK_NULL_HANDLE;
    uint32_t capacity_;
    uint32_t inUse_ = 0;
};

} // namespace mapgen
