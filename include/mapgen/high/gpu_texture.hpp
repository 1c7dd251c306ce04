#pragma once

#include "mapgen/core/types.hpp"
#include "mapgen/primitives/quad_batch.hpp"

#include <vulkan/vulkan.h>

namespace mapgen {

/// What a texture needs to upload itself and become bindable
struct TextureContext {
    LogicalDevice* device = nullptr;
    CommandPool* commandPool = nullptr;
    TextureSlots* slots = nullptr;
};

/**
 * @brief Sampled RGBA8 texture holding one TextureSlots slot
 *
 * Pixels go up through a staging buffer when the texture is made; after
 * that the image is only ever sampled.
 */
class GpuTexture : public SpriteTexture {
public:
    /**
     * @brief Texture with every texel set to @p color
     * @throws std::invalid_argument for a zero size or an incomplete context
     * @throws std::runtime_error on Vulkan failure or when no slot is free
     */
    static GpuTexturePtr solidColor(const TextureContext& context, uint32_t width,
                                    uint32_t height, const Color& color);

    uint32_t width() const override;
    uint32_t height() const override;

    VkDescriptorSet slot() const { return slot_; }

    /// Waits for the device so no frame in flight still samples the image
    ~GpuTexture() override;

    GpuTexture(const GpuTexture&) = delete;
    GpuTexture& operator=(const GpuTexture&) = delete;

private:
    GpuTexture() = default;

    LogicalDevice* device_ = nullptr;
    TextureSlots* slots_ = nullptr;
    ImagePtr image_;
    VkDescriptorSet slot_ = VK_NULL_HANDLE;
};

} // namespace mapgen
