#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <string>

namespace mapgen {

/**
 * @brief The one pipeline sprites are drawn with
 *
 * Reads SpriteVertex triangle lists, samples the texture bound at set 0 and
 * alpha blends over the target. The pixel projection is pushed as a vertex
 * push constant; viewport and scissor are dynamic so a resize does not
 * rebuild the pipeline.
 */
class SpritePipeline {
public:
    /**
     * @param shaderDirectory Holds sprite.vert.spv and sprite.frag.spv
     * @throws std::runtime_error if a shader cannot be read or Vulkan fails
     */
    SpritePipeline(LogicalDevice* device, VkRenderPass renderPass,
                   const std::string& shaderDirectory);
    ~SpritePipeline();

    /// Layout of the per-texture descriptor set (one combined image sampler)
    VkDescriptorSetLayout textureLayout() const { return textureLayout_; }

    /// Bind the pipeline and set viewport, scissor and projection for @p extent
    void bind(CommandBuffer& cmd, VkExtent2D extent);

    void bindTexture(CommandBuffer& cmd, VkDescriptorSet texture);

    SpritePipeline(const SpritePipeline&) = delete;
    SpritePipeline& operator=(const SpritePipeline&) = delete;

private:
    void destroy();

    LogicalDevice* device_;
    VkDescriptorSetLayout textureLayout_ = VK_NULL_HANDLE;
    VkPipelineLayout layout_ = VK_NULL_HANDLE;
    VkPipeline pipeline_ = VK_NULL_HANDLE;
};

} // namespace mapgen
