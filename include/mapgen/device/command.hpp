#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <functional>
#include <vector>

namespace mapgen {

/// Pool of individually resettable command buffers for one queue
class CommandPool {
public:
    CommandPool(LogicalDevice* device, Queue* queue);
    ~CommandPool();

    VkCommandPool handle() const { return pool_; }
    LogicalDevice* device() const { return device_; }

    std::vector<CommandBufferPtr> allocate(uint32_t count);

    /// Record, submit and wait; used for texture uploads outside the frame loop
    void runOnce(const std::function<void(CommandBuffer&)>& record);

    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

private:
    LogicalDevice* device_;
    Queue* queue_;
    VkCommandPool pool_ = VK_NULL_HANDLE;
};

/**
 * @brief Primary command buffer
 *
 * Only the commands sprites need are wrapped here. SpritePipeline and
 * PresentPass record their own state through handle().
 */
class CommandBuffer {
public:
    VkCommandBuffer handle() const { return buffer_; }

    void begin(bool oneTimeSubmit = true);
    void end();
    void reset();

    void bindVertexBuffer(const Buffer& buffer);
    void draw(uint32_t vertexCount, uint32_t firstVertex);

    /**
     * @brief Copy @p staging into every texel of @p image
     *
     * The image starts in an undefined layout and ends ready for sampling
     * by fragment shaders.
     */
    void uploadImage(const Buffer& staging, const Image& image);

    ~CommandBuffer();

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

private:
    friend class CommandPool;
    CommandBuffer(CommandPool* pool, VkCommandBuffer buffer) : pool_(pool), buffer_(buffer) {}

    void imageBarrier(VkImage image, VkImageLayout from, VkImageLayout to,
                      VkAccessFlags srcAccess, VkAccessFlags dstAccess,
                      VkPipelineStageFlags srcStage, VkPipelineStageFlags dstStage);

    CommandPool* pool_;
    VkCommandBuffer buffer_;
};

} // namespace mapgen
