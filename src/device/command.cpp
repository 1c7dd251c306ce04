#include "mapgen/device/command.hpp"
#include "mapgen/device/buffer.hpp"
#include "mapgen/device/image.hpp"
#include "mapgen/device/logical_device.hpp"

#include <stdexcept>

namespace mapgen {

// ============================================================================
// CommandPool
// ============================================================================

CommandPool::CommandPool(LogicalDevice* device, Queue* queue)
    : device_(device), queue_(queue) {
    if (!device_ || !queue_) {
        throw std::runtime_error("CommandPool needs a device and a queue");
    }

    VkCommandPoolCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    info.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    info.queueFamilyIndex = queue_->familyIndex();

    if (vkCreateCommandPool(device_->handle(), &info, nullptr, &pool_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create command pool");
    }
}

CommandPool::~CommandPool() {
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(device_->handle(), pool_, nullptr);
    }
}

std::vector<CommandBufferPtr> CommandPool::allocate(uint32_t count) {
    std::vector<VkCommandBuffer> handles(count, VK_NULL_HANDLE);

    VkCommandBufferAllocateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    info.commandPool = pool_;
    info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    info.commandBufferCount = count;
    if (vkAllocateCommandBuffers(device_->handle(), &info, handles.data()) != VK_SUCCESS) {
        throw std::runtime_error("Failed to allocate command buffers");
    }

    std::vector<CommandBufferPtr> buffers;
    for (VkCommandBuffer handle : handles) {
        buffers.push_back(CommandBufferPtr(new CommandBuffer(this, handle)));
    }
    return buffers;
}

void CommandPool::runOnce(const std::function<void(CommandBuffer&)>& record) {
    CommandBufferPtr cmd = std::move(allocate(1).front());
    cmd->begin();
    record(*cmd);
    cmd->end();

    queue_->submit(*cmd);
    queue_->waitIdle();
}

// ============================================================================
// CommandBuffer
// ============================================================================

CommandBuffer::~CommandBuffer() {
    vkFreeCommandBuffers(pool_->device()->handle(), pool_->handle(), 1, &buffer_);
}

void CommandBuffer::begin(bool oneTimeSubmit) {
    VkCommandBufferBeginInfo info{};
    info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    if (oneTimeSubmit) {
        info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    }
    if (vkBeginCommandBuffer(buffer_, &info) != VK_SUCCESS) {
        throw std::runtime_error("Failed to begin command buffer");
    }
}

void CommandBuffer::end() {
    if (vkEndCommandBuffer(buffer_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to record command buffer");
    }
}

void CommandBuffer::reset() {
    if (vkResetCommandBuffer(buffer_, 0) != VK_SUCCESS) {
        throw std::runtime_error("Failed to reset command buffer");
    }
}

void CommandBuffer::bindVertexBuffer(const Buffer& buffer) {
    VkBuffer handle = buffer.handle();
    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(buffer_, 0, 1, &handle, &offset);
}

void CommandBuffer::draw(uint32_t vertexCount, uint32_t firstVertex) {
    vkCmdDraw(buffer_, vertexCount, 1, firstVertex, 0);
}

void CommandBuffer::uploadImage(const Buffer& staging, const Image& image) {
    imageBarrier(image.handle(),
                 VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                 0, VK_ACCESS_TRANSFER_WRITE_BIT,
                 VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);

    VkBufferImageCopy region{};
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.layerCount = 1;
    region.imageExtent = {image.width(), image.height(), 1};
    vkCmdCopyBufferToImage(buffer_, staging.handle(), image.handle(),
                           VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

    imageBarrier(image.handle(),
                 VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                 VK_ACCESS_TRANSFER_WRITE_BIT, VK_ACCESS_SHADER_READ_BIT,
                 VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);
}

void CommandBuffer::imageBarrier(VkImage image, VkImageLayout from, VkImageLayout to,
                                 VkAccessFlags srcAccess, VkAccessFlags dstAccess,
                                 VkPipelineStageFlags srcStage, VkPipelineStageFlags dstStage) {
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.srcAccessMask = srcAccess;
    barrier.dstAccessMask = dstAccess;
    barrier.oldLayout = from;
    barrier.newLayout = to;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    vkCmdPipelineBarrier(buffer_, srcStage, dstStage, 0, 0, nullptr, 0, nullptr, 1, &barrier);
}

} // namespace mapgen
