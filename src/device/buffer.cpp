#include "mapgen/device/buffer.hpp"
#include "mapgen/device/logical_device.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace mapgen {

BufferPtr Buffer::staging(LogicalDevice* device, VkDeviceSize bytes) {
    return allocate(device, bytes, VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
}

BufferPtr Buffer::vertices(LogicalDevice* device, VkDeviceSize bytes) {
    return allocate(device, bytes, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
}

BufferPtr Buffer::allocate(LogicalDevice* device, VkDeviceSize bytes, VkBufferUsageFlags usage) {
    if (!device) {
        throw std::runtime_error("Buffer needs a device");
    }
    if (bytes == 0) {
        throw std::runtime_error("Buffer size must be non-zero");
    }

    // Owned before the first Vulkan call so a throw releases what was made
    auto buffer = BufferPtr(new Buffer());
    buffer->device_ = device;
    buffer->size_ = bytes;

    VkBufferCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    info.size = bytes;
    info.usage = usage;
    info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    if (vkCreateBuffer(device->handle(), &info, nullptr, &buffer->buffer_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create buffer");
    }

    VkMemoryRequirements requirements;
    vkGetBufferMemoryRequirements(device->handle(), buffer->buffer_, &requirements);
    buffer->memory_ = device->allocateMemory(requirements,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);

    if (vkBindBufferMemory(device->handle(), buffer->buffer_, buffer->memory_, 0) != VK_SUCCESS) {
        throw std::runtime_error("Failed to bind buffer memory");
    }
    if (vkMapMemory(device->handle(), buffer->memory_, 0, bytes, 0, &buffer->mapped_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to map buffer memory");
    }
    return buffer;
}

void Buffer::write(const void* data, VkDeviceSize bytes) {
    if (bytes > size_) {
        throw std::out_of_range("Buffer::write: " + std::to_string(bytes) +
                                " bytes into a " + std::to_string(size_) + " byte buffer");
    }
    std::memcpy(mapped_, data, static_cast<size_t>(bytes));
}

Buffer::~Buffer() {
    VkDevice device = device_->handle();
    if (mapped_) {
        vkUnmapMemory(device, memory_);
    }
    if (buffer_ != VK_NULL_HANDLE) {
        vkDestroyBuffer(device, buffer_, nullptr);
    }
    if (memory_ != VK_NULL_HANDLE) {
        vkFreeMemory(device, memory_, nullptr);
    }
}

} // namespace mapgen
