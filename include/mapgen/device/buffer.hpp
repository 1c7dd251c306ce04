#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>

namespace mapgen {

/**
 * @brief Host-visible buffer mapped for its whole lifetime
 *
 * The CPU rewrites every buffer this renderer uses, whether it stages a
 * texture upload or streams a frame's sprite vertices, so memory is always
 * HOST_VISIBLE | HOST_COHERENT.
 */
class Buffer {
public:
    /// Transfer source for one texture upload
    static BufferPtr staging(LogicalDevice* device, VkDeviceSize bytes);

    /// Vertex stream refilled every frame
    static BufferPtr vertices(LogicalDevice* device, VkDeviceSize bytes);

    VkBuffer handle() const { return buffer_; }
    VkDeviceSize size() const { return size_; }

    /// @throws std::out_of_range if @p bytes exceeds size()
    void write(const void* data, VkDeviceSize bytes);

    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

private:
    Buffer() = default;

    static BufferPtr allocate(LogicalDevice* device, VkDeviceSize bytes, VkBufferUsageFlags usage);

    LogicalDevice* device_ = nullptr;
    VkBuffer buffer_ = VK_NULL_HANDLE;
    VkDeviceMemory memory_ = VK_NULL_HANDLE;
    VkDeviceSize size_ = 0;
    void* mapped_ = nullptr;
};

} // namespace mapgen
