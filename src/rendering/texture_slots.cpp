#include "mapgen/rendering/texture_slots.hpp"
#include "mapgen/device/image.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>
#include <string>

namespace mapgen {

TextureSlots::TextureSlots(LogicalDevice* device, VkDescriptorSetLayout layout, uint32_t capacity)
    : device_(device), layout_(layout), capacity_(capacity) {
    if (!device_ || layout_ == VK_NULL_HANDLE || capacity_ == 0) {
        throw std::runtime_error("TextureSlots needs a device, a layout and a capacity");
    }

    VkDescriptorPoolSize size{VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, capacity_};

    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    poolInfo.maxSets = capacity_;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &size;
    if (vkCreateDescriptorPool(device_->handle(), &poolInfo, nullptr, &pool_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create texture descriptor pool");
    }

    VkSamplerCreateInfo samplerInfo{};
    samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    samplerInfo.magFilter = VK_FILTER_NEAREST;
    samplerInfo.minFilter = VK_FILTER_NEAREST;
    samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    samplerInfo.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    samplerInfo.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    samplerInfo.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    samplerInfo.maxAnisotropy = 1.0f;
    if (vkCreateSampler(device_->handle(), &samplerInfo, nullptr, &sampler_) != VK_SUCCESS) {
        vkDestroyDescriptorPool(device_->handle(), pool_, nullptr);
        throw std::runtime_error("Failed to create texture sampler");
    }
}

TextureSlots::~TextureSlots() {
    if (inUse_ > 0) {
        MAPGEN_WARN(LogCategory::Resource, std::to_string(inUse_) +
                    " texture slots still taken at shutdown");
    }
    vkDestroySampler(device_->handle(), sampler_, nullptr);
    vkDestroyDescriptorPool(device_->handle(), pool_, nullptr);
}

VkDescriptorSet TextureSlots::acquire(const ImageView& view) {
    if (inUse_ == capacity_) {
        throw std::runtime_error("All " + std::to_string(capacity_) + " texture slots are taken");
    }

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = pool_;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &layout_;

    VkDescriptorSet slot = VK_NULL_HANDLE;
    if (vkAllocateDescriptorSets(device_->handle(), &allocInfo, &slot) != VK_SUCCESS) {
        throw std::runtime_error("Failed to allocate a texture slot");
    }

    VkDescriptorImageInfo image{};
    image.sampler = sampler_;
    image.imageView = view.handle();
    image.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = slot;
    write.dstBinding = 0;
    write.descriptorCount = 1;
    write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    write.pImageInfo = &image;
    vkUpdateDescriptorSets(device_->handle(), 1, &write, 0, nullptr);

    inUse_++;
    return slot;
}

void TextureSlots::release(VkDescriptorSet slot) {
    if (slot == VK_NULL_HANDLE) {
        return;
    }
    if (vkFreeDescriptorSets(device_->handle(), pool_, 1, &slot) != VK_SUCCESS) {
        MAPGEN_WARN(LogCategory::Resource, "vkFreeDescriptorSets failed");
        return;
    }
    inUse_--;
}

} // namespace mapgen
