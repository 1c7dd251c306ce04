#include "mapgen/high/gpu_texture.hpp"
#include "mapgen/device/buffer.hpp"
#include "mapgen/device/command.hpp"
#include "mapgen/device/image.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/rendering/texture_slots.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace mapgen {

GpuTexturePtr GpuTexture::solidColor(const TextureContext& context, uint32_t width,
                                     uint32_t height, const Color& color) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("GpuTexture: size must be non-zero");
    }
    if (!context.device || !context.commandPool || !context.slots) {
        throw std::invalid_argument("GpuTexture: incomplete texture context");
    }

    std::vector<uint32_t> texels(static_cast<size_t>(width) * height, packRGBA8(color));
    VkDeviceSize bytes = texels.size() * sizeof(uint32_t);

    auto staging = Buffer::staging(context.device, bytes);
    staging->write(texels.data(), bytes);

    auto texture = GpuTexturePtr(new GpuTexture());
    texture->device_ = context.device;
    texture->image_ = Image::sampled(context.device, width, height);

    const Image& image = *texture->image_;
    context.commandPool->runOnce([&](CommandBuffer& cmd) {
        cmd.uploadImage(*staging, image);
    });

    texture->slot_ = context.slots->acquire(image.view());
    texture->slots_ = context.slots;

    MAPGEN_DEBUG(LogCategory::Resource, "Solid texture " + std::to_string(width) + "x" +
                 std::to_string(height) + " uploaded");
    return texture;
}

uint32_t GpuTexture::width() const {
    return image_->width();
}

uint32_t GpuTexture::height() const {
    return image_->height();
}

GpuTexture::~GpuTexture() {
    if (device_) {
        device_->waitIdle();
    }
    if (slots_) {
        slots_->release(slot_);
    }
    MAPGEN_DEBUG(LogCategory::Resource, "Texture released");
}

} // namespace mapgen
