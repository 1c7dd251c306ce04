#include "mapgen/high/sprite_batch.hpp"
#include "mapgen/device/buffer.hpp"
#include "mapgen/device/command.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/rendering/sprite_pipeline.hpp"
#include "mapgen/rendering/texture_slots.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>
#include <string>

namespace mapgen {

namespace {

// Enough for a few hundred outlined circles before the first growth
constexpr VkDeviceSize kInitialQuads = 1024;

// Outlines only ever use a handful of solid-color textures
constexpr uint32_t kTextureSlots = 64;

} // namespace

// ============================================================================
// Builder
// ============================================================================

SpriteBatch::Builder::Builder(LogicalDevice* device, VkRenderPass renderPass)
    : device_(device), renderPass_(renderPass) {
}

SpriteBatch::Builder& SpriteBatch::Builder::shaderDirectory(std::string path) {
    shaderDirectory_ = std::move(path);
    return *this;
}

SpriteBatch::Builder& SpriteBatch::Builder::framesInFlight(uint32_t count) {
    framesInFlight_ = count;
    return *this;
}

SpriteBatchPtr SpriteBatch::Builder::build() {
    if (!device_ || renderPass_ == VK_NULL_HANDLE) {
        throw std::runtime_error("SpriteBatch requires a device and a render pass");
    }
    if (shaderDirectory_.empty()) {
        throw std::runtime_error("SpriteBatch requires a shader directory");
    }
    if (framesInFlight_ == 0) {
        throw std::runtime_error("SpriteBatch needs at least one frame in flight");
    }

    auto batch = SpriteBatchPtr(new SpriteBatch());
    batch->device_ = device_;
    batch->pipeline_ = std::make_unique<SpritePipeline>(device_, renderPass_, shaderDirectory_);
    batch->slots_ = std::make_unique<TextureSlots>(device_, batch->pipeline_->textureLayout(),
                                                   kTextureSlots);

    VkDeviceSize bytes = kInitialQuads * kVerticesPerQuad * sizeof(SpriteVertex);
    for (uint32_t i = 0; i < framesInFlight_; i++) {
        batch->vertexBuffers_.push_back(Buffer::vertices(device_, bytes));
    }

    MAPGEN_INFO(LogCategory::Render, "Sprite batch created (" +
        std::to_string(framesInFlight_) + " frames in flight)");
    return batch;
}

// ============================================================================
// SpriteBatch
// ============================================================================

SpriteBatch::Builder SpriteBatch::create(LogicalDevice* device, VkRenderPass renderPass) {
    return Builder(device, renderPass);
}

SpriteBatch::~SpriteBatch() {
    MAPGEN_DEBUG(LogCategory::Render, "Sprite batch destroyed");
}

void SpriteBatch::begin() {
    if (active_) {
        throw std::logic_error("SpriteBatch::begin called twice without end");
    }
    vertices_.clear();
    runs_.clear();
    active_ = true;
}

void SpriteBatch::draw(const QuadDraw& quad) {
    if (!active_) {
        throw std::logic_error("SpriteBatch::draw called outside begin/end");
    }

    auto* texture = dynamic_cast<const GpuTexture*>(quad.texture);
    if (!texture) {
        throw std::invalid_argument("SpriteBatch::draw: texture was not created by this batch");
    }

    uint32_t firstVertex = static_cast<uint32_t>(vertices_.size());
    appendQuadVertices(quad, texture->width(), texture->height(), vertices_);

    if (!runs_.empty() && runs_.back().texture == texture->slot()) {
        runs_.back().vertexCount += kVerticesPerQuad;
    } else {
        runs_.push_back(Run{texture->slot(), firstVertex, kVerticesPerQuad});
    }
}

SpriteTexturePtr SpriteBatch::createSolidColor(uint32_t width, uint32_t height,
                                               const Color& color) {
    TextureContext context{device_, device_->commandPool(), slots_.get()};
    return GpuTexture::solidColor(context, width, height, color);
}

Buffer& SpriteBatch::vertexBufferFor(uint32_t frameIndex) {
    VkDeviceSize needed = vertices_.size() * sizeof(SpriteVertex);
    BufferPtr& buffer = vertexBuffers_[frameIndex];
    if (buffer->size() < needed) {
        // This slot's fence was waited on before the frame began, so the old buffer is idle
        VkDeviceSize grown = buffer->size();
        while (grown < needed) {
            grown *= 2;
        }
        buffer = Buffer::vertices(device_, grown);
        MAPGEN_DEBUG(LogCategory::Render, "Vertex buffer for frame " + std::to_string(frameIndex) +
                     " grown to " + std::to_string(grown) + " bytes");
    }
    return *buffer;
}

void SpriteBatch::end(CommandBuffer& cmd, VkExtent2D extent, uint32_t frameIndex) {
    if (!active_) {
        throw std::logic_error("SpriteBatch::end called without begin");
    }
    if (frameIndex >= vertexBuffers_.size()) {
        throw std::out_of_range("SpriteBatch::end: frame index " + std::to_string(frameIndex) +
                                " exceeds frames in flight");
    }
    active_ = false;
    lastDrawCalls_ = 0;

    if (vertices_.empty()) {
        return;
    }

    Buffer& vertexBuffer = vertexBufferFor(frameIndex);
    vertexBuffer.write(vertices_.data(), vertices_.size() * sizeof(SpriteVertex));

    pipeline_->bind(cmd, extent);
    cmd.bindVertexBuffer(vertexBuffer);
    for (const Run& run : runs_) {
        pipeline_->bindTexture(cmd, run.texture);
        cmd.draw(run.vertexCount, run.firstVertex);
        lastDrawCalls_++;
    }

    MAPGEN_TRACE(LogCategory::Render, std::to_string(pendingQuads()) + " quads in " +
        std::to_string(lastDrawCalls_) + " draw calls");
}

} // namespace mapgen
