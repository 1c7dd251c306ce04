#pragma once

#include "mapgen/core/types.hpp"
#include "mapgen/high/gpu_texture.hpp"
#include "mapgen/primitives/quad_batch.hpp"
#include "mapgen/primitives/sprite_vertex.hpp"

#include <vulkan/vulkan.h>

#include <string>
#include <vector>

namespace mapgen {

/**
 * @brief Vulkan QuadBatch: expands quads on the CPU and draws them in
 * submission order
 *
 * Each frame:
 * @code
 * batch->begin();
 * batch->draw(quad);            // any number of times
 * batch->end(cmd, extent, frameIndex);
 * @endcode
 *
 * Consecutive quads sharing a texture become one draw call. Vertices live in
 * one host-visible buffer per frame in flight; a buffer doubles when a frame
 * submits more quads than it holds.
 */
class SpriteBatch : public QuadBatch, public TextureProvider {
public:
    class Builder {
    public:
        Builder(LogicalDevice* device, VkRenderPass renderPass);

        /// Directory holding sprite.vert.spv and sprite.frag.spv (required)
        Builder& shaderDirectory(std::string path);

        /// Must match the renderer's frames in flight (default 2)
        Builder& framesInFlight(uint32_t count);

        SpriteBatchPtr build();

    private:
        LogicalDevice* device_;
        VkRenderPass renderPass_;
        std::string shaderDirectory_;
        uint32_t framesInFlight_ = 2;
    };

    static Builder create(LogicalDevice* device, VkRenderPass renderPass);

    /// Start collecting quads for a frame
    void begin();

    /**
     * @brief Queue one quad
     * @throws std::logic_error outside begin()/end()
     * @throws std::invalid_argument if the texture was not created by this batch
     */
    void draw(const QuadDraw& quad) override;

    TextureProvider* textureProvider() override { return this; }

    SpriteTexturePtr createSolidColor(uint32_t width, uint32_t height,
                                      const Color& color) override;

    /**
     * @brief Upload the collected vertices and record the draws
     *
     * Must be called inside the render pass of the frame whose slot is
     * @p frameIndex.
     */
    void end(CommandBuffer& cmd, VkExtent2D extent, uint32_t frameIndex);

    bool isActive() const { return active_; }
    size_t pendingQuads() const { return vertices_.size() / kVerticesPerQuad; }

    /// Draw calls recorded by the last end()
    uint32_t lastDrawCalls() const { return lastDrawCalls_; }

    ~SpriteBatch() override;

    SpriteBatch(const SpriteBatch&) = delete;
    SpriteBatch& operator=(const SpriteBatch&) = delete;

private:
    SpriteBatch() = default;

    struct Run {
        VkDescriptorSet texture;
        uint32_t firstVertex;
        uint32_t vertexCount;
    };

    Buffer& vertexBufferFor(uint32_t frameIndex);

    LogicalDevice* device_ = nullptr;
    SpritePipelinePtr pipeline_;
    TextureSlotsPtr slots_;

    std::vector<BufferPtr> vertexBuffers_;  // one per frame in flight
    std::vector<SpriteVertex> vertices_;
    std::vector<Run> runs_;
    bool active_ = false;
    uint32_t lastDrawCalls_ = 0;
};

} // namespace mapgen
