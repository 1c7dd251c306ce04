#pragma once

#include <memory>

namespace mapgen {

// Device layer
class Instance;
class PhysicalDevice;
class LogicalDevice;
class Queue;
class Buffer;
class Image;
class ImageView;
class CommandPool;
class CommandBuffer;

// Presentation and frame pacing
class Window;
class SwapChain;
class PresentPass;
class Semaphore;
class Fence;
class FrameRenderer;

// Sprite drawing
class SpritePipeline;
class TextureSlots;
class GpuTexture;
class SpriteBatch;

// Owning handles; every object above is created through a factory or builder
// that returns one of these.
using InstancePtr = std::unique_ptr<Instance>;
using LogicalDevicePtr = std::unique_ptr<LogicalDevice>;
using BufferPtr = std::unique_ptr<Buffer>;
using ImagePtr = std::unique_ptr<Image>;
using ImageViewPtr = std::unique_ptr<ImageView>;
using CommandPoolPtr = std::unique_ptr<CommandPool>;
using CommandBufferPtr = std::unique_ptr<CommandBuffer>;

using WindowPtr = std::unique_ptr<Window>;
using SwapChainPtr = std::unique_ptr<SwapChain>;
using PresentPassPtr = std::unique_ptr<PresentPass>;
using SemaphorePtr = std::unique_ptr<Semaphore>;
using FencePtr = std::unique_ptr<Fence>;
using FrameRendererPtr = std::unique_ptr<FrameRenderer>;

using SpritePipelinePtr = std::unique_ptr<SpritePipeline>;
using TextureSlotsPtr = std::unique_ptr<TextureSlots>;
using GpuTexturePtr = std::unique_ptr<GpuTexture>;
using SpriteBatchPtr = std::unique_ptr<SpriteBatch>;

} // namespace mapgen
