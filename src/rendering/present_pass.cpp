#include "mapgen/rendering/present_pass.hpp"
#include "mapgen/rendering/swapchain.hpp"
#include "mapgen/device/command.hpp"
#include "mapgen/device/image.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>
#include <string>

namespace mapgen {

PresentPass::PresentPass(LogicalDevice* device, const SwapChain& swapChain)
    : device_(device), format_(swapChain.format()) {
    VkAttachmentDescription color{};
    color.format = format_;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference target{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    VkSubpassDescription sprites{};
    sprites.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    sprites.colorAttachmentCount = 1;
    sprites.pColorAttachments = &target;

    // The clear must not start before acquire has released the image
    VkSubpassDependency acquired{};
    acquired.srcSubpass = VK_SUBPASS_EXTERNAL;
    acquired.dstSubpass = 0;
    acquired.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    acquired.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    acquired.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    info.attachmentCount = 1;
    info.pAttachments = &color;
    info.subpassCount = 1;
    info.pSubpasses = &sprites;
    info.dependencyCount = 1;
    info.pDependencies = &acquired;
    if (vkCreateRenderPass(device_->handle(), &info, nullptr, &renderPass_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create present pass");
    }

    try {
        attach(swapChain);
    } catch (const std::exception&) {
        destroyFramebuffers();
        vkDestroyRenderPass(device_->handle(), renderPass_, nullptr);
        throw;
    }
}

PresentPass::~PresentPass() {
    destroyFramebuffers();
    vkDestroyRenderPass(device_->handle(), renderPass_, nullptr);
}

void PresentPass::destroyFramebuffers() {
    for (VkFramebuffer framebuffer : framebuffers_) {
        vkDestroyFramebuffer(device_->handle(), framebuffer, nullptr);
    }
    framebuffers_.clear();
}

void PresentPass::attach(const SwapChain& swapChain) {
    if (swapChain.format() != format_) {
        throw std::runtime_error("Swap chain format changed; the present pass cannot follow it");
    }

    destroyFramebuffers();
    extent_ = swapChain.extent();

    for (const ImageViewPtr& view : swapChain.views()) {
        VkImageView attachment = view->handle();

        VkFramebufferCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        info.renderPass = renderPass_;
        info.attachmentCount = 1;
        info.pAttachments = &attachment;
        info.width = extent_.width;
        info.height = extent_.height;
        info.layers = 1;

        VkFramebuffer framebuffer = VK_NULL_HANDLE;
        if (vkCreateFramebuffer(device_->handle(), &info, nullptr, &framebuffer) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create framebuffer");
        }
        framebuffers_.push_back(framebuffer);
    }

    MAPGEN_DEBUG(LogCategory::Vulkan, "Present pass attached to " +
                 std::to_string(framebuffers_.size()) + " images");
}

void PresentPass::begin(CommandBuffer& cmd, uint32_t imageIndex, const Color& clearColor) {
    if (imageIndex >= framebuffers_.size()) {
        throw std::out_of_range("PresentPass::begin: no framebuffer for image " +
                                std::to_string(imageIndex));
    }

    VkClearValue clear{};
    clear.color = {{clearColor.r, clearColor.g, clearColor.b, clearColor.a}};

    VkRenderPassBeginInfo info{};
    info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    info.renderPass = renderPass_;
    info.framebuffer = framebuffers_[imageIndex];
    info.renderArea.extent = extent_;
    info.clearValueCount = 1;
    info.pClearValues = &clear;
    vkCmdBeginRenderPass(cmd.handle(), &info, VK_SUBPASS_CONTENTS_INLINE);
}

void PresentPass::end(CommandBuffer& cmd) {
    vkCmdEndRenderPass(cmd.handle());
}

} // namespace mapgen
