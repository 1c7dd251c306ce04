#include "mapgen/rendering/sprite_pipeline.hpp"
#include "mapgen/device/command.hpp"
#include "mapgen/device/logical_device.hpp"
#include "mapgen/primitives/sprite_vertex.hpp"
#include "mapgen/core/logging.hpp"

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace mapgen {

namespace {

/// Shader module that only lives while the pipeline is being created
class ShaderStage {
public:
    ShaderStage(VkDevice device, const std::string& path) : device_(device) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            throw std::runtime_error("Cannot open shader " + path);
        }
        std::streamsize bytes = file.tellg();
        if (bytes <= 0 || bytes % 4 != 0) {
            throw std::runtime_error("Not a SPIR-V binary: " + path);
        }
        std::vector<uint32_t> words(static_cast<size_t>(bytes) / 4);
        file.seekg(0);
        if (!file.read(reinterpret_cast<char*>(words.data()), bytes)) {
            throw std::runtime_error("Cannot read shader " + path);
        }

        VkShaderModuleCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        info.codeSize = static_cast<size_t>(bytes);
        info.pCode = words.data();
        if (vkCreateShaderModule(device_, &info, nullptr, &module_) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create shader module from " + path);
        }
        MAPGEN_DEBUG(LogCategory::Vulkan, "Loaded shader " + path);
    }

    ~ShaderStage() { vkDestroyShaderModule(device_, module_, nullptr); }

    VkPipelineShaderStageCreateInfo stage(VkShaderStageFlagBits which) const {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = which;
        info.module = module_;
        info.pName = "main";
        return info;
    }

    ShaderStage(const ShaderStage&) = delete;
    ShaderStage& operator=(const ShaderStage&) = delete;

private:
    VkDevice device_;
    VkShaderModule module_ = VK_NULL_HANDLE;
};

} // namespace

SpritePipeline::SpritePipeline(LogicalDevice* device, VkRenderPass renderPass,
                               const std::string& shaderDirectory)
    : device_(device) {
    if (!device_ || renderPass == VK_NULL_HANDLE) {
        throw std::runtime_error("SpritePipeline needs a device and a render pass");
    }
    VkDevice vk = device_->handle();

    try {
        VkDescriptorSetLayoutBinding sampler{};
        sampler.binding = 0;
        sampler.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        sampler.descriptorCount = 1;
        sampler.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;

        VkDescriptorSetLayoutCreateInfo setInfo{};
        setInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        setInfo.bindingCount = 1;
        setInfo.pBindings = &sampler;
        if (vkCreateDescriptorSetLayout(vk, &setInfo, nullptr, &textureLayout_) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create sprite texture layout");
        }

        VkPushConstantRange projection{VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(glm::mat4)};

        VkPipelineLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        layoutInfo.setLayoutCount = 1;
        layoutInfo.pSetLayouts = &textureLayout_;
        layoutInfo.pushConstantRangeCount = 1;
        layoutInfo.pPushConstantRanges = &projection;
        if (vkCreatePipelineLayout(vk, &layoutInfo, nullptr, &layout_) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create sprite pipeline layout");
        }

        ShaderStage vertex(vk, shaderDirectory + "/sprite.vert.spv");
        ShaderStage fragment(vk, shaderDirectory + "/sprite.frag.spv");
        VkPipelineShaderStageCreateInfo stages[] = {
            vertex.stage(VK_SHADER_STAGE_VERTEX_BIT),
            fragment.stage(VK_SHADER_STAGE_FRAGMENT_BIT),
        };

        VkVertexInputBindingDescription binding{0, sizeof(SpriteVertex), VK_VERTEX_INPUT_RATE_VERTEX};
        VkVertexInputAttributeDescription attributes[] = {
            {0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(SpriteVertex, position)},
            {1, 0, VK_FORMAT_R32G32_SFLOAT, offsetof(SpriteVertex, texCoord)},
            {2, 0, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(SpriteVertex, color)},
        };

        VkPipelineVertexInputStateCreateInfo input{};
        input.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        input.vertexBindingDescriptionCount = 1;
        input.pVertexBindingDescriptions = &binding;
        input.vertexAttributeDescriptionCount = 3;
        input.pVertexAttributeDescriptions = attributes;

        VkPipelineInputAssemblyStateCreateInfo triangles{};
        triangles.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        triangles.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

        VkPipelineViewportStateCreateInfo viewport{};
        viewport.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewport.viewportCount = 1;
        viewport.scissorCount = 1;

        // Flipped or mirrored quads wind the other way, so culling stays off
        VkPipelineRasterizationStateCreateInfo raster{};
        raster.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        raster.polygonMode = VK_POLYGON_MODE_FILL;
        raster.cullMode = VK_CULL_MODE_NONE;
        raster.frontFace = VK_FRONT_FACE_CLOCKWISE;
        raster.lineWidth = 1.0f;

        VkPipelineMultisampleStateCreateInfo samples{};
        samples.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        samples.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        // Straight alpha over whatever is already in the target
        VkPipelineColorBlendAttachmentState over{};
        over.blendEnable = VK_TRUE;
        over.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        over.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        over.colorBlendOp = VK_BLEND_OP_ADD;
        over.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        over.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        over.alphaBlendOp = VK_BLEND_OP_ADD;
        over.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                              VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

        VkPipelineColorBlendStateCreateInfo blend{};
        blend.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        blend.attachmentCount = 1;
        blend.pAttachments = &over;

        VkDynamicState dynamic[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
        VkPipelineDynamicStateCreateInfo dynamicInfo{};
        dynamicInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicInfo.dynamicStateCount = 2;
        dynamicInfo.pDynamicStates = dynamic;

        VkGraphicsPipelineCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        info.stageCount = 2;
        info.pStages = stages;
        info.pVertexInputState = &input;
        info.pInputAssemblyState = &triangles;
        info.pViewportState = &viewport;
        info.pRasterizationState = &raster;
        info.pMultisampleState = &samples;
        info.pColorBlendState = &blend;
        info.pDynamicState = &dynamicInfo;
        info.layout = layout_;
        info.renderPass = renderPass;
        info.subpass = 0;
        if (vkCreateGraphicsPipelines(vk, VK_NULL_HANDLE, 1, &info, nullptr, &pipeline_) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create sprite pipeline");
        }
    } catch (const std::exception&) {
        destroy();
        throw;
    }

    MAPGEN_DEBUG(LogCategory::Vulkan, "Sprite pipeline created");
}

SpritePipeline::~SpritePipeline() {
    destroy();
}

void SpritePipeline::destroy() {
    VkDevice vk = device_->handle();
    if (pipeline_ != VK_NULL_HANDLE) {
        vkDestroyPipeline(vk, pipeline_, nullptr);
        pipeline_ = VK_NULL_HANDLE;
    }
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(vk, layout_, nullptr);
        layout_ = VK_NULL_HANDLE;
    }
    if (textureLayout_ != VK_NULL_HANDLE) {
        vkDestroyDescriptorSetLayout(vk, textureLayout_, nullptr);
        textureLayout_ = VK_NULL_HANDLE;
    }
}

void SpritePipeline::bind(CommandBuffer& cmd, VkExtent2D extent) {
    VkCommandBuffer vk = cmd.handle();
    vkCmdBindPipeline(vk, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_);

    VkViewport viewport{0.0f, 0.0f,
                        static_cast<float>(extent.width), static_cast<float>(extent.height),
                        0.0f, 1.0f};
    VkRect2D scissor{{0, 0}, extent};
    vkCmdSetViewport(vk, 0, 1, &viewport);
    vkCmdSetScissor(vk, 0, 1, &scissor);

    glm::mat4 projection = pixelProjection(extent.width, extent.height);
    vkCmdPushConstants(vk, layout_, VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(projection), &projection);
}

void SpritePipeline::bindTexture(CommandBuffer& cmd, VkDescriptorSet texture) {
    vkCmdBindDescriptorSets(cmd.handle(), VK_PIPELINE_BIND_POINT_GRAPHICS, layout_,
                            0, 1, &texture, 0, nullptr);
}

} // namespace mapgen
