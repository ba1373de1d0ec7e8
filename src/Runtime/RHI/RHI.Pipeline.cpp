module;
#include "RHI.Vulkan.hpp"
#include <vector>
#include <memory>

module RHI:Pipeline.Impl;
import :Pipeline;
import Core;

namespace RHI
{
    GraphicsPipeline::GraphicsPipeline(VulkanDevice& device, const PipelineConfig& config)
        : m_Device(device), m_ColorFormat(config.ColorFormat)
    {
        if (CreateLayout(config.SetLayouts))
        {
            CreatePipeline(config);
        }
    }

    GraphicsPipeline::~GraphicsPipeline()
    {
        // Previous frames may still be executing with this pipeline bound.
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkPipeline pipeline = m_Pipeline;
        VkPipelineLayout layout = m_Layout;
        m_Device.SafeDestroy([logicalDevice, pipeline, layout]()
        {
            if (pipeline) vkDestroyPipeline(logicalDevice, pipeline, nullptr);
            if (layout) vkDestroyPipelineLayout(logicalDevice, layout, nullptr);
        });
    }

    Core::Expected<std::unique_ptr<GraphicsPipeline>> GraphicsPipeline::Create(VulkanDevice& device,
                                                                               const PipelineConfig& config)
    {
        if (!config.VertexShader || !config.FragmentShader || !config.VertexShader->IsValid() ||
            !config.FragmentShader->IsValid())
        {
            Core::Log::Error("GraphicsPipeline::Create(): missing or invalid shader stage.");
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }
        if (config.ColorFormat == VK_FORMAT_UNDEFINED)
        {
            Core::Log::Error("GraphicsPipeline::Create(): undefined color attachment format.");
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        auto pipeline = std::make_unique<GraphicsPipeline>(device, config);
        if (!pipeline->IsValid())
        {
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }
        return pipeline;
    }

    bool GraphicsPipeline::CreateLayout(const std::vector<VkDescriptorSetLayout>& descriptorLayouts)
    {
        VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
        pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(descriptorLayouts.size());
        pipelineLayoutInfo.pSetLayouts = descriptorLayouts.data();
        pipelineLayoutInfo.pushConstantRangeCount = 0;

        if (vkCreatePipelineLayout(m_Device.GetLogicalDevice(), &pipelineLayoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create pipeline layout ({} sets)!", descriptorLayouts.size());
            m_Layout = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    void GraphicsPipeline::CreatePipeline(const PipelineConfig& config)
    {
        // 1. Shaders
        VkPipelineShaderStageCreateInfo shaderStages[] = {
            config.VertexShader->GetStageInfo(),
            config.FragmentShader->GetStageInfo()
        };

        // 2. Vertex Input
        VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
        vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vertexInputInfo.vertexBindingDescriptionCount = static_cast<uint32_t>(config.BindingDescriptions.size());
        vertexInputInfo.pVertexBindingDescriptions = config.BindingDescriptions.data();
        vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(config.AttributeDescriptions.size());
        vertexInputInfo.pVertexAttributeDescriptions = config.AttributeDescriptions.data();

        // 3. Input Assembly
        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = config.Topology;
        inputAssembly.primitiveRestartEnable = VK_FALSE;

        // 4. Viewport & Scissor (Dynamic State)
        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        // 5. Rasterizer
        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.depthClampEnable = VK_FALSE;
        rasterizer.rasterizerDiscardEnable = VK_FALSE;
        rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = config.CullMode;
        rasterizer.frontFace = config.FrontFace;

        // 6. Multisampling
        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.sampleShadingEnable = VK_FALSE;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        // 7. Color Blending
        VkPipelineColorBlendAttachmentState colorBlendAttachment{};
        colorBlendAttachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
            VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        colorBlendAttachment.blendEnable = VK_FALSE; // Opaque

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.logicOpEnable = VK_FALSE;
        colorBlending.attachmentCount = 1;
        colorBlending.pAttachments = &colorBlendAttachment;

        // 8. Dynamic States
        const std::vector<VkDynamicState> dynamicStates = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR
        };
        VkPipelineDynamicStateCreateInfo dynamicState{};
        dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
        dynamicState.pDynamicStates = dynamicStates.data();

        // 9. Depth
        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthTestEnable = config.DepthTest ? VK_TRUE : VK_FALSE;
        depthStencil.depthWriteEnable = config.DepthWrite ? VK_TRUE : VK_FALSE;
        depthStencil.depthCompareOp = VK_COMPARE_OP_LESS; // Close things obscure far things
        depthStencil.depthBoundsTestEnable = VK_FALSE;
        depthStencil.stencilTestEnable = VK_FALSE;

        VkFormat colorFormat = config.ColorFormat;

        VkPipelineRenderingCreateInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
        renderingInfo.colorAttachmentCount = 1;
        renderingInfo.pColorAttachmentFormats = &colorFormat;
        renderingInfo.depthAttachmentFormat = config.DepthFormat;

        // 10. Create
        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.pNext = &renderingInfo; // No VkRenderPass
        pipelineInfo.stageCount = 2;
        pipelineInfo.pStages = shaderStages;
        pipelineInfo.pVertexInputState = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.layout = m_Layout;
        pipelineInfo.renderPass = VK_NULL_HANDLE;
        pipelineInfo.subpass = 0;

        if (VkResult result = vkCreateGraphicsPipelines(m_Device.GetLogicalDevice(), VK_NULL_HANDLE, 1,
                                                        &pipelineInfo, nullptr, &m_Pipeline); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create graphics pipeline! result={}", static_cast<int>(result));
            m_Pipeline = VK_NULL_HANDLE;
        }
    }
}
