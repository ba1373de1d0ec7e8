module;
#include "RHI.Vulkan.hpp"
#include <memory>
#include <vector>

export module RHI:Pipeline;

import :Device;
import :Shader;
import Core;

export namespace RHI
{
    struct PipelineConfig
    {
        const ShaderModule* VertexShader = nullptr;
        const ShaderModule* FragmentShader = nullptr;

        std::vector<VkVertexInputBindingDescription> BindingDescriptions;
        std::vector<VkVertexInputAttributeDescription> AttributeDescriptions;
        // Index in this vector == descriptor set number.
        std::vector<VkDescriptorSetLayout> SetLayouts;

        VkFormat ColorFormat = VK_FORMAT_UNDEFINED;
        VkFormat DepthFormat = VK_FORMAT_UNDEFINED;

        VkPrimitiveTopology Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        VkCullModeFlags CullMode = VK_CULL_MODE_BACK_BIT;
        VkFrontFace FrontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        bool DepthTest = true;
        bool DepthWrite = true;
    };

    // Dynamic-rendering graphics pipeline; viewport and scissor are dynamic state.
    class GraphicsPipeline
    {
    public:
        GraphicsPipeline(VulkanDevice& device, const PipelineConfig& config);
        ~GraphicsPipeline();

        GraphicsPipeline(const GraphicsPipeline&) = delete;
        GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

        [[nodiscard]] static Core::Expected<std::unique_ptr<GraphicsPipeline>> Create(
            VulkanDevice& device, const PipelineConfig& config);

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }
        [[nodiscard]] VkFormat GetColorFormat() const { return m_ColorFormat; }
        [[nodiscard]] bool IsValid() const { return m_Pipeline != VK_NULL_HANDLE && m_Layout != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
        VkFormat m_ColorFormat = VK_FORMAT_UNDEFINED;

        bool CreateLayout(const std::vector<VkDescriptorSetLayout>& descriptorLayouts);
        void CreatePipeline(const PipelineConfig& config);
    };
}
