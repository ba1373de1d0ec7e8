module;
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

export module Graphics:RenderPipelineSet;

import RHI;
import Core;

export namespace Graphics
{
    // Set numbers shared by the shaders and every component owning a layout.
    inline constexpr uint32_t kCameraSet = 0;
    inline constexpr uint32_t kLightSet = 1;
    inline constexpr uint32_t kMaterialSet = 2;
    inline constexpr uint32_t kInstanceSet = 3;

    // Non-owning; each layout belongs to the component whose data it describes.
    struct PipelineSetLayouts
    {
        const RHI::DescriptorLayout* Camera = nullptr;
        const RHI::DescriptorLayout* Light = nullptr;
        const RHI::DescriptorLayout* Material = nullptr;
        const RHI::DescriptorLayout* Instance = nullptr;
    };

    // Checks a vertex/fragment pair against the layouts it will be built with:
    //  - vertex shader input locations == attribute locations, exactly;
    //  - every descriptor either stage declares exists in setBindings[set] with the same
    //    type and a stage mask that includes the declaring stage.
    // Mismatches are logged and reported as ShaderInterfaceMismatch.
    [[nodiscard]] Core::Result ValidatePipelineInterface(
        const RHI::ShaderInterface& vertex,
        const RHI::ShaderInterface& fragment,
        std::span<const VkVertexInputAttributeDescription> attributes,
        std::span<const std::vector<VkDescriptorSetLayoutBinding>> setBindings);

    // -------------------------------------------------------------------------
    // RenderPipelineSet
    // -------------------------------------------------------------------------
    // Owns the mesh pipeline (sets 0..3, vertex locations 0..4) and the light
    // marker pipeline (sets 0..1, location 0). Both are immutable; a surface format
    // change replaces them through Rebuild().
    class RenderPipelineSet
    {
    public:
        ~RenderPipelineSet();

        RenderPipelineSet(const RenderPipelineSet&) = delete;
        RenderPipelineSet& operator=(const RenderPipelineSet&) = delete;

        // Loads mesh.{vert,frag}.spv and light.{vert,frag}.spv from shaderDirectory.
        // Errors: FileNotFound/FileReadError, ShaderCompilationFailed,
        // ShaderInterfaceMismatch, PipelineCreationFailed. None of them is retried.
        [[nodiscard]] static Core::Expected<std::unique_ptr<RenderPipelineSet>> Build(
            RHI::GpuContext& context, VkFormat colorFormat, const PipelineSetLayouts& layouts,
            const std::filesystem::path& shaderDirectory);

        [[nodiscard]] bool IsCompatible(VkFormat colorFormat) const { return colorFormat == m_ColorFormat; }
        [[nodiscard]] Core::Result Rebuild(VkFormat colorFormat);

        [[nodiscard]] const RHI::GraphicsPipeline& GetMeshPipeline() const { return *m_MeshPipeline; }
        [[nodiscard]] const RHI::GraphicsPipeline& GetMarkerPipeline() const { return *m_MarkerPipeline; }
        [[nodiscard]] VkFormat GetColorFormat() const { return m_ColorFormat; }
        [[nodiscard]] VkFormat GetDepthFormat() const { return m_DepthFormat; }
        [[nodiscard]] uint32_t GetBuildCount() const { return m_BuildCount; }

    private:
        RenderPipelineSet(RHI::GpuContext& context, const PipelineSetLayouts& layouts);

        RHI::GpuContext& m_Context;
        PipelineSetLayouts m_Layouts;

        std::unique_ptr<RHI::ShaderModule> m_MeshVertex;
        std::unique_ptr<RHI::ShaderModule> m_MeshFragment;
        std::unique_ptr<RHI::ShaderModule> m_MarkerVertex;
        std::unique_ptr<RHI::ShaderModule> m_MarkerFragment;

        std::unique_ptr<RHI::GraphicsPipeline> m_MeshPipeline;
        std::unique_ptr<RHI::GraphicsPipeline> m_MarkerPipeline;

        VkFormat m_ColorFormat = VK_FORMAT_UNDEFINED;
        VkFormat m_DepthFormat = VK_FORMAT_UNDEFINED;
        uint32_t m_BuildCount = 0;

        [[nodiscard]] Core::Result LoadShaders(const std::filesystem::path& shaderDirectory);
        [[nodiscard]] Core::Result ValidateInterfaces() const;
    };
}
