module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

module Graphics:RenderPipelineSet.Impl;
import :RenderPipelineSet;
import :Geometry;
import RHI;
import Core;

namespace Graphics
{
    namespace
    {
        Core::Result ValidateResources(const RHI::ShaderInterface& stage, VkShaderStageFlags stageBit,
                                       std::string_view stageName,
                                       std::span<const std::vector<VkDescriptorSetLayoutBinding>> setBindings)
        {
            for (const RHI::ShaderResourceBinding& resource : stage.Resources)
            {
                if (resource.Set >= setBindings.size())
                {
                    Core::Log::Error("{} shader uses set {} but the pipeline layout has {} sets.", stageName,
                                     resource.Set, setBindings.size());
                    return std::unexpected(Core::ErrorCode::ShaderInterfaceMismatch);
                }

                const auto& bindings = setBindings[resource.Set];
                auto it = std::find_if(bindings.begin(), bindings.end(), [&](const VkDescriptorSetLayoutBinding& b)
                {
                    return b.binding == resource.Binding;
                });
                if (it == bindings.end())
                {
                    Core::Log::Error("{} shader uses (set {}, binding {}) which no layout declares.", stageName,
                                     resource.Set, resource.Binding);
                    return std::unexpected(Core::ErrorCode::ShaderInterfaceMismatch);
                }

                const VkDescriptorType expected = RHI::ToVkDescriptorType(resource.Kind);
                if (it->descriptorType != expected)
                {
                    Core::Log::Error("{} shader (set {}, binding {}): shader type {} != layout type {}.", stageName,
                                     resource.Set, resource.Binding, static_cast<int>(expected),
                                     static_cast<int>(it->descriptorType));
                    return std::unexpected(Core::ErrorCode::ShaderInterfaceMismatch);
                }
                if ((it->stageFlags & stageBit) == 0)
                {
                    Core::Log::Error("{} shader (set {}, binding {}): layout binding is not visible to this stage.",
                                     stageName, resource.Set, resource.Binding);
                    return std::unexpected(Core::ErrorCode::ShaderInterfaceMismatch);
                }
            }
            return Core::Ok(Core::Unit{});
        }

        std::vector<VkDescriptorSetLayoutBinding> BindingsOf(const RHI::DescriptorLayout* layout)
        {
            return layout ? layout->GetBindings() : std::vector<VkDescriptorSetLayoutBinding>{};
        }
    }

    Core::Result ValidatePipelineInterface(const RHI::ShaderInterface& vertex,
                                           const RHI::ShaderInterface& fragment,
                                           std::span<const VkVertexInputAttributeDescription> attributes,
                                           std::span<const std::vector<VkDescriptorSetLayoutBinding>> setBindings)
    {
        std::vector<uint32_t> locations;
        locations.reserve(attributes.size());
        for (const auto& attribute : attributes) locations.push_back(attribute.location);
        std::sort(locations.begin(), locations.end());
        locations.erase(std::unique(locations.begin(), locations.end()), locations.end());

        if (locations != vertex.InputLocations)
        {
            Core::Log::Error("Vertex shader declares {} inputs, vertex layout provides {} attributes.",
                             vertex.InputLocations.size(), locations.size());
            for (uint32_t location : vertex.InputLocations)
            {
                if (!std::binary_search(locations.begin(), locations.end(), location))
                    Core::Log::Error("  shader input location {} has no vertex attribute.", location);
            }
            for (uint32_t location : locations)
            {
                if (!vertex.HasInput(location))
                    Core::Log::Error("  vertex attribute location {} is not consumed by the shader.", location);
            }
            return std::unexpected(Core::ErrorCode::ShaderInterfaceMismatch);
        }

        if (auto result = ValidateResources(vertex, VK_SHADER_STAGE_VERTEX_BIT, "Vertex", setBindings); !result)
            return result;
        return ValidateResources(fragment, VK_SHADER_STAGE_FRAGMENT_BIT, "Fragment", setBindings);
    }

    RenderPipelineSet::RenderPipelineSet(RHI::GpuContext& context, const PipelineSetLayouts& layouts)
        : m_Context(context), m_Layouts(layouts)
    {
    }

    RenderPipelineSet::~RenderPipelineSet() = default;

    Core::Expected<std::unique_ptr<RenderPipelineSet>> RenderPipelineSet::Build(
        RHI::GpuContext& context, VkFormat colorFormat, const PipelineSetLayouts& layouts,
        const std::filesystem::path& shaderDirectory)
    {
        if (!layouts.Camera || !layouts.Light || !layouts.Material || !layouts.Instance)
        {
            Core::Log::Error("RenderPipelineSet: every descriptor set layout must be provided.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        std::unique_ptr<RenderPipelineSet> set(new RenderPipelineSet(context, layouts));
        set->m_DepthFormat = context.GetSurfaceCapabilities().DepthFormat;

        if (auto loaded = set->LoadShaders(shaderDirectory); !loaded)
            return std::unexpected(loaded.error());

        // Validated once; the shaders and layouts never change afterwards.
        if (auto valid = set->ValidateInterfaces(); !valid)
            return std::unexpected(valid.error());

        if (auto built = set->Rebuild(colorFormat); !built)
            return std::unexpected(built.error());

        return set;
    }

    Core::Result RenderPipelineSet::LoadShaders(const std::filesystem::path& shaderDirectory)
    {
        RHI::VulkanDevice& device = m_Context.GetDevice();

        struct Entry
        {
            const char* File;
            RHI::ShaderStage Stage;
            std::unique_ptr<RHI::ShaderModule>* Target;
        };
        const std::array<Entry, 4> entries = {{
            {"mesh.vert.spv", RHI::ShaderStage::Vertex, &m_MeshVertex},
            {"mesh.frag.spv", RHI::ShaderStage::Fragment, &m_MeshFragment},
            {"light.vert.spv", RHI::ShaderStage::Vertex, &m_MarkerVertex},
            {"light.frag.spv", RHI::ShaderStage::Fragment, &m_MarkerFragment},
        }};

        for (const Entry& entry : entries)
        {
            const std::filesystem::path path = shaderDirectory / entry.File;
            auto shader = RHI::ShaderModule::Load(device, path, entry.Stage);
            if (!shader)
            {
                Core::Log::Error("RenderPipelineSet: cannot load '{}': {}", path.string(),
                                 Core::ErrorCodeToString(shader.error()));
                return std::unexpected(shader.error());
            }
            *entry.Target = std::move(*shader);
        }
        return Core::Ok(Core::Unit{});
    }

    Core::Result RenderPipelineSet::ValidateInterfaces() const
    {
        auto meshVertex = RHI::ReflectShaderInterface(m_MeshVertex->GetCode());
        auto meshFragment = RHI::ReflectShaderInterface(m_MeshFragment->GetCode());
        auto markerVertex = RHI::ReflectShaderInterface(m_MarkerVertex->GetCode());
        auto markerFragment = RHI::ReflectShaderInterface(m_MarkerFragment->GetCode());
        if (!meshVertex || !meshFragment || !markerVertex || !markerFragment)
        {
            Core::Log::Error("RenderPipelineSet: shader reflection failed.");
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        const auto attributes = GetVertexAttributeDescriptions();

        const std::vector<std::vector<VkDescriptorSetLayoutBinding>> meshSets = {
            BindingsOf(m_Layouts.Camera), BindingsOf(m_Layouts.Light),
            BindingsOf(m_Layouts.Material), BindingsOf(m_Layouts.Instance)};
        if (auto result = ValidatePipelineInterface(*meshVertex, *meshFragment, attributes, meshSets); !result)
        {
            Core::Log::Error("RenderPipelineSet: mesh shaders do not match the vertex/descriptor layouts.");
            return result;
        }

        const std::vector<std::vector<VkDescriptorSetLayoutBinding>> markerSets = {
            BindingsOf(m_Layouts.Camera), BindingsOf(m_Layouts.Light)};
        const std::span<const VkVertexInputAttributeDescription> positionOnly(attributes.data(), 1);
        if (auto result = ValidatePipelineInterface(*markerVertex, *markerFragment, positionOnly, markerSets); !result)
        {
            Core::Log::Error("RenderPipelineSet: light marker shaders do not match their layouts.");
            return result;
        }
        return Core::Ok(Core::Unit{});
    }

    Core::Result RenderPipelineSet::Rebuild(VkFormat colorFormat)
    {
        RHI::VulkanDevice& device = m_Context.GetDevice();
        const auto attributes = GetVertexAttributeDescriptions();

        RHI::PipelineConfig meshConfig;
        meshConfig.VertexShader = m_MeshVertex.get();
        meshConfig.FragmentShader = m_MeshFragment.get();
        meshConfig.BindingDescriptions = {GetVertexBindingDescription()};
        meshConfig.AttributeDescriptions.assign(attributes.begin(), attributes.end());
        meshConfig.SetLayouts = {m_Layouts.Camera->GetHandle(), m_Layouts.Light->GetHandle(),
                                 m_Layouts.Material->GetHandle(), m_Layouts.Instance->GetHandle()};
        meshConfig.ColorFormat = colorFormat;
        meshConfig.DepthFormat = m_DepthFormat;

        auto meshPipeline = RHI::GraphicsPipeline::Create(device, meshConfig);
        if (!meshPipeline)
        {
            Core::Log::Error("RenderPipelineSet: mesh pipeline creation failed (color format {}).",
                             static_cast<int>(colorFormat));
            return std::unexpected(meshPipeline.error());
        }

        RHI::PipelineConfig markerConfig = meshConfig;
        markerConfig.VertexShader = m_MarkerVertex.get();
        markerConfig.FragmentShader = m_MarkerFragment.get();
        markerConfig.AttributeDescriptions = {attributes[0]};
        markerConfig.SetLayouts = {m_Layouts.Camera->GetHandle(), m_Layouts.Light->GetHandle()};

        auto markerPipeline = RHI::GraphicsPipeline::Create(device, markerConfig);
        if (!markerPipeline)
        {
            Core::Log::Error("RenderPipelineSet: light marker pipeline creation failed (color format {}).",
                             static_cast<int>(colorFormat));
            return std::unexpected(markerPipeline.error());
        }

        // Old pipelines go through the deferred deletion queue.
        m_MeshPipeline = std::move(*meshPipeline);
        m_MarkerPipeline = std::move(*markerPipeline);
        m_ColorFormat = colorFormat;
        ++m_BuildCount;

        Core::Log::Info("RenderPipelineSet built for color format {} / depth format {}.",
                        static_cast<int>(m_ColorFormat), static_cast<int>(m_DepthFormat));
        return Core::Ok(Core::Unit{});
    }
}
