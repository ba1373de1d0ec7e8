module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <vector>

export module RHI:Shader;

import :Device;
import Core;

export namespace RHI
{
    enum class ShaderStage { Vertex, Fragment };

    class ShaderModule
    {
    public:
        ShaderModule(VulkanDevice& device, std::vector<uint32_t> code, ShaderStage stage);
        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        // Reads a .spv file. FileNotFound/FileReadError for I/O, ShaderCompilationFailed when
        // the bytes are not SPIR-V or the driver rejects the module.
        [[nodiscard]] static Core::Expected<std::unique_ptr<ShaderModule>> Load(
            VulkanDevice& device, const std::filesystem::path& path, ShaderStage stage);

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;
        [[nodiscard]] std::span<const uint32_t> GetCode() const { return m_Code; }
        [[nodiscard]] ShaderStage GetStage() const { return m_Stage; }
        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        std::vector<uint32_t> m_Code;
        ShaderStage m_Stage;
    };

    // -------------------------------------------------------------------------
    // Minimal SPIR-V interface reflection
    // -------------------------------------------------------------------------
    // Walks the decoration and type sections of a module and reports the stage
    // inputs (by location) and the descriptor resources (set, binding, kind).
    // Built-ins and non-interface variables are ignored.
    enum class DescriptorKind : uint8_t
    {
        UniformBuffer,
        StorageBuffer,
        SampledImage,
        Sampler,
        CombinedImageSampler,
        Unknown
    };

    struct ShaderResourceBinding
    {
        uint32_t Set = 0;
        uint32_t Binding = 0;
        DescriptorKind Kind = DescriptorKind::Unknown;

        auto operator<=>(const ShaderResourceBinding&) const = default;
    };

    struct ShaderInterface
    {
        std::vector<uint32_t> InputLocations;          // sorted, unique
        std::vector<ShaderResourceBinding> Resources;  // sorted by (set, binding)

        [[nodiscard]] bool HasInput(uint32_t location) const;
        [[nodiscard]] std::optional<ShaderResourceBinding> FindResource(uint32_t set, uint32_t binding) const;
    };

    [[nodiscard]] Core::Expected<ShaderInterface> ReflectShaderInterface(std::span<const uint32_t> words);

    [[nodiscard]] constexpr VkDescriptorType ToVkDescriptorType(DescriptorKind kind)
    {
        switch (kind)
        {
            case DescriptorKind::UniformBuffer:        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            case DescriptorKind::StorageBuffer:        return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            case DescriptorKind::SampledImage:         return VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
            case DescriptorKind::Sampler:              return VK_DESCRIPTOR_TYPE_SAMPLER;
            case DescriptorKind::CombinedImageSampler: return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            default:                                   return VK_DESCRIPTOR_TYPE_MAX_ENUM;
        }
    }
}
