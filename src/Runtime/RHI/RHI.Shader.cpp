module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

module RHI:Shader.Impl;
import :Shader;
import Core;

namespace RHI
{
    namespace
    {
        constexpr uint32_t kSpirvMagic = 0x07230203;
        constexpr size_t kHeaderWords = 5;

        // Opcodes
        constexpr uint32_t OpTypeImage = 25;
        constexpr uint32_t OpTypeSampler = 26;
        constexpr uint32_t OpTypeSampledImage = 27;
        constexpr uint32_t OpTypeArray = 28;
        constexpr uint32_t OpTypeRuntimeArray = 29;
        constexpr uint32_t OpTypeStruct = 30;
        constexpr uint32_t OpTypePointer = 32;
        constexpr uint32_t OpVariable = 59;
        constexpr uint32_t OpDecorate = 71;

        // Decorations
        constexpr uint32_t DecorationBlock = 2;
        constexpr uint32_t DecorationBufferBlock = 3;
        constexpr uint32_t DecorationBuiltIn = 11;
        constexpr uint32_t DecorationLocation = 30;
        constexpr uint32_t DecorationBinding = 33;
        constexpr uint32_t DecorationDescriptorSet = 34;

        // Storage classes
        constexpr uint32_t StorageUniformConstant = 0;
        constexpr uint32_t StorageInput = 1;
        constexpr uint32_t StorageUniform = 2;
        constexpr uint32_t StorageStorageBuffer = 12;

        struct Decorations
        {
            std::optional<uint32_t> Location;
            std::optional<uint32_t> Binding;
            std::optional<uint32_t> Set;
            bool BuiltIn = false;
            bool Block = false;
            bool BufferBlock = false;
        };

        enum class TypeClass : uint8_t { Image, Sampler, SampledImage, Array, Struct, Pointer };

        struct TypeInfo
        {
            TypeClass Class;
            uint32_t Inner = 0;        // element type (Array) / pointee (Pointer)
            uint32_t StorageClass = 0; // Pointer only
            uint32_t Sampled = 1;      // Image only: 1 = sampled, 2 = storage
        };

        struct Variable
        {
            uint32_t Id;
            uint32_t PointerType;
            uint32_t StorageClass;
        };
    }

    ShaderModule::ShaderModule(VulkanDevice& device, std::vector<uint32_t> code, ShaderStage stage)
        : m_Device(device), m_Code(std::move(code)), m_Stage(stage)
    {
        if (m_Code.empty()) return;

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = m_Code.size() * sizeof(uint32_t);
        createInfo.pCode = m_Code.data();

        if (vkCreateShaderModule(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_Module) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module ({} words)!", m_Code.size());
            m_Module = VK_NULL_HANDLE;
        }
    }

    ShaderModule::~ShaderModule()
    {
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }

    Core::Expected<std::unique_ptr<ShaderModule>> ShaderModule::Load(
        VulkanDevice& device, const std::filesystem::path& path, ShaderStage stage)
    {
        auto bytes = Core::Filesystem::ReadBinaryFile(path);
        if (!bytes)
        {
            Core::Log::Error("Failed to open shader file: {}", path.string());
            return std::unexpected(bytes.error());
        }

        if (bytes->size() < kHeaderWords * sizeof(uint32_t) || bytes->size() % sizeof(uint32_t) != 0)
        {
            Core::Log::Error("Shader '{}' is not a SPIR-V binary ({} bytes).", path.string(), bytes->size());
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        std::vector<uint32_t> words(bytes->size() / sizeof(uint32_t));
        std::memcpy(words.data(), bytes->data(), bytes->size());
        if (words[0] != kSpirvMagic)
        {
            Core::Log::Error("Shader '{}' has a bad SPIR-V magic number {:#x}.", path.string(), words[0]);
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        auto module = std::make_unique<ShaderModule>(device, std::move(words), stage);
        if (!module->IsValid())
        {
            Core::Log::Error("Driver rejected shader module: {}", path.string());
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }
        return module;
    }

    VkPipelineShaderStageCreateInfo ShaderModule::GetStageInfo() const
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = (m_Stage == ShaderStage::Vertex) ? VK_SHADER_STAGE_VERTEX_BIT : VK_SHADER_STAGE_FRAGMENT_BIT;
        info.module = m_Module;
        info.pName = "main";
        return info;
    }

    bool ShaderInterface::HasInput(uint32_t location) const
    {
        return std::binary_search(InputLocations.begin(), InputLocations.end(), location);
    }

    std::optional<ShaderResourceBinding> ShaderInterface::FindResource(uint32_t set, uint32_t binding) const
    {
        for (const auto& resource : Resources)
        {
            if (resource.Set == set && resource.Binding == binding) return resource;
        }
        return std::nullopt;
    }

    Core::Expected<ShaderInterface> ReflectShaderInterface(std::span<const uint32_t> words)
    {
        if (words.size() < kHeaderWords || words[0] != kSpirvMagic)
        {
            Core::Log::Error("ReflectShaderInterface: not a SPIR-V module ({} words).", words.size());
            return std::unexpected(Core::ErrorCode::InvalidFormat);
        }

        std::unordered_map<uint32_t, Decorations> decorations;
        std::unordered_map<uint32_t, TypeInfo> types;
        std::vector<Variable> variables;

        size_t i = kHeaderWords;
        while (i < words.size())
        {
            const uint32_t wordCount = words[i] >> 16;
            const uint32_t opcode = words[i] & 0xFFFFu;
            if (wordCount == 0 || i + wordCount > words.size())
            {
                Core::Log::Error("ReflectShaderInterface: truncated instruction at word {}.", i);
                return std::unexpected(Core::ErrorCode::InvalidFormat);
            }

            const auto operand = [&](uint32_t n) { return n < wordCount ? words[i + n] : 0u; };

            switch (opcode)
            {
            case OpDecorate:
            {
                auto& deco = decorations[operand(1)];
                switch (operand(2))
                {
                case DecorationLocation: deco.Location = operand(3); break;
                case DecorationBinding: deco.Binding = operand(3); break;
                case DecorationDescriptorSet: deco.Set = operand(3); break;
                case DecorationBuiltIn: deco.BuiltIn = true; break;
                case DecorationBlock: deco.Block = true; break;
                case DecorationBufferBlock: deco.BufferBlock = true; break;
                default: break;
                }
                break;
            }
            case OpTypeImage:
                types[operand(1)] = {TypeClass::Image, 0, 0, operand(7)};
                break;
            case OpTypeSampler:
                types[operand(1)] = {TypeClass::Sampler};
                break;
            case OpTypeSampledImage:
                types[operand(1)] = {TypeClass::SampledImage};
                break;
            case OpTypeArray:
            case OpTypeRuntimeArray:
                types[operand(1)] = {TypeClass::Array, operand(2)};
                break;
            case OpTypeStruct:
                types[operand(1)] = {TypeClass::Struct};
                break;
            case OpTypePointer:
                types[operand(1)] = {TypeClass::Pointer, operand(3), operand(2)};
                break;
            case OpVariable:
                variables.push_back({operand(2), operand(1), operand(3)});
                break;
            default:
                break;
            }

            i += wordCount;
        }

        ShaderInterface result;
        for (const auto& var : variables)
        {
            auto decoIt = decorations.find(var.Id);
            if (decoIt == decorations.end()) continue;
            const Decorations& deco = decoIt->second;

            if (var.StorageClass == StorageInput)
            {
                if (deco.Location && !deco.BuiltIn) result.InputLocations.push_back(*deco.Location);
                continue;
            }

            if (var.StorageClass != StorageUniformConstant && var.StorageClass != StorageUniform &&
                var.StorageClass != StorageStorageBuffer)
                continue;
            if (!deco.Binding) continue;

            // Pointer -> pointee, then strip arrays.
            uint32_t typeId = 0;
            if (auto ptr = types.find(var.PointerType); ptr != types.end() && ptr->second.Class == TypeClass::Pointer)
                typeId = ptr->second.Inner;
            auto typeIt = types.find(typeId);
            while (typeIt != types.end() && typeIt->second.Class == TypeClass::Array)
            {
                typeId = typeIt->second.Inner;
                typeIt = types.find(typeId);
            }

            DescriptorKind kind = DescriptorKind::Unknown;
            if (typeIt != types.end())
            {
                switch (typeIt->second.Class)
                {
                case TypeClass::Struct:
                {
                    const auto& typeDeco = decorations[typeId];
                    if (var.StorageClass == StorageStorageBuffer || typeDeco.BufferBlock)
                        kind = DescriptorKind::StorageBuffer;
                    else if (typeDeco.Block)
                        kind = DescriptorKind::UniformBuffer;
                    break;
                }
                case TypeClass::Image:
                    kind = typeIt->second.Sampled == 1 ? DescriptorKind::SampledImage : DescriptorKind::Unknown;
                    break;
                case TypeClass::Sampler: kind = DescriptorKind::Sampler; break;
                case TypeClass::SampledImage: kind = DescriptorKind::CombinedImageSampler; break;
                default: break;
                }
            }

            result.Resources.push_back({deco.Set.value_or(0), *deco.Binding, kind});
        }

        std::sort(result.InputLocations.begin(), result.InputLocations.end());
        result.InputLocations.erase(std::unique(result.InputLocations.begin(), result.InputLocations.end()),
                                    result.InputLocations.end());
        std::sort(result.Resources.begin(), result.Resources.end());
        return result;
    }
}
