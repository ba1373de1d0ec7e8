module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

module Graphics:ResourceUploader.Impl;
import :ResourceUploader;
import :Geometry;
import RHI;
import Core;

namespace Graphics
{
    ResourceUploader::ResourceUploader(RHI::GpuContext& context)
        : m_Context(context)
    {
        std::vector<VkDescriptorSetLayoutBinding> bindings(4);
        for (uint32_t i = 0; i < 4; ++i)
        {
            bindings[i].binding = i;
            bindings[i].descriptorType = (i % 2 == 0) ? VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE : VK_DESCRIPTOR_TYPE_SAMPLER;
            bindings[i].descriptorCount = 1;
            bindings[i].stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
        }

        m_MaterialLayout = std::make_unique<RHI::DescriptorLayout>(m_Context.GetDevice(), std::move(bindings));
        if (!m_MaterialLayout->IsValid())
        {
            Core::Log::Error("ResourceUploader: material descriptor layout creation failed.");
            return;
        }

        constexpr std::array<uint8_t, 4> white = {255, 255, 255, 255};
        constexpr std::array<uint8_t, 4> flatNormal = {128, 128, 255, 255};

        auto diffuse = UploadTexture(white, 1, 1, TextureFormat::Rgba8Srgb, "default-diffuse");
        auto normal = UploadTexture(flatNormal, 1, 1, TextureFormat::Rgba8Unorm, "default-normal");
        if (!diffuse || !normal)
        {
            Core::Log::Error("ResourceUploader: default textures could not be created.");
            return;
        }
        m_DefaultDiffuse = *diffuse;
        m_DefaultNormal = *normal;
        m_IsValid = true;
    }

    ResourceUploader::~ResourceUploader()
    {
        // Materials reference pool memory; drop them before the pools go.
        m_Materials.Clear();
        m_MaterialPools.clear();
        m_Textures.Clear();
        m_Meshes.Clear();
    }

    std::unique_ptr<RHI::VulkanBuffer> ResourceUploader::CreateStaging(const void* data, size_t size,
                                                                       std::string_view label)
    {
        auto staging = std::make_unique<RHI::VulkanBuffer>(m_Context.GetDevice(), size,
                                                           VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                                           VMA_MEMORY_USAGE_CPU_ONLY);
        if (!staging->IsValid() || !staging->Write(data, size))
        {
            Core::Log::Error("ResourceUploader: staging buffer of {} bytes for '{}' failed.", size, label);
            return nullptr;
        }
        return staging;
    }

    Core::Expected<MeshHandle> ResourceUploader::UploadMesh(std::span<const ModelVertex> vertices,
                                                           std::span<const uint32_t> indices,
                                                           std::string_view label)
    {
        if (vertices.empty() || indices.empty() || indices.size() % 3 != 0)
        {
            Core::Log::Error("UploadMesh '{}': invalid sizes (vertices={}, indices={}).", label, vertices.size(),
                             indices.size());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }
        for (uint32_t index : indices)
        {
            if (index >= vertices.size())
            {
                Core::Log::Error("UploadMesh '{}': index {} out of range ({} vertices).", label, index,
                                 vertices.size());
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }
        }

        const size_t vertexBytes = vertices.size_bytes();
        const size_t indexBytes = indices.size_bytes();
        RHI::VulkanDevice& device = m_Context.GetDevice();

        auto mesh = std::make_unique<GpuMesh>();
        mesh->Label = std::string(label);
        mesh->VertexCount = static_cast<uint32_t>(vertices.size());
        mesh->IndexCount = static_cast<uint32_t>(indices.size());
        mesh->VertexBuffer = std::make_unique<RHI::VulkanBuffer>(
            device, vertexBytes, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
            VMA_MEMORY_USAGE_GPU_ONLY);
        mesh->IndexBuffer = std::make_unique<RHI::VulkanBuffer>(
            device, indexBytes, VK_BUFFER_USAGE_INDEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
            VMA_MEMORY_USAGE_GPU_ONLY);

        if (!mesh->VertexBuffer->IsValid() || !mesh->IndexBuffer->IsValid())
        {
            Core::Log::Error("UploadMesh '{}': device buffer allocation failed ({} + {} bytes).", label, vertexBytes,
                             indexBytes);
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        // [vertices | indices] in one staging allocation.
        auto staging = std::make_unique<RHI::VulkanBuffer>(device, vertexBytes + indexBytes,
                                                           VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                                           VMA_MEMORY_USAGE_CPU_ONLY);
        if (!staging->IsValid() || !staging->Write(vertices.data(), vertexBytes) ||
            !staging->Write(indices.data(), indexBytes, vertexBytes))
        {
            Core::Log::Error("UploadMesh '{}': staging of {} bytes failed.", label, vertexBytes + indexBytes);
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        VkBuffer src = staging->GetHandle();
        VkBuffer vertexDst = mesh->VertexBuffer->GetHandle();
        VkBuffer indexDst = mesh->IndexBuffer->GetHandle();

        auto submitted = RHI::CommandUtils::SubmitDeferred(device, [&](VkCommandBuffer cmd)
        {
            VkBufferCopy vertexCopy{0, 0, vertexBytes};
            vkCmdCopyBuffer(cmd, src, vertexDst, 1, &vertexCopy);
            VkBufferCopy indexCopy{vertexBytes, 0, indexBytes};
            vkCmdCopyBuffer(cmd, src, indexDst, 1, &indexCopy);

            RHI::CommandUtils::BufferTransferBarrier(cmd, vertexDst, VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT,
                                                     VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT);
            RHI::CommandUtils::BufferTransferBarrier(cmd, indexDst, VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT,
                                                     VK_ACCESS_2_INDEX_READ_BIT);
        });
        if (!submitted)
        {
            Core::Log::Error("UploadMesh '{}': copy submission failed: {}", label,
                             Core::ErrorCodeToString(submitted.error()));
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        Core::Log::Debug("Uploaded mesh '{}' ({} vertices, {} indices).", label, mesh->VertexCount, mesh->IndexCount);
        return m_Meshes.Add(std::move(mesh));
    }

    Core::Expected<TextureHandle> ResourceUploader::UploadTexture(std::span<const uint8_t> pixels, uint32_t width,
                                                                 uint32_t height, TextureFormat format,
                                                                 std::string_view label)
    {
        const size_t expected = static_cast<size_t>(width) * height * 4;
        if (width == 0 || height == 0 || pixels.size() != expected)
        {
            Core::Log::Error("UploadTexture '{}': {}x{} needs {} bytes, got {}.", label, width, height, expected,
                             pixels.size());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        RHI::VulkanDevice& device = m_Context.GetDevice();

        auto texture = std::make_unique<GpuTexture>();
        texture->Label = std::string(label);
        texture->Resource = std::make_unique<RHI::Texture>(device, width, height, ToVkFormat(format));
        if (!texture->Resource->IsValid())
        {
            Core::Log::Error("UploadTexture '{}': image creation failed ({}x{}).", label, width, height);
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        auto staging = CreateStaging(pixels.data(), pixels.size(), label);
        if (!staging) return std::unexpected(Core::ErrorCode::ResourceUploadFailed);

        const RHI::Texture& resource = *texture->Resource;
        VkBuffer src = staging->GetHandle();
        auto submitted = RHI::CommandUtils::SubmitDeferred(device, [&](VkCommandBuffer cmd)
        {
            resource.RecordUpload(cmd, src);
        });
        if (!submitted)
        {
            Core::Log::Error("UploadTexture '{}': copy submission failed: {}", label,
                             Core::ErrorCodeToString(submitted.error()));
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        return m_Textures.Add(std::move(texture));
    }

    VkDescriptorSet ResourceUploader::AllocateMaterialSet()
    {
        if (m_MaterialPools.empty() || m_SetsInCurrentPool == kMaterialsPerPool)
        {
            std::vector<VkDescriptorPoolSize> sizes = {
                {VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE, 2 * kMaterialsPerPool},
                {VK_DESCRIPTOR_TYPE_SAMPLER, 2 * kMaterialsPerPool},
            };
            auto pool = std::make_unique<RHI::DescriptorPool>(m_Context.GetDevice(), sizes, kMaterialsPerPool);
            if (!pool->IsValid()) return VK_NULL_HANDLE;
            m_MaterialPools.push_back(std::move(pool));
            m_SetsInCurrentPool = 0;
        }

        VkDescriptorSet set = m_MaterialPools.back()->Allocate(m_MaterialLayout->GetHandle());
        if (set != VK_NULL_HANDLE) ++m_SetsInCurrentPool;
        return set;
    }

    Core::Expected<MaterialHandle> ResourceUploader::BuildMaterial(const MaterialDesc& desc)
    {
        const TextureHandle diffuseHandle = desc.Diffuse.IsValid() ? desc.Diffuse : m_DefaultDiffuse;
        const TextureHandle normalHandle = desc.Normal.IsValid() ? desc.Normal : m_DefaultNormal;

        auto diffuse = m_Textures.Get(diffuseHandle);
        auto normal = m_Textures.Get(normalHandle);
        if (!diffuse || !normal)
        {
            Core::Log::Error("BuildMaterial '{}': unknown texture handle (diffuse={}, normal={}).", desc.Name,
                             diffuseHandle, normalHandle);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        VkDescriptorSet set = AllocateMaterialSet();
        if (set == VK_NULL_HANDLE)
        {
            Core::Log::Error("BuildMaterial '{}': descriptor set allocation failed.", desc.Name);
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        const RHI::VulkanDevice& device = m_Context.GetDevice();
        const RHI::Texture& diffuseTexture = *(*diffuse)->Resource;
        const RHI::Texture& normalTexture = *(*normal)->Resource;
        RHI::WriteImageDescriptor(device, set, 0, diffuseTexture.GetView());
        RHI::WriteSamplerDescriptor(device, set, 1, diffuseTexture.GetSampler());
        RHI::WriteImageDescriptor(device, set, 2, normalTexture.GetView());
        RHI::WriteSamplerDescriptor(device, set, 3, normalTexture.GetSampler());

        auto material = std::make_unique<GpuMaterial>();
        material->Name = desc.Name;
        material->Diffuse = diffuseHandle;
        material->Normal = normalHandle;
        material->DescriptorSet = set;
        return m_Materials.Add(std::move(material));
    }
}
