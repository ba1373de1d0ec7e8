module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

export module Graphics:ResourceUploader;

import :Geometry;
import RHI;
import Core;

export namespace Graphics
{
    struct MeshTag {};
    struct TextureTag {};
    struct MaterialTag {};

    using MeshHandle = Core::StrongHandle<MeshTag>;
    using TextureHandle = Core::StrongHandle<TextureTag>;
    using MaterialHandle = Core::StrongHandle<MaterialTag>;

    enum class TextureFormat : uint8_t
    {
        Rgba8Srgb,  // Color data (diffuse)
        Rgba8Unorm  // Linear data (normal maps)
    };

    [[nodiscard]] constexpr VkFormat ToVkFormat(TextureFormat format)
    {
        return format == TextureFormat::Rgba8Srgb ? VK_FORMAT_R8G8B8A8_SRGB : VK_FORMAT_R8G8B8A8_UNORM;
    }

    // Immutable device-local vertex + index buffers.
    struct GpuMesh
    {
        std::string Label;
        std::unique_ptr<RHI::VulkanBuffer> VertexBuffer;
        std::unique_ptr<RHI::VulkanBuffer> IndexBuffer;
        uint32_t VertexCount = 0;
        uint32_t IndexCount = 0;
    };

    struct GpuTexture
    {
        std::string Label;
        std::unique_ptr<RHI::Texture> Resource;
    };

    // Material descriptor set (set 2):
    //   binding 0: diffuse image, binding 1: diffuse sampler
    //   binding 2: normal image,  binding 3: normal sampler
    struct GpuMaterial
    {
        std::string Name;
        TextureHandle Diffuse;
        TextureHandle Normal;
        VkDescriptorSet DescriptorSet = VK_NULL_HANDLE;
    };

    // Invalid texture handles select the uploader's default white / flat-normal textures.
    struct MaterialDesc
    {
        std::string Name;
        TextureHandle Diffuse;
        TextureHandle Normal;
    };

    // -------------------------------------------------------------------------
    // ResourceUploader
    // -------------------------------------------------------------------------
    // Turns parsed CPU data into GPU-resident meshes, textures and materials.
    // Each upload records its copy into a one-shot command buffer on the graphics
    // queue and returns without waiting: any later submission on that queue sees
    // the data. Staging memory is retired through the device's deletion queue.
    //
    // Every call creates a new resource; identical input is never deduplicated.
    class ResourceUploader
    {
    public:
        explicit ResourceUploader(RHI::GpuContext& context);
        ~ResourceUploader();

        ResourceUploader(const ResourceUploader&) = delete;
        ResourceUploader& operator=(const ResourceUploader&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] Core::Expected<MeshHandle> UploadMesh(std::span<const ModelVertex> vertices,
                                                            std::span<const uint32_t> indices,
                                                            std::string_view label = "mesh");

        // Tightly packed 4-byte pixels, row-major, width * height * 4 bytes.
        [[nodiscard]] Core::Expected<TextureHandle> UploadTexture(std::span<const uint8_t> pixels, uint32_t width,
                                                                  uint32_t height, TextureFormat format,
                                                                  std::string_view label = "texture");

        [[nodiscard]] Core::Expected<MaterialHandle> BuildMaterial(const MaterialDesc& desc);

        [[nodiscard]] Core::Expected<GpuMesh*> GetMesh(MeshHandle handle) const { return m_Meshes.Get(handle); }
        [[nodiscard]] Core::Expected<GpuTexture*> GetTexture(TextureHandle handle) const { return m_Textures.Get(handle); }
        [[nodiscard]] Core::Expected<GpuMaterial*> GetMaterial(MaterialHandle handle) const { return m_Materials.Get(handle); }

        [[nodiscard]] TextureHandle GetDefaultDiffuse() const { return m_DefaultDiffuse; }
        [[nodiscard]] TextureHandle GetDefaultNormal() const { return m_DefaultNormal; }

        [[nodiscard]] size_t GetMeshCount() const { return m_Meshes.Size(); }
        [[nodiscard]] size_t GetTextureCount() const { return m_Textures.Size(); }
        [[nodiscard]] size_t GetMaterialCount() const { return m_Materials.Size(); }

        [[nodiscard]] const RHI::DescriptorLayout& GetMaterialLayout() const { return *m_MaterialLayout; }

    private:
        static constexpr uint32_t kMaterialsPerPool = 64;

        RHI::GpuContext& m_Context;

        // Pools outlive the material sets allocated from them.
        std::unique_ptr<RHI::DescriptorLayout> m_MaterialLayout;
        std::vector<std::unique_ptr<RHI::DescriptorPool>> m_MaterialPools;
        uint32_t m_SetsInCurrentPool = 0;

        Core::ResourcePool<GpuMesh, MeshHandle> m_Meshes;
        Core::ResourcePool<GpuTexture, TextureHandle> m_Textures;
        Core::ResourcePool<GpuMaterial, MaterialHandle> m_Materials;

        TextureHandle m_DefaultDiffuse;
        TextureHandle m_DefaultNormal;
        bool m_IsValid = false;

        [[nodiscard]] std::unique_ptr<RHI::VulkanBuffer> CreateStaging(const void* data, size_t size,
                                                                      std::string_view label);
        [[nodiscard]] VkDescriptorSet AllocateMaterialSet();
    };
}
