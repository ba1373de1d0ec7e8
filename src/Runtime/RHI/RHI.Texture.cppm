module;
#include <cstdint>
#include <memory>
#include "RHI.Vulkan.hpp"

export module RHI:Texture;

import :Device;
import :Image;

export namespace RHI
{
    // Sampled 2D image + sampler. Pixel data arrives through RecordUpload.
    class Texture
    {
    public:
        Texture(VulkanDevice& device, uint32_t width, uint32_t height, VkFormat format);
        ~Texture();

        Texture(const Texture&) = delete;
        Texture& operator=(const Texture&) = delete;

        [[nodiscard]] VkImage GetImage() const { return m_Image->GetHandle(); }
        [[nodiscard]] VkImageView GetView() const { return m_Image->GetView(); }
        [[nodiscard]] VkSampler GetSampler() const { return m_Sampler; }
        [[nodiscard]] VkFormat GetFormat() const { return m_Image->GetFormat(); }
        [[nodiscard]] uint32_t GetWidth() const { return m_Image->GetWidth(); }
        [[nodiscard]] uint32_t GetHeight() const { return m_Image->GetHeight(); }
        [[nodiscard]] bool IsValid() const { return m_Image->IsValid() && m_Sampler != VK_NULL_HANDLE; }

        // Undefined -> TransferDst, copy from `staging`, TransferDst -> ShaderReadOnly.
        void RecordUpload(VkCommandBuffer cmd, VkBuffer staging) const;

    private:
        VulkanDevice& m_Device;
        std::unique_ptr<VulkanImage> m_Image;
        VkSampler m_Sampler = VK_NULL_HANDLE;

        void CreateSampler();
    };
}
