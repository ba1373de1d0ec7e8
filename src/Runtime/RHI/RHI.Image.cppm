module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:Image;

import :Device;

export namespace RHI
{
    class VulkanImage
    {
    public:
        VulkanImage(VulkanDevice& device, uint32_t width, uint32_t height, uint32_t mipLevels, VkFormat format,
                    VkImageUsageFlags usage, VkImageAspectFlags aspect);
        ~VulkanImage();

        VulkanImage(const VulkanImage&) = delete;
        VulkanImage& operator=(const VulkanImage&) = delete;

        [[nodiscard]] VkImage GetHandle() const { return m_Image; }
        [[nodiscard]] VkImageView GetView() const { return m_ImageView; }
        [[nodiscard]] VkFormat GetFormat() const { return m_Format; }
        [[nodiscard]] uint32_t GetMipLevels() const { return m_MipLevels; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] uint32_t GetWidth() const { return m_Width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Height; }

        // First of D32_SFLOAT, D32_SFLOAT_S8_UINT, D24_UNORM_S8_UINT usable as depth attachment.
        static VkFormat FindDepthFormat(const VulkanDevice& device);

    private:
        VulkanDevice& m_Device;
        VkImage m_Image = VK_NULL_HANDLE;
        VkImageView m_ImageView = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        VkFormat m_Format;
        uint32_t m_MipLevels = 1;
        uint32_t m_Width = 0;
        uint32_t m_Height = 0;
        bool m_IsValid = true;
    };
}
