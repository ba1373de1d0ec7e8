module;
#include <memory>
#include <algorithm>
#include "RHI.Vulkan.hpp"

module RHI:Texture.Impl;
import :Texture;
import :CommandUtils;
import Core;

namespace RHI
{
    Texture::Texture(VulkanDevice& device, uint32_t width, uint32_t height, VkFormat format)
        : m_Device(device)
    {
        m_Image = std::make_unique<VulkanImage>(
            m_Device, width, height, 1, format,
            VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT,
            VK_IMAGE_ASPECT_COLOR_BIT
        );

        if (m_Image->IsValid())
        {
            CreateSampler();
        }
    }

    Texture::~Texture()
    {
        if (m_Sampler)
        {
            VkDevice logicalDevice = m_Device.GetLogicalDevice();
            VkSampler sampler = m_Sampler;

            m_Device.SafeDestroy([logicalDevice, sampler]()
            {
                vkDestroySampler(logicalDevice, sampler, nullptr);
            });
        }
    }

    void Texture::CreateSampler()
    {
        VkSamplerCreateInfo samplerInfo{};
        samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        samplerInfo.magFilter = VK_FILTER_LINEAR;
        samplerInfo.minFilter = VK_FILTER_NEAREST;
        samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
        samplerInfo.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;

        samplerInfo.anisotropyEnable = m_Device.HasSamplerAnisotropy() ? VK_TRUE : VK_FALSE;
        samplerInfo.maxAnisotropy = m_Device.HasSamplerAnisotropy()
                                        ? std::min(16.0f, m_Device.GetMaxSamplerAnisotropy())
                                        : 1.0f;

        samplerInfo.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
        samplerInfo.unnormalizedCoordinates = VK_FALSE;
        samplerInfo.compareEnable = VK_FALSE;
        samplerInfo.compareOp = VK_COMPARE_OP_ALWAYS;

        samplerInfo.minLod = 0.0f;
        samplerInfo.maxLod = static_cast<float>(m_Image->GetMipLevels());

        if (vkCreateSampler(m_Device.GetLogicalDevice(), &samplerInfo, nullptr, &m_Sampler) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create texture sampler!");
            m_Sampler = VK_NULL_HANDLE;
        }
    }

    void Texture::RecordUpload(VkCommandBuffer cmd, VkBuffer staging) const
    {
        const uint32_t mipLevels = m_Image->GetMipLevels();

        CommandUtils::ImageBarrier(cmd, {.Image = m_Image->GetHandle(),
                                         .OldLayout = VK_IMAGE_LAYOUT_UNDEFINED,
                                         .NewLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                         .SrcStage = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT,
                                         .SrcAccess = 0,
                                         .DstStage = VK_PIPELINE_STAGE_2_TRANSFER_BIT,
                                         .DstAccess = VK_ACCESS_2_TRANSFER_WRITE_BIT,
                                         .LevelCount = mipLevels});

        VkBufferImageCopy region{};
        region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        region.imageExtent = {m_Image->GetWidth(), m_Image->GetHeight(), 1};
        vkCmdCopyBufferToImage(cmd, staging, m_Image->GetHandle(), VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

        // Fragment shaders of later submissions read it.
        CommandUtils::ImageBarrier(cmd, {.Image = m_Image->GetHandle(),
                                         .OldLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                         .NewLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                                         .SrcStage = VK_PIPELINE_STAGE_2_TRANSFER_BIT,
                                         .SrcAccess = VK_ACCESS_2_TRANSFER_WRITE_BIT,
                                         .DstStage = VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT,
                                         .DstAccess = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT,
                                         .LevelCount = mipLevels});
    }
}
