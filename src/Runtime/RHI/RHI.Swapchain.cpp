module;
#include "RHI.Vulkan.hpp"
#include <vector>
#include <algorithm>
#include <limits>
#include <memory>

module RHI:Swapchain.Impl;
import :Swapchain;
import Core;

namespace RHI
{
    namespace
    {
        constexpr VkFormat kHeadlessFormat = VK_FORMAT_R8G8B8A8_UNORM;
        constexpr uint32_t kHeadlessImageCount = 3;
    }

    VulkanSwapchain::VulkanSwapchain(VulkanDevice& device, SurfaceKind kind, VkExtent2D extent,
                                     VkPresentModeKHR preferredPresentMode)
        : m_Device(device), m_Kind(kind), m_PreferredPresentMode(preferredPresentMode)
    {
        m_Capabilities.Kind = kind;
        m_Capabilities.DepthFormat = VulkanImage::FindDepthFormat(m_Device);

        auto result = (kind == SurfaceKind::Headless) ? CreateOffscreenImages(extent) : CreateSwapchain(extent);
        if (!result)
        {
            Core::Log::Error("Initial surface configuration failed: {}", Core::ErrorCodeToString(result.error()));
            return;
        }
        CreateImageViews();
    }

    VulkanSwapchain::~VulkanSwapchain()
    {
        Cleanup();
    }

    Core::Result VulkanSwapchain::Recreate(VkExtent2D extent)
    {
        if (extent.width == 0 || extent.height == 0)
        {
            return std::unexpected(Core::ErrorCode::SurfaceMinimized);
        }

        if (m_Kind == SurfaceKind::Headless)
        {
            DestroyImageViews();
            m_Images.clear();
            m_OffscreenImages.clear();
            auto result = CreateOffscreenImages(extent);
            if (!result) return result;
            CreateImageViews();
            return result;
        }

        // Views are destroyed first; the old handle is passed as oldSwapchain.
        DestroyImageViews();
        VkSwapchainKHR oldSwapchain = m_Swapchain;

        auto result = CreateSwapchain(extent);
        if (result && oldSwapchain != VK_NULL_HANDLE)
        {
            vkDestroySwapchainKHR(m_Device.GetLogicalDevice(), oldSwapchain, nullptr);
        }

        CreateImageViews();
        return result;
    }

    Core::Expected<uint32_t> VulkanSwapchain::AcquireNextImage(VkSemaphore imageAvailable, bool& suboptimal)
    {
        suboptimal = false;
        if (m_Images.empty())
        {
            return std::unexpected(Core::ErrorCode::SwapchainOutOfDate);
        }

        if (m_Kind == SurfaceKind::Headless)
        {
            const uint32_t index = m_NextHeadlessImage;
            m_NextHeadlessImage = (m_NextHeadlessImage + 1) % static_cast<uint32_t>(m_Images.size());
            return index;
        }

        uint32_t imageIndex = 0;
        VkResult result = vkAcquireNextImageKHR(m_Device.GetLogicalDevice(), m_Swapchain, UINT64_MAX,
                                                imageAvailable, VK_NULL_HANDLE, &imageIndex);
        if (result == VK_SUBOPTIMAL_KHR)
        {
            suboptimal = true;
            return imageIndex;
        }
        if (result != VK_SUCCESS)
        {
            return std::unexpected(ToErrorCode(result));
        }
        return imageIndex;
    }

    void VulkanSwapchain::DestroyImageViews()
    {
        if (m_Kind == SurfaceKind::Window)
        {
            for (auto imageView : m_ImageViews)
            {
                vkDestroyImageView(m_Device.GetLogicalDevice(), imageView, nullptr);
            }
        }
        m_ImageViews.clear();
    }

    void VulkanSwapchain::Cleanup()
    {
        DestroyImageViews();
        m_Images.clear();
        m_OffscreenImages.clear();

        if (m_Swapchain != VK_NULL_HANDLE)
        {
            vkDestroySwapchainKHR(m_Device.GetLogicalDevice(), m_Swapchain, nullptr);
            m_Swapchain = VK_NULL_HANDLE;
        }
    }

    Core::Result VulkanSwapchain::CreateOffscreenImages(VkExtent2D requested)
    {
        if (requested.width == 0 || requested.height == 0)
        {
            return std::unexpected(Core::ErrorCode::SurfaceMinimized);
        }

        for (uint32_t i = 0; i < kHeadlessImageCount; ++i)
        {
            auto image = std::make_unique<VulkanImage>(
                m_Device, requested.width, requested.height, 1, kHeadlessFormat,
                VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT,
                VK_IMAGE_ASPECT_COLOR_BIT);
            if (!image->IsValid())
            {
                Core::Log::Error("Failed to create headless surface image {} ({}x{})", i, requested.width,
                                 requested.height);
                m_OffscreenImages.clear();
                m_Images.clear();
                return std::unexpected(Core::ErrorCode::SurfaceConfigFailed);
            }
            m_Images.push_back(image->GetHandle());
            m_OffscreenImages.push_back(std::move(image));
        }

        m_NextHeadlessImage = 0;
        m_Extent = requested;
        m_Capabilities.ColorFormat = kHeadlessFormat;
        m_Capabilities.ColorSpace = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        m_Capabilities.PresentMode = VK_PRESENT_MODE_FIFO_KHR;
        m_Capabilities.ImageCount = kHeadlessImageCount;
        m_Capabilities.FinalLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        m_Capabilities.SupportsReadback = true;

        Core::Log::Info("Headless surface configured: {}x{}", requested.width, requested.height);
        return Core::Ok(Core::Unit{});
    }

    Core::Result VulkanSwapchain::CreateSwapchain(VkExtent2D requested)
    {
        auto support = m_Device.QuerySwapchainSupport();
        if (support.Formats.empty() || support.PresentModes.empty())
        {
            Core::Log::Error("Surface reports no formats or present modes.");
            return std::unexpected(Core::ErrorCode::SurfaceConfigFailed);
        }

        VkSurfaceFormatKHR surfaceFormat = SelectSurfaceFormat(support.Formats);
        VkPresentModeKHR presentMode = SelectPresentMode(support.PresentModes, m_PreferredPresentMode);
        VkExtent2D extent = ChooseSwapExtent(support.Capabilities, requested);

        if (extent.width == 0 || extent.height == 0)
        {
            return std::unexpected(Core::ErrorCode::SurfaceMinimized);
        }

        uint32_t imageCount = support.Capabilities.minImageCount + 1;
        if (support.Capabilities.maxImageCount > 0 && imageCount > support.Capabilities.maxImageCount)
        {
            imageCount = support.Capabilities.maxImageCount;
        }

        VkSwapchainCreateInfoKHR createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        createInfo.surface = m_Device.GetSurface();
        createInfo.minImageCount = imageCount;
        createInfo.imageFormat = surfaceFormat.format;
        createInfo.imageColorSpace = surfaceFormat.colorSpace;
        createInfo.imageExtent = extent;
        createInfo.imageArrayLayers = 1;
        createInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

        QueueFamilyIndices indices = m_Device.GetQueueIndices();
        uint32_t queueFamilyIndices[] = {indices.GraphicsFamily.value(), indices.PresentFamily.value()};

        if (indices.GraphicsFamily != indices.PresentFamily)
        {
            createInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
            createInfo.queueFamilyIndexCount = 2;
            createInfo.pQueueFamilyIndices = queueFamilyIndices;
        }
        else
        {
            createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
        }

        createInfo.preTransform = support.Capabilities.currentTransform;
        createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        createInfo.presentMode = presentMode;
        createInfo.clipped = VK_TRUE;
        createInfo.oldSwapchain = m_Swapchain;

        // Temporary handle so m_Swapchain survives a failed creation
        VkSwapchainKHR newSwapchain = VK_NULL_HANDLE;
        if (VkResult result = vkCreateSwapchainKHR(m_Device.GetLogicalDevice(), &createInfo, nullptr, &newSwapchain);
            result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create swapchain {}x{}! result={}", extent.width, extent.height,
                             static_cast<int>(result));
            return std::unexpected(result == VK_ERROR_SURFACE_LOST_KHR
                                       ? Core::ErrorCode::SurfaceLost
                                       : Core::ErrorCode::SurfaceConfigFailed);
        }
        m_Swapchain = newSwapchain;

        vkGetSwapchainImagesKHR(m_Device.GetLogicalDevice(), m_Swapchain, &imageCount, nullptr);
        m_Images.resize(imageCount);
        vkGetSwapchainImagesKHR(m_Device.GetLogicalDevice(), m_Swapchain, &imageCount, m_Images.data());

        m_Extent = extent;
        m_Capabilities.ColorFormat = surfaceFormat.format;
        m_Capabilities.ColorSpace = surfaceFormat.colorSpace;
        m_Capabilities.PresentMode = presentMode;
        m_Capabilities.ImageCount = imageCount;
        m_Capabilities.FinalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
        m_Capabilities.SupportsReadback = false;

        Core::Log::Info("Swapchain Created/Resized: {}x{} ({} images)", extent.width, extent.height, imageCount);
        return Core::Ok(Core::Unit{});
    }

    void VulkanSwapchain::CreateImageViews()
    {
        m_ImageViews.resize(m_Images.size(), VK_NULL_HANDLE);
        for (size_t i = 0; i < m_Images.size(); i++)
        {
            if (m_Kind == SurfaceKind::Headless)
            {
                // Borrowed from the owning VulkanImage
                m_ImageViews[i] = m_OffscreenImages[i]->GetView();
                continue;
            }

            VkImageViewCreateInfo createInfo{};
            createInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            createInfo.image = m_Images[i];
            createInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
            createInfo.format = m_Capabilities.ColorFormat;
            createInfo.components.r = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.components.g = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.components.b = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.components.a = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            createInfo.subresourceRange.baseMipLevel = 0;
            createInfo.subresourceRange.levelCount = 1;
            createInfo.subresourceRange.baseArrayLayer = 0;
            createInfo.subresourceRange.layerCount = 1;

            if (vkCreateImageView(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_ImageViews[i]) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create image views!");
            }
        }
    }

    VkExtent2D VulkanSwapchain::ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D requested)
    {
        if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max())
        {
            return capabilities.currentExtent;
        }

        VkExtent2D actualExtent = requested;
        actualExtent.width = std::clamp(actualExtent.width, capabilities.minImageExtent.width,
                                        capabilities.maxImageExtent.width);
        actualExtent.height = std::clamp(actualExtent.height, capabilities.minImageExtent.height,
                                         capabilities.maxImageExtent.height);
        return actualExtent;
    }

    VkSurfaceFormatKHR SelectSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats)
    {
        for (const auto& availableFormat : formats)
        {
            if (availableFormat.format == VK_FORMAT_B8G8R8A8_SRGB &&
                availableFormat.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
            {
                return availableFormat;
            }
        }
        if (formats.empty()) return {VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR};
        return formats[0];
    }

    VkPresentModeKHR SelectPresentMode(const std::vector<VkPresentModeKHR>& presentModes, VkPresentModeKHR preferred)
    {
        for (const auto& availablePresentMode : presentModes)
        {
            if (availablePresentMode == preferred)
            {
                return availablePresentMode;
            }
        }
        return VK_PRESENT_MODE_FIFO_KHR;
    }
}
