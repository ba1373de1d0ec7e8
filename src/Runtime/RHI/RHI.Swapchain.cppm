module;

#include <vector>
#include <cstdint>
#include <memory>

#include "RHI.Vulkan.hpp"

export module RHI:Swapchain;

import :Device;
import :Image;
import :Types;
import Core;

namespace RHI
{
    // Presentable image chain. With SurfaceKind::Window it wraps a VkSwapchainKHR; with
    // SurfaceKind::Headless it owns offscreen images that end each frame in TRANSFER_SRC
    // layout so they can be read back.
    export class VulkanSwapchain
    {
    public:
        VulkanSwapchain(VulkanDevice& device, SurfaceKind kind, VkExtent2D extent,
                        VkPresentModeKHR preferredPresentMode);
        ~VulkanSwapchain();

        VulkanSwapchain(const VulkanSwapchain&) = delete;
        VulkanSwapchain& operator=(const VulkanSwapchain&) = delete;

        // Caller guarantees the device is idle. Keeps the old chain if creation fails.
        [[nodiscard]] Core::Result Recreate(VkExtent2D extent);

        // Window: vkAcquireNextImageKHR signalling `imageAvailable`. Headless: round robin, no signal.
        [[nodiscard]] Core::Expected<uint32_t> AcquireNextImage(VkSemaphore imageAvailable, bool& suboptimal);

        [[nodiscard]] VkSwapchainKHR GetHandle() const { return m_Swapchain; }
        [[nodiscard]] VkFormat GetImageFormat() const { return m_Capabilities.ColorFormat; }
        [[nodiscard]] VkExtent2D GetExtent() const { return m_Extent; }
        [[nodiscard]] const SurfaceCapabilities& GetCapabilities() const { return m_Capabilities; }
        [[nodiscard]] bool IsHeadless() const { return m_Kind == SurfaceKind::Headless; }
        [[nodiscard]] bool IsValid() const { return !m_Images.empty(); }
        [[nodiscard]] uint32_t GetImageCount() const { return static_cast<uint32_t>(m_Images.size()); }

        [[nodiscard]] const std::vector<VkImageView>& GetImageViews() const { return m_ImageViews; }
        [[nodiscard]] const std::vector<VkImage>& GetImages() const { return m_Images; }

    private:
        VulkanDevice& m_Device;
        SurfaceKind m_Kind;
        VkPresentModeKHR m_PreferredPresentMode;

        VkSwapchainKHR m_Swapchain = VK_NULL_HANDLE;
        std::vector<VkImage> m_Images;
        std::vector<VkImageView> m_ImageViews;
        std::vector<std::unique_ptr<VulkanImage>> m_OffscreenImages; // Headless only

        SurfaceCapabilities m_Capabilities;
        VkExtent2D m_Extent{0, 0};
        uint32_t m_NextHeadlessImage = 0;

        Core::Result CreateSwapchain(VkExtent2D requested);
        Core::Result CreateOffscreenImages(VkExtent2D requested);
        void CreateImageViews();
        void DestroyImageViews();
        void Cleanup();

        // Helpers
        static VkExtent2D ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D requested);
    };

    // Format / present mode negotiation. B8G8R8A8_SRGB + SRGB_NONLINEAR preferred, else the first
    // reported format. `preferred` if offered, else FIFO (always available).
    export [[nodiscard]] VkSurfaceFormatKHR SelectSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats);
    export [[nodiscard]] VkPresentModeKHR SelectPresentMode(const std::vector<VkPresentModeKHR>& presentModes,
                                                            VkPresentModeKHR preferred);
}
