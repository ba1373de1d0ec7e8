module;
#include <cstdint>
#include <vector>
#include <optional>
#include <functional>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;
import :Types;

namespace RHI
{
    export struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;
        std::optional<uint32_t> PresentFamily;

        [[nodiscard]] bool IsComplete(bool needsPresent) const
        {
            return GraphicsFamily.has_value() && (!needsPresent || PresentFamily.has_value());
        }
    };

    export struct SwapchainSupportDetails
    {
        VkSurfaceCapabilitiesKHR Capabilities{};
        std::vector<VkSurfaceFormatKHR> Formats;
        std::vector<VkPresentModeKHR> PresentModes;
    };

    // Logical device, queues, VMA allocator and the deferred deletion queues.
    // A null surface selects a headless device (no swapchain extension, no present queue).
    export class VulkanDevice
    {
    public:
        VulkanDevice(VulkanContext& context, VkSurfaceKHR surface);
        ~VulkanDevice();

        // No copy
        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] VkQueue GetPresentQueue() const { return m_PresentQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VkSurfaceKHR GetSurface() const { return m_Surface; }
        [[nodiscard]] VkCommandPool GetCommandPool() const { return m_CommandPool; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] float GetMaxSamplerAnisotropy() const { return m_MaxSamplerAnisotropy; }
        [[nodiscard]] bool HasSamplerAnisotropy() const { return m_SamplerAnisotropy; }
        [[nodiscard]] constexpr uint32_t GetFramesInFlight() const { return MAX_FRAMES_IN_FLIGHT; }

        [[nodiscard]] VkResult SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence);
        [[nodiscard]] VkResult Present(const VkPresentInfoKHR& presentInfo);

        [[nodiscard]] SwapchainSupportDetails QuerySwapchainSupport() const;

        // Deferred destruction. Deleters are parked until the next frame submission
        // (CommitDeletions) and run once that frame slot's fence has been waited on
        // (FlushDeletionQueue). Everything recorded before the submission is then complete.
        void SafeDestroy(std::function<void()>&& deleteFn);
        void CommitDeletions(uint32_t frameIndex);
        void FlushDeletionQueue(uint32_t frameIndex);
        [[nodiscard]] size_t GetPendingDeletionCount() const;

        void WaitIdle() const;

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;

        VkSurfaceKHR m_Surface = VK_NULL_HANDLE; // Non-owning, GpuContext destroys it

        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        VkQueue m_PresentQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;

        VmaAllocator m_Allocator = VK_NULL_HANDLE;
        VkCommandPool m_CommandPool = VK_NULL_HANDLE;
        float m_MaxSamplerAnisotropy = 1.0f;
        bool m_SamplerAnisotropy = false;

        bool m_IsValid = true;

        std::vector<std::function<void()>> m_PendingDeletions;
        std::vector<std::function<void()>> m_DeletionQueue[MAX_FRAMES_IN_FLIGHT];

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);
        void CreateCommandPool();

        bool IsDeviceSuitable(VkPhysicalDevice device);
        QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);
        bool CheckDeviceExtensionSupport(VkPhysicalDevice device);
    };
}
