module;

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "RHI.Vulkan.hpp"

export module RHI:GpuContext;

import :Types;
import :Context;
import :Device;
import :Swapchain;
import Core;

export namespace RHI
{
    struct GpuContextConfig
    {
        ContextConfig Instance{};
        // Used when no window is passed to Create().
        VkExtent2D HeadlessExtent{800, 600};
        VkPresentModeKHR PreferredPresentMode = VK_PRESENT_MODE_MAILBOX_KHR;
    };

    // Owns the device/queue pair and the presentable surface. Every other GPU component
    // receives a reference to it; none keeps its own device handle.
    //
    // Per frame:  WaitForFrameSlot -> (mirror writes) -> AcquireFrame -> record into
    //             GetFrameCommandBuffer -> Submit -> Present.
    class GpuContext
    {
    public:
        // window == nullptr selects the headless surface.
        [[nodiscard]] static Core::Expected<std::unique_ptr<GpuContext>> Create(
            const GpuContextConfig& config, Core::Windowing::Window* window);

        ~GpuContext();

        GpuContext(const GpuContext&) = delete;
        GpuContext& operator=(const GpuContext&) = delete;

        // Zero on either axis pauses frame production; anything else reconfigures now.
        [[nodiscard]] Core::Result Resize(uint32_t width, uint32_t height);
        [[nodiscard]] Core::Result Reconfigure();

        // Blocks on the current slot's fence at most once per frame, then retires the
        // slot's deferred deletions. Mirror writes for this slot are legal afterwards.
        void WaitForFrameSlot();

        // SwapchainOutOfDate / SurfaceLost are transient (reconfigure + retry once);
        // OutOfDeviceMemory / DeviceLost are fatal; SurfaceMinimized while paused.
        [[nodiscard]] Core::Expected<FrameImage> AcquireFrame();

        [[nodiscard]] VkCommandBuffer GetFrameCommandBuffer() const { return m_CommandBuffers[m_FrameIndex]; }

        // Exactly once per acquired frame. Any failure here is fatal.
        [[nodiscard]] Core::Result Submit(VkCommandBuffer cmd);
        [[nodiscard]] Core::Result Present(const FrameImage& frame);

        // Headless only: tightly packed RGBA8 of the last frame presented from that image.
        [[nodiscard]] Core::Expected<std::vector<uint8_t>> ReadbackImage(uint32_t imageIndex);

        [[nodiscard]] uint32_t GetFrameIndex() const { return m_FrameIndex; }
        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }
        [[nodiscard]] uint64_t GetSubmissionCount() const { return m_SubmissionCount; }
        [[nodiscard]] bool IsMinimized() const { return m_Minimized; }
        [[nodiscard]] bool IsHeadless() const { return m_Window == nullptr; }
        [[nodiscard]] bool IsSlotWaited() const { return m_SlotWaited; }
        [[nodiscard]] VkExtent2D GetExtent() const { return m_Swapchain->GetExtent(); }
        [[nodiscard]] const SurfaceCapabilities& GetSurfaceCapabilities() const { return m_Swapchain->GetCapabilities(); }

        [[nodiscard]] VulkanDevice& GetDevice() { return *m_Device; }
        [[nodiscard]] const VulkanDevice& GetDevice() const { return *m_Device; }

        void WaitIdle() const;

    private:
        GpuContext() = default;

        Core::Windowing::Window* m_Window = nullptr;
        std::unique_ptr<VulkanContext> m_Context;
        VkSurfaceKHR m_Surface = VK_NULL_HANDLE;
        std::unique_ptr<VulkanDevice> m_Device;
        std::unique_ptr<VulkanSwapchain> m_Swapchain;

        VkCommandPool m_CommandPool = VK_NULL_HANDLE;
        std::array<VkCommandBuffer, MAX_FRAMES_IN_FLIGHT> m_CommandBuffers{};
        std::array<VkSemaphore, MAX_FRAMES_IN_FLIGHT> m_ImageAvailable{};
        std::array<VkSemaphore, MAX_FRAMES_IN_FLIGHT> m_RenderFinished{};
        std::array<VkFence, MAX_FRAMES_IN_FLIGHT> m_InFlightFences{};

        VkExtent2D m_RequestedExtent{0, 0};
        std::vector<bool> m_ImagePresented;

        uint32_t m_FrameIndex = 0;
        uint64_t m_FrameNumber = 0;
        uint64_t m_SubmissionCount = 0;
        bool m_SlotWaited = false;
        bool m_Minimized = false;
        bool m_NeedsReconfigure = false;

        Core::Result InitFrameResources();
        void DestroyFrameResources();
    };
}
