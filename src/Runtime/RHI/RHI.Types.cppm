module;
#include "RHI.Vulkan.hpp"
#include <cstdint>

export module RHI:Types;

import Core;

export namespace RHI
{
    inline constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    enum class SurfaceKind : uint8_t
    {
        Window,  // VkSurfaceKHR + swapchain
        Headless // Offscreen images in device memory
    };

    // Result of the capability negotiation performed when the surface is configured.
    struct SurfaceCapabilities
    {
        SurfaceKind Kind = SurfaceKind::Window;
        VkFormat ColorFormat = VK_FORMAT_UNDEFINED;
        VkColorSpaceKHR ColorSpace = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        VkPresentModeKHR PresentMode = VK_PRESENT_MODE_FIFO_KHR;
        VkFormat DepthFormat = VK_FORMAT_UNDEFINED;
        uint32_t ImageCount = 0;
        // Layout the color image must be in when the frame is handed to Present().
        VkImageLayout FinalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
        bool SupportsReadback = false;
    };

    // A presentable image handed out by GpuContext::AcquireFrame().
    struct FrameImage
    {
        uint32_t ImageIndex = 0;
        uint32_t FrameSlot = 0;
        VkImage Image = VK_NULL_HANDLE;
        VkImageView View = VK_NULL_HANDLE;
        VkExtent2D Extent{0, 0};
        VkFormat Format = VK_FORMAT_UNDEFINED;
    };

    // Maps a failing VkResult from acquire/submit/present onto the engine error space.
    constexpr Core::ErrorCode ToErrorCode(VkResult result)
    {
        switch (result)
        {
            case VK_SUCCESS:
            case VK_SUBOPTIMAL_KHR:                 return Core::ErrorCode::Success;
            case VK_ERROR_OUT_OF_DATE_KHR:          return Core::ErrorCode::SwapchainOutOfDate;
            case VK_ERROR_SURFACE_LOST_KHR:         return Core::ErrorCode::SurfaceLost;
            case VK_ERROR_OUT_OF_HOST_MEMORY:       return Core::ErrorCode::OutOfMemory;
            case VK_ERROR_OUT_OF_DEVICE_MEMORY:     return Core::ErrorCode::OutOfDeviceMemory;
            case VK_ERROR_DEVICE_LOST:              return Core::ErrorCode::DeviceLost;
            case VK_ERROR_INITIALIZATION_FAILED:    return Core::ErrorCode::DeviceInitFailed;
            case VK_ERROR_FORMAT_NOT_SUPPORTED:     return Core::ErrorCode::SurfaceConfigFailed;
            default:                                return Core::ErrorCode::Unknown;
        }
    }
}
