module;

#include <cstdint>
#include <memory>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:GpuContext.Impl;
import :GpuContext;
import :Buffer;
import :CommandUtils;
import Core;

namespace RHI
{
    Core::Expected<std::unique_ptr<GpuContext>> GpuContext::Create(const GpuContextConfig& config,
                                                                   Core::Windowing::Window* window)
    {
        std::unique_ptr<GpuContext> ctx(new GpuContext());
        ctx->m_Window = window;

        ContextConfig instanceConfig = config.Instance;
        instanceConfig.Headless = (window == nullptr);

        ctx->m_Context = std::make_unique<VulkanContext>(instanceConfig);
        if (!ctx->m_Context->IsValid())
        {
            Core::Log::Error("GpuContext: Vulkan instance creation failed.");
            return std::unexpected(Core::ErrorCode::DeviceInitFailed);
        }

        if (window)
        {
            if (!window->IsValid() ||
                !window->CreateSurface(ctx->m_Context->GetInstance(), nullptr, &ctx->m_Surface))
            {
                Core::Log::Error("GpuContext: failed to create a window surface.");
                return std::unexpected(Core::ErrorCode::DeviceInitFailed);
            }
            ctx->m_RequestedExtent = {
                static_cast<uint32_t>(window->GetFramebufferWidth()),
                static_cast<uint32_t>(window->GetFramebufferHeight())
            };
        }
        else
        {
            ctx->m_RequestedExtent = config.HeadlessExtent;
        }

        ctx->m_Device = std::make_unique<VulkanDevice>(*ctx->m_Context, ctx->m_Surface);
        if (!ctx->m_Device->IsValid())
        {
            Core::Log::Error("GpuContext: no usable Vulkan device.");
            return std::unexpected(Core::ErrorCode::DeviceInitFailed);
        }

        if (ctx->m_RequestedExtent.width == 0 || ctx->m_RequestedExtent.height == 0)
        {
            Core::Log::Error("GpuContext: initial surface extent is zero ({}x{}).", ctx->m_RequestedExtent.width,
                             ctx->m_RequestedExtent.height);
            return std::unexpected(Core::ErrorCode::SurfaceConfigFailed);
        }

        const SurfaceKind kind = window ? SurfaceKind::Window : SurfaceKind::Headless;
        ctx->m_Swapchain = std::make_unique<VulkanSwapchain>(*ctx->m_Device, kind, ctx->m_RequestedExtent,
                                                             config.PreferredPresentMode);
        if (!ctx->m_Swapchain->IsValid())
        {
            return std::unexpected(Core::ErrorCode::SurfaceConfigFailed);
        }
        ctx->m_ImagePresented.assign(ctx->m_Swapchain->GetImageCount(), false);

        if (auto result = ctx->InitFrameResources(); !result)
        {
            return std::unexpected(result.error());
        }

        const auto& caps = ctx->m_Swapchain->GetCapabilities();
        Core::Log::Info("GpuContext ready: {} surface, format={}, present mode={}, {} images, depth format={}",
                        kind == SurfaceKind::Headless ? "headless" : "window", static_cast<int>(caps.ColorFormat),
                        static_cast<int>(caps.PresentMode), caps.ImageCount, static_cast<int>(caps.DepthFormat));
        return ctx;
    }

    GpuContext::~GpuContext()
    {
        if (m_Device)
        {
            m_Device->WaitIdle();
            m_Swapchain.reset();
            DestroyFrameResources();
            m_Device.reset();
        }
        if (m_Surface != VK_NULL_HANDLE && m_Context)
        {
            vkDestroySurfaceKHR(m_Context->GetInstance(), m_Surface, nullptr);
        }
        m_Context.reset();
    }

    Core::Result GpuContext::InitFrameResources()
    {
        VkDevice device = m_Device->GetLogicalDevice();

        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = m_Device->GetQueueIndices().GraphicsFamily.value();

        if (vkCreateCommandPool(device, &poolInfo, nullptr, &m_CommandPool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create frame command pool!");
            return std::unexpected(Core::ErrorCode::DeviceInitFailed);
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_CommandPool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = MAX_FRAMES_IN_FLIGHT;

        if (vkAllocateCommandBuffers(device, &allocInfo, m_CommandBuffers.data()) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate frame command buffers!");
            return std::unexpected(Core::ErrorCode::DeviceInitFailed);
        }

        VkSemaphoreCreateInfo semaphoreInfo{};
        semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

        // Signaled so the first wait on every slot returns immediately
        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i)
        {
            if (vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_ImageAvailable[i]) != VK_SUCCESS ||
                vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_RenderFinished[i]) != VK_SUCCESS ||
                vkCreateFence(device, &fenceInfo, nullptr, &m_InFlightFences[i]) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create synchronization objects for frame slot {}!", i);
                return std::unexpected(Core::ErrorCode::DeviceInitFailed);
            }
        }
        return Core::Ok(Core::Unit{});
    }

    void GpuContext::DestroyFrameResources()
    {
        VkDevice device = m_Device->GetLogicalDevice();
        for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i)
        {
            if (m_ImageAvailable[i]) vkDestroySemaphore(device, m_ImageAvailable[i], nullptr);
            if (m_RenderFinished[i]) vkDestroySemaphore(device, m_RenderFinished[i], nullptr);
            if (m_InFlightFences[i]) vkDestroyFence(device, m_InFlightFences[i], nullptr);
        }
        if (m_CommandPool) vkDestroyCommandPool(device, m_CommandPool, nullptr);
        m_CommandPool = VK_NULL_HANDLE;
    }

    Core::Result GpuContext::Resize(uint32_t width, uint32_t height)
    {
        if (width == 0 || height == 0)
        {
            if (!m_Minimized) Core::Log::Info("Surface minimized, pausing frame production.");
            m_Minimized = true;
            return Core::Ok(Core::Unit{});
        }

        m_Minimized = false;
        m_RequestedExtent = {width, height};
        return Reconfigure();
    }

    Core::Result GpuContext::Reconfigure()
    {
        if (m_Minimized) return Core::Ok(Core::Unit{});

        if (m_Window)
        {
            // The framebuffer may have moved on since the resize event was queued.
            const int fbWidth = m_Window->GetFramebufferWidth();
            const int fbHeight = m_Window->GetFramebufferHeight();
            if (fbWidth > 0 && fbHeight > 0)
            {
                m_RequestedExtent = {static_cast<uint32_t>(fbWidth), static_cast<uint32_t>(fbHeight)};
            }
        }

        m_Device->WaitIdle();

        auto result = m_Swapchain->Recreate(m_RequestedExtent);
        if (!result)
        {
            if (result.error() == Core::ErrorCode::SurfaceMinimized)
            {
                m_Minimized = true;
                return Core::Ok(Core::Unit{});
            }
            Core::Log::Error("Surface reconfiguration to {}x{} failed: {}", m_RequestedExtent.width,
                             m_RequestedExtent.height, Core::ErrorCodeToString(result.error()));
            return result;
        }

        m_ImagePresented.assign(m_Swapchain->GetImageCount(), false);
        m_NeedsReconfigure = false;
        return result;
    }

    void GpuContext::WaitForFrameSlot()
    {
        if (m_SlotWaited) return;

        VK_CHECK(vkWaitForFences(m_Device->GetLogicalDevice(), 1, &m_InFlightFences[m_FrameIndex], VK_TRUE,
                                 UINT64_MAX));
        m_Device->FlushDeletionQueue(m_FrameIndex);
        m_SlotWaited = true;
    }

    Core::Expected<FrameImage> GpuContext::AcquireFrame()
    {
        if (m_Minimized)
        {
            return std::unexpected(Core::ErrorCode::SurfaceMinimized);
        }
        if (m_NeedsReconfigure)
        {
            return std::unexpected(Core::ErrorCode::SwapchainOutOfDate);
        }

        WaitForFrameSlot();

        bool suboptimal = false;
        auto imageIndex = m_Swapchain->AcquireNextImage(m_ImageAvailable[m_FrameIndex], suboptimal);
        if (!imageIndex)
        {
            if (Core::IsTransientSurfaceError(imageIndex.error()))
            {
                m_NeedsReconfigure = true;
                Core::Log::Warn("AcquireFrame: surface {} ({}x{}).", Core::ErrorCodeToString(imageIndex.error()),
                                GetExtent().width, GetExtent().height);
            }
            else
            {
                Core::Log::Error("AcquireFrame failed: {}", Core::ErrorCodeToString(imageIndex.error()));
            }
            return std::unexpected(imageIndex.error());
        }

        // Suboptimal still delivers a usable image; rebuild after this frame.
        if (suboptimal) m_NeedsReconfigure = true;

        FrameImage frame;
        frame.ImageIndex = *imageIndex;
        frame.FrameSlot = m_FrameIndex;
        frame.Image = m_Swapchain->GetImages()[*imageIndex];
        frame.View = m_Swapchain->GetImageViews()[*imageIndex];
        frame.Extent = m_Swapchain->GetExtent();
        frame.Format = m_Swapchain->GetImageFormat();
        return frame;
    }

    Core::Result GpuContext::Submit(VkCommandBuffer cmd)
    {
        VkDevice device = m_Device->GetLogicalDevice();
        VK_CHECK(vkResetFences(device, 1, &m_InFlightFences[m_FrameIndex]));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        if (!IsHeadless())
        {
            submitInfo.waitSemaphoreCount = 1;
            submitInfo.pWaitSemaphores = &m_ImageAvailable[m_FrameIndex];
            submitInfo.pWaitDstStageMask = &waitStage;
            submitInfo.signalSemaphoreCount = 1;
            submitInfo.pSignalSemaphores = &m_RenderFinished[m_FrameIndex];
        }

        VkResult result = m_Device->SubmitToGraphicsQueue(submitInfo, m_InFlightFences[m_FrameIndex]);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Frame submission failed on slot {}: result={}", m_FrameIndex, static_cast<int>(result));
            // Nothing recovers a failed queue submission.
            const auto code = ToErrorCode(result);
            return std::unexpected(Core::IsFatalDeviceError(code) ? code : Core::ErrorCode::DeviceLost);
        }

        // Deletions requested so far are covered by this slot's fence.
        m_Device->CommitDeletions(m_FrameIndex);
        ++m_SubmissionCount;
        return Core::Ok(Core::Unit{});
    }

    Core::Result GpuContext::Present(const FrameImage& frame)
    {
        Core::Result outcome = Core::Ok(Core::Unit{});

        if (!IsHeadless())
        {
            VkSwapchainKHR swapchain = m_Swapchain->GetHandle();

            VkPresentInfoKHR presentInfo{};
            presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
            presentInfo.waitSemaphoreCount = 1;
            presentInfo.pWaitSemaphores = &m_RenderFinished[m_FrameIndex];
            presentInfo.swapchainCount = 1;
            presentInfo.pSwapchains = &swapchain;
            presentInfo.pImageIndices = &frame.ImageIndex;

            VkResult result = m_Device->Present(presentInfo);
            if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR ||
                result == VK_ERROR_SURFACE_LOST_KHR)
            {
                // The image was consumed; the next acquire rebuilds the chain.
                m_NeedsReconfigure = true;
            }
            else if (result != VK_SUCCESS)
            {
                Core::Log::Error("Present failed: result={}", static_cast<int>(result));
                outcome = std::unexpected(ToErrorCode(result));
            }
        }

        if (frame.ImageIndex < m_ImagePresented.size())
        {
            m_ImagePresented[frame.ImageIndex] = true;
        }

        m_FrameIndex = (m_FrameIndex + 1) % MAX_FRAMES_IN_FLIGHT;
        m_SlotWaited = false;
        ++m_FrameNumber;
        return outcome;
    }

    Core::Expected<std::vector<uint8_t>> GpuContext::ReadbackImage(uint32_t imageIndex)
    {
        const auto& caps = m_Swapchain->GetCapabilities();
        if (!caps.SupportsReadback)
        {
            Core::Log::Error("ReadbackImage: the window surface does not support readback.");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }
        if (imageIndex >= m_ImagePresented.size())
        {
            Core::Log::Error("ReadbackImage: image index {} out of range ({} images).", imageIndex,
                             m_ImagePresented.size());
            return std::unexpected(Core::ErrorCode::OutOfRange);
        }
        if (!m_ImagePresented[imageIndex])
        {
            Core::Log::Error("ReadbackImage: image {} has not been presented since the last reconfigure.", imageIndex);
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        const VkExtent2D extent = m_Swapchain->GetExtent();
        const size_t byteSize = static_cast<size_t>(extent.width) * extent.height * 4;

        VulkanBuffer readback(*m_Device, byteSize, VK_BUFFER_USAGE_TRANSFER_DST_BIT, VMA_MEMORY_USAGE_GPU_TO_CPU);
        if (!readback.IsValid())
        {
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
        }

        VkImage image = m_Swapchain->GetImages()[imageIndex];
        auto copied = CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            VkBufferImageCopy region{};
            region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
            region.imageExtent = {extent.width, extent.height, 1};
            vkCmdCopyImageToBuffer(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, readback.GetHandle(), 1, &region);
        });
        if (!copied)
        {
            return std::unexpected(copied.error());
        }

        std::vector<uint8_t> pixels(byteSize);
        if (!readback.Read(pixels.data(), byteSize))
        {
            return std::unexpected(Core::ErrorCode::InvalidState);
        }
        return pixels;
    }

    void GpuContext::WaitIdle() const
    {
        if (m_Device) m_Device->WaitIdle();
    }
}
