module;
#include <cstdint>
#include <expected>
#include "RHI.Vulkan.hpp"

export module RHI:CommandUtils;

import :Device;
import :Types;
import Core;

export namespace RHI::CommandUtils
{
    [[nodiscard]] inline Core::Expected<VkCommandBuffer> BeginOneShot(VulkanDevice& device)
    {
        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandPool = device.GetCommandPool();
        allocInfo.commandBufferCount = 1;

        VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
        if (VkResult result = vkAllocateCommandBuffers(device.GetLogicalDevice(), &allocInfo, &commandBuffer);
            result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate one-shot command buffer! result={}", static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        VK_CHECK(vkBeginCommandBuffer(commandBuffer, &beginInfo));
        return commandBuffer;
    }

    // Records `function` into a one-shot command buffer and submits it on the graphics queue
    // without waiting. Later submissions on the same queue observe its writes through the
    // barriers the function records. The command buffer is retired via SafeDestroy.
    [[nodiscard]] Core::Result SubmitDeferred(VulkanDevice& device, auto&& function)
    {
        auto cmd = BeginOneShot(device);
        if (!cmd) return std::unexpected(cmd.error());

        VkCommandBuffer commandBuffer = *cmd;
        function(commandBuffer);
        VK_CHECK(vkEndCommandBuffer(commandBuffer));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &commandBuffer;

        VkResult result = device.SubmitToGraphicsQueue(submitInfo, VK_NULL_HANDLE);

        VkDevice logicalDevice = device.GetLogicalDevice();
        VkCommandPool pool = device.GetCommandPool();
        device.SafeDestroy([logicalDevice, pool, commandBuffer]()
        {
            vkFreeCommandBuffers(logicalDevice, pool, 1, &commandBuffer);
        });

        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Deferred submit failed! result={}", static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }
        return Core::Ok(Core::Unit{});
    }

    // Blocking variant: submits with a fence and waits for completion. Used for readback.
    [[nodiscard]] Core::Result ExecuteImmediate(VulkanDevice& device, auto&& function)
    {
        auto cmd = BeginOneShot(device);
        if (!cmd) return std::unexpected(cmd.error());

        VkCommandBuffer commandBuffer = *cmd;
        function(commandBuffer);
        VK_CHECK(vkEndCommandBuffer(commandBuffer));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &commandBuffer;

        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        VkFence fence = VK_NULL_HANDLE;
        VK_CHECK(vkCreateFence(device.GetLogicalDevice(), &fenceInfo, nullptr, &fence));

        VkResult result = device.SubmitToGraphicsQueue(submitInfo, fence);
        if (result == VK_SUCCESS)
        {
            result = vkWaitForFences(device.GetLogicalDevice(), 1, &fence, VK_TRUE, UINT64_MAX);
        }

        vkDestroyFence(device.GetLogicalDevice(), fence, nullptr);
        vkFreeCommandBuffers(device.GetLogicalDevice(), device.GetCommandPool(), 1, &commandBuffer);

        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Immediate submit failed! result={}", static_cast<int>(result));
            return std::unexpected(ToErrorCode(result));
        }
        return Core::Ok(Core::Unit{});
    }

    // One sync2 layout transition. Stage/access pairs are given explicitly by the caller.
    struct ImageTransition
    {
        VkImage Image = VK_NULL_HANDLE;
        VkImageAspectFlags Aspect = VK_IMAGE_ASPECT_COLOR_BIT;
        VkImageLayout OldLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkImageLayout NewLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkPipelineStageFlags2 SrcStage = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
        VkAccessFlags2 SrcAccess = 0;
        VkPipelineStageFlags2 DstStage = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        VkAccessFlags2 DstAccess = 0;
        uint32_t LevelCount = 1;
    };

    inline void ImageBarrier(VkCommandBuffer cmd, const ImageTransition& t)
    {
        VkImageMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
        barrier.srcStageMask = t.SrcStage;
        barrier.srcAccessMask = t.SrcAccess;
        barrier.dstStageMask = t.DstStage;
        barrier.dstAccessMask = t.DstAccess;
        barrier.oldLayout = t.OldLayout;
        barrier.newLayout = t.NewLayout;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.image = t.Image;
        barrier.subresourceRange = {t.Aspect, 0, t.LevelCount, 0, 1};

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.imageMemoryBarrierCount = 1;
        depInfo.pImageMemoryBarriers = &barrier;
        vkCmdPipelineBarrier2(cmd, &depInfo);
    }

    // Makes a transfer write to a buffer visible to the given consumer stage/access.
    inline void BufferTransferBarrier(VkCommandBuffer cmd, VkBuffer buffer, VkPipelineStageFlags2 dstStage,
                                      VkAccessFlags2 dstAccess)
    {
        VkBufferMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
        barrier.srcStageMask = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
        barrier.srcAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
        barrier.dstStageMask = dstStage;
        barrier.dstAccessMask = dstAccess;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.buffer = buffer;
        barrier.offset = 0;
        barrier.size = VK_WHOLE_SIZE;

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.bufferMemoryBarrierCount = 1;
        depInfo.pBufferMemoryBarriers = &barrier;

        vkCmdPipelineBarrier2(cmd, &depInfo);
    }
}
