module;
#include <cstddef>
#include <limits>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage,
                               VmaMemoryUsage memoryUsage)
        : m_Device(device), m_SizeBytes(size)
    {
        if (size == 0)
        {
            Core::Log::Error("VulkanBuffer: refusing to create a zero-sized buffer (usage={:#x}).", usage);
            return;
        }

        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = size;
        bufferInfo.usage = usage;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = memoryUsage;
        if (memoryUsage == VMA_MEMORY_USAGE_CPU_TO_GPU || memoryUsage == VMA_MEMORY_USAGE_CPU_ONLY)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }
        else if (memoryUsage == VMA_MEMORY_USAGE_GPU_TO_CPU)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        VmaAllocationInfo resultInfo{};
        if (VkResult result = vmaCreateBuffer(m_Device.GetAllocator(), &bufferInfo, &allocInfo, &m_Buffer,
                                              &m_Allocation, &resultInfo); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer! size={} usage={:#x} result={}", size, usage,
                             static_cast<int>(result));
            m_Buffer = VK_NULL_HANDLE;
            return;
        }

        if (resultInfo.pMappedData != nullptr)
        {
            m_MappedData = resultInfo.pMappedData;
            m_IsHostVisible = true;
        }
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (m_Buffer)
        {
            VkBuffer buffer = m_Buffer;
            VmaAllocation allocation = m_Allocation;
            VmaAllocator allocator = m_Device.GetAllocator();

            m_Device.SafeDestroy([allocator, buffer, allocation]()
            {
                vmaDestroyBuffer(allocator, buffer, allocation);
            });
        }
    }

    void VulkanBuffer::Invalidate(size_t offset, size_t size)
    {
        if (!m_Allocation) return;
        VK_CHECK(vmaInvalidateAllocation(m_Device.GetAllocator(), m_Allocation, offset,
                                         size == std::numeric_limits<size_t>::max() ? VK_WHOLE_SIZE : size));
    }

    void VulkanBuffer::Flush(size_t offset, size_t size)
    {
        if (!m_Allocation) return;
        VK_CHECK(vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset,
                                    size == std::numeric_limits<size_t>::max() ? VK_WHOLE_SIZE : size));
    }
}
