module;
#include <cstdint>
#include <cstring>
#include <limits>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core;

export namespace RHI
{
    class VulkanBuffer
    {
    public:
        // usage: VertexBuffer, IndexBuffer, TransferSrc, UniformBuffer, StorageBuffer...
        // memoryUsage: GPU_ONLY (device local), CPU_TO_GPU (upload/mirror), GPU_TO_CPU (readback).
        // Host-visible buffers are persistently mapped at creation.
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage);
        ~VulkanBuffer();

        // Disable copy
        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }

        // Persistent pointer for host-visible buffers, nullptr for device-local memory.
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }

        // Returns false (and logs) when the write cannot happen.
        bool Write(const void* data, size_t size, size_t offset = 0)
        {
            if (!data || size == 0) return false;
            if (offset + size > m_SizeBytes)
            {
                Core::Log::Error("VulkanBuffer::Write(): out of bounds. size={} offset={} cap={}", size, offset,
                                 m_SizeBytes);
                return false;
            }

            if (!m_IsHostVisible || !m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Write(): buffer is not host-visible. size={} offset={} cap={}. "
                                 "Upload through a staging buffer instead.", size, offset, m_SizeBytes);
                return false;
            }

            std::memcpy(static_cast<uint8_t*>(m_MappedData) + offset, data, size);

            // No-op for coherent memory.
            Flush(offset, size);
            return true;
        }

        // Cache management for non-coherent host-visible memory.
        void Invalidate(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());
        void Flush(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());

        [[nodiscard]] bool IsHostVisible() const { return m_IsHostVisible; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }

        // GPU->CPU copy out of a mapped buffer, invalidating first.
        template <typename T>
        bool Read(T* outData, size_t count = 1, size_t byteOffset = 0)
        {
            if (!outData || count == 0) return false;
            const size_t byteSize = count * sizeof(T);

            if (byteOffset + byteSize > m_SizeBytes)
            {
                Core::Log::Error("VulkanBuffer::Read(): Out of bounds. size={} offset={} cap={}", byteSize,
                                 byteOffset, m_SizeBytes);
                return false;
            }

            Invalidate(byteOffset, byteSize);

            if (!m_MappedData) return false;
            std::memcpy(outData, static_cast<const uint8_t*>(m_MappedData) + byteOffset, byteSize);
            return true;
        }

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        void* m_MappedData = nullptr;

        size_t m_SizeBytes = 0;
        bool m_IsHostVisible = false;
    };
}
