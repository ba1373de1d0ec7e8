module;
#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include "RHI.Vulkan.hpp"

module Graphics:InstanceBuffer.Impl;
import :InstanceBuffer;
import RHI;
import Core;

namespace Graphics
{
    GpuInstance PackInstance(const Instance& instance)
    {
        const glm::mat4 rotation = glm::mat4_cast(instance.Rotation);

        GpuInstance gpu;
        gpu.Model = glm::translate(glm::mat4(1.0f), instance.Position) * rotation;
        gpu.Normal = rotation;
        return gpu;
    }

    std::vector<Instance> MakeInstanceGrid(uint32_t perRow, float spacing)
    {
        std::vector<Instance> instances;
        instances.reserve(static_cast<size_t>(perRow) * perRow);

        const float half = static_cast<float>(perRow) / 2.0f;
        for (uint32_t z = 0; z < perRow; ++z)
        {
            for (uint32_t x = 0; x < perRow; ++x)
            {
                Instance instance;
                instance.Position = {spacing * (static_cast<float>(x) - half), 0.0f,
                                     spacing * (static_cast<float>(z) - half)};

                if (glm::length(instance.Position) > 0.0f)
                {
                    instance.Rotation = glm::angleAxis(glm::radians(45.0f), glm::normalize(instance.Position));
                }
                instances.push_back(instance);
            }
        }
        return instances;
    }

    InstanceBuffer::InstanceBuffer(RHI::GpuContext& context, uint32_t initialCapacity)
        : m_Context(context)
    {
        RHI::VulkanDevice& device = m_Context.GetDevice();

        VkDescriptorSetLayoutBinding binding{};
        binding.binding = 0;
        binding.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        binding.descriptorCount = 1;
        binding.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;

        m_Layout = std::make_unique<RHI::DescriptorLayout>(device, std::vector{binding});
        m_Pool = std::make_unique<RHI::DescriptorPool>(
            device, std::vector<VkDescriptorPoolSize>{{VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, RHI::MAX_FRAMES_IN_FLIGHT}},
            RHI::MAX_FRAMES_IN_FLIGHT);

        if (!m_Layout->IsValid() || !m_Pool->IsValid())
        {
            Core::Log::Error("InstanceBuffer: descriptor layout/pool creation failed.");
            return;
        }

        for (SlotBuffer& slot : m_Slots)
        {
            slot.Set = m_Pool->Allocate(m_Layout->GetHandle());
            if (slot.Set == VK_NULL_HANDLE || !AllocateSlot(slot, std::max(initialCapacity, 1u)))
            {
                Core::Log::Error("InstanceBuffer: initial slot allocation failed (capacity {}).", initialCapacity);
                return;
            }
        }
        m_IsValid = true;
    }

    InstanceBuffer::~InstanceBuffer() = default;

    bool InstanceBuffer::AllocateSlot(SlotBuffer& slot, uint32_t capacity)
    {
        auto buffer = std::make_unique<RHI::VulkanBuffer>(
            m_Context.GetDevice(), static_cast<size_t>(capacity) * sizeof(GpuInstance),
            VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, VMA_MEMORY_USAGE_CPU_TO_GPU);
        if (!buffer->IsValid()) return false;

        // The previous buffer is released through the device's deferred deletion queue.
        slot.Buffer = std::move(buffer);
        slot.Capacity = capacity;
        RHI::WriteBufferDescriptor(m_Context.GetDevice(), slot.Set, 0, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                                   slot.Buffer->GetHandle(), VK_WHOLE_SIZE);
        return true;
    }

    void InstanceBuffer::SetInstances(std::span<const Instance> instances)
    {
        m_Packed.clear();
        m_Packed.reserve(instances.size());
        for (const Instance& instance : instances)
        {
            m_Packed.push_back(PackInstance(instance));
        }
        m_Sync.MarkDirty();
    }

    Core::Result InstanceBuffer::WriteToGpu()
    {
        if (!m_IsValid) return std::unexpected(Core::ErrorCode::InvalidState);

        m_Context.WaitForFrameSlot();
        const uint32_t slotIndex = m_Context.GetFrameIndex();
        if (!m_Sync.NeedsWrite(slotIndex)) return Core::Ok(Core::Unit{});

        SlotBuffer& slot = m_Slots[slotIndex];
        const auto count = static_cast<uint32_t>(m_Packed.size());

        if (count > slot.Capacity)
        {
            uint32_t capacity = std::max(slot.Capacity, 1u);
            while (capacity < count) capacity *= 2;

            // Slot fence is already waited, so its descriptor set is not referenced by pending work.
            if (!AllocateSlot(slot, capacity))
            {
                Core::Log::Error("InstanceBuffer: growing slot {} to {} instances failed.", slotIndex, capacity);
                return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
            }
            ++m_ReallocationCount;
            Core::Log::Debug("InstanceBuffer: slot {} reallocated for {} instances.", slotIndex, capacity);
        }

        if (count > 0 && !slot.Buffer->Write(m_Packed.data(), m_Packed.size() * sizeof(GpuInstance)))
        {
            Core::Log::Error("InstanceBuffer: write of {} instances into slot {} failed.", count, slotIndex);
            return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
        }

        slot.Count = count;
        m_Sync.MarkWritten(slotIndex);
        ++m_WriteCount;
        return Core::Ok(Core::Unit{});
    }

    Core::Expected<std::vector<GpuInstance>> InstanceBuffer::ReadMirror(uint32_t slotIndex) const
    {
        if (!m_IsValid || slotIndex >= RHI::MAX_FRAMES_IN_FLIGHT)
            return std::unexpected(Core::ErrorCode::OutOfRange);

        const SlotBuffer& slot = m_Slots[slotIndex];
        std::vector<GpuInstance> out(slot.Count);
        if (slot.Count > 0 && !slot.Buffer->Read(out.data(), out.size()))
            return std::unexpected(Core::ErrorCode::InvalidState);
        return out;
    }
}
