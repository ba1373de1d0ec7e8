module;
#include <array>
#include <cstdint>
#include <vector>
#include <memory>
#include <string>
#include <utility>
#include "RHI.Vulkan.hpp"

export module Graphics:GpuMirror;

import RHI;
import Core;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // MirrorSyncState
    // -------------------------------------------------------------------------
    // Tracks whether the GPU copy held by each frame slot reflects the latest CPU
    // value. Every CPU mutation bumps the generation; a write stamps the slot.
    // A slot whose stamp lags the generation must be written before a frame that
    // uses it is recorded.
    class MirrorSyncState
    {
    public:
        void MarkDirty() { ++m_Generation; }
        void MarkWritten(uint32_t slot) { m_WrittenGeneration[slot] = m_Generation; }

        [[nodiscard]] bool IsSynchronized(uint32_t slot) const { return m_WrittenGeneration[slot] == m_Generation; }
        [[nodiscard]] bool NeedsWrite(uint32_t slot) const { return !IsSynchronized(slot); }
        [[nodiscard]] uint64_t GetGeneration() const { return m_Generation; }

    private:
        // Starts ahead of every slot so nothing is drawn from an uninitialized buffer.
        uint64_t m_Generation = 1;
        std::array<uint64_t, RHI::MAX_FRAMES_IN_FLIGHT> m_WrittenGeneration{};
    };

    // -------------------------------------------------------------------------
    // UniformMirror<T>
    // -------------------------------------------------------------------------
    // One host-visible uniform buffer and descriptor set per frame slot, all
    // bound at binding 0 of a single-binding set layout. T must be std140-compatible.
    template <typename T>
    class UniformMirror
    {
    public:
        UniformMirror(RHI::GpuContext& context, VkShaderStageFlags stages, std::string label)
            : m_Context(context), m_Label(std::move(label))
        {
            RHI::VulkanDevice& device = m_Context.GetDevice();

            VkDescriptorSetLayoutBinding binding{};
            binding.binding = 0;
            binding.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            binding.descriptorCount = 1;
            binding.stageFlags = stages;

            m_Layout = std::make_unique<RHI::DescriptorLayout>(device, std::vector{binding});
            m_Pool = std::make_unique<RHI::DescriptorPool>(
                device, std::vector<VkDescriptorPoolSize>{{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, RHI::MAX_FRAMES_IN_FLIGHT}},
                RHI::MAX_FRAMES_IN_FLIGHT);

            if (!m_Layout->IsValid() || !m_Pool->IsValid())
            {
                Core::Log::Error("{}: descriptor layout/pool creation failed.", m_Label);
                return;
            }

            for (uint32_t slot = 0; slot < RHI::MAX_FRAMES_IN_FLIGHT; ++slot)
            {
                m_Buffers[slot] = std::make_unique<RHI::VulkanBuffer>(
                    device, sizeof(T), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, VMA_MEMORY_USAGE_CPU_TO_GPU);
                if (!m_Buffers[slot]->IsValid())
                {
                    Core::Log::Error("{}: uniform buffer for slot {} could not be allocated.", m_Label, slot);
                    return;
                }

                m_Sets[slot] = m_Pool->Allocate(m_Layout->GetHandle());
                if (m_Sets[slot] == VK_NULL_HANDLE)
                {
                    Core::Log::Error("{}: descriptor set for slot {} could not be allocated.", m_Label, slot);
                    return;
                }
                RHI::WriteBufferDescriptor(device, m_Sets[slot], 0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
                                           m_Buffers[slot]->GetHandle(), sizeof(T));
            }
            m_IsValid = true;
        }

        UniformMirror(const UniformMirror&) = delete;
        UniformMirror& operator=(const UniformMirror&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        void Set(const T& value)
        {
            m_Value = value;
            m_Sync.MarkDirty();
        }

        [[nodiscard]] const T& Get() const { return m_Value; }

        // Copies the CPU value into the current slot's buffer. Waits for the slot to
        // retire first; does nothing when the slot already holds the latest value.
        [[nodiscard]] Core::Result WriteToGpu()
        {
            if (!m_IsValid) return std::unexpected(Core::ErrorCode::InvalidState);

            m_Context.WaitForFrameSlot();
            const uint32_t slot = m_Context.GetFrameIndex();
            if (!m_Sync.NeedsWrite(slot)) return Core::Ok(Core::Unit{});

            if (!m_Buffers[slot]->Write(&m_Value, sizeof(T)))
            {
                Core::Log::Error("{}: write of {} bytes into slot {} failed.", m_Label, sizeof(T), slot);
                return std::unexpected(Core::ErrorCode::ResourceUploadFailed);
            }
            m_Sync.MarkWritten(slot);
            ++m_WriteCount;
            return Core::Ok(Core::Unit{});
        }

        // Current contents of a slot's mirror buffer.
        [[nodiscard]] Core::Expected<T> ReadMirror(uint32_t slot) const
        {
            if (!m_IsValid || slot >= RHI::MAX_FRAMES_IN_FLIGHT)
                return std::unexpected(Core::ErrorCode::OutOfRange);

            T out{};
            if (!m_Buffers[slot]->Read(&out)) return std::unexpected(Core::ErrorCode::InvalidState);
            return out;
        }

        [[nodiscard]] bool IsSynchronized(uint32_t slot) const { return m_Sync.IsSynchronized(slot); }
        [[nodiscard]] const MirrorSyncState& GetSyncState() const { return m_Sync; }
        [[nodiscard]] uint64_t GetWriteCount() const { return m_WriteCount; }
        [[nodiscard]] VkDescriptorSet GetDescriptorSet(uint32_t slot) const { return m_Sets[slot]; }
        [[nodiscard]] const RHI::DescriptorLayout& GetLayout() const { return *m_Layout; }

    private:
        RHI::GpuContext& m_Context;
        std::string m_Label;
        std::unique_ptr<RHI::DescriptorLayout> m_Layout;
        std::unique_ptr<RHI::DescriptorPool> m_Pool;
        std::array<std::unique_ptr<RHI::VulkanBuffer>, RHI::MAX_FRAMES_IN_FLIGHT> m_Buffers;
        std::array<VkDescriptorSet, RHI::MAX_FRAMES_IN_FLIGHT> m_Sets{};

        T m_Value{};
        MirrorSyncState m_Sync;
        uint64_t m_WriteCount = 0;
        bool m_IsValid = false;
    };
}
