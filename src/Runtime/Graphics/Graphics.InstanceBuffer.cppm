module;
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include "RHI.Vulkan.hpp"

export module Graphics:InstanceBuffer;

import :GpuMirror;
import RHI;
import Core;

export namespace Graphics
{
    struct Instance
    {
        glm::vec3 Position{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    // std430 element of the instance storage buffer (set 3, binding 0).
    struct GpuInstance
    {
        glm::mat4 Model{1.0f};
        glm::mat4 Normal{1.0f}; // Rotation only; instances carry no scale.
    };

    [[nodiscard]] GpuInstance PackInstance(const Instance& instance);

    // perRow x perRow instances on the XZ plane centred on the origin. Every instance is
    // rotated 45 degrees about its own normalized position; the one at the origin is not.
    [[nodiscard]] std::vector<Instance> MakeInstanceGrid(uint32_t perRow, float spacing);

    // Per-instance transforms and their per-slot storage buffers. The draw order of
    // instances is the order of the list passed to SetInstances().
    class InstanceBuffer
    {
    public:
        explicit InstanceBuffer(RHI::GpuContext& context, uint32_t initialCapacity = 16);
        ~InstanceBuffer();

        InstanceBuffer(const InstanceBuffer&) = delete;
        InstanceBuffer& operator=(const InstanceBuffer&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        void SetInstances(std::span<const Instance> instances);

        // Flushes the packed list into the current slot when that slot is behind. Grows
        // the slot's buffer (and rewrites its descriptor set) when the list outgrew it.
        [[nodiscard]] Core::Result WriteToGpu();

        [[nodiscard]] uint32_t GetInstanceCount() const { return static_cast<uint32_t>(m_Packed.size()); }
        [[nodiscard]] const std::vector<GpuInstance>& GetPackedInstances() const { return m_Packed; }

        // Instance count resident in a slot's buffer after its last write.
        [[nodiscard]] uint32_t GetGpuInstanceCount(uint32_t slot) const { return m_Slots[slot].Count; }
        [[nodiscard]] uint32_t GetCapacity(uint32_t slot) const { return m_Slots[slot].Capacity; }
        [[nodiscard]] uint64_t GetReallocationCount() const { return m_ReallocationCount; }
        [[nodiscard]] uint64_t GetWriteCount() const { return m_WriteCount; }

        [[nodiscard]] bool IsSynchronized(uint32_t slot) const { return m_Sync.IsSynchronized(slot); }
        [[nodiscard]] VkDescriptorSet GetDescriptorSet(uint32_t slot) const { return m_Slots[slot].Set; }
        [[nodiscard]] const RHI::DescriptorLayout& GetLayout() const { return *m_Layout; }

        // Current contents of a slot's buffer, GetGpuInstanceCount(slot) elements.
        [[nodiscard]] Core::Expected<std::vector<GpuInstance>> ReadMirror(uint32_t slot) const;

    private:
        struct SlotBuffer
        {
            std::unique_ptr<RHI::VulkanBuffer> Buffer;
            VkDescriptorSet Set = VK_NULL_HANDLE;
            uint32_t Capacity = 0;
            uint32_t Count = 0;
        };

        RHI::GpuContext& m_Context;
        std::unique_ptr<RHI::DescriptorLayout> m_Layout;
        std::unique_ptr<RHI::DescriptorPool> m_Pool;
        std::array<SlotBuffer, RHI::MAX_FRAMES_IN_FLIGHT> m_Slots;

        std::vector<GpuInstance> m_Packed;
        MirrorSyncState m_Sync;
        uint64_t m_ReallocationCount = 0;
        uint64_t m_WriteCount = 0;
        bool m_IsValid = false;

        bool AllocateSlot(SlotBuffer& slot, uint32_t capacity);
    };
}
