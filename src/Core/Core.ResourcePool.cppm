module;

#include <cstdint>
#include <vector>
#include <expected>
#include <memory>
#include <concepts>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Append-only owner of immutable GPU resources addressed by generational handles.
    // Slots are never recycled, so a handle stays valid until Clear(). Get() rejects
    // default-constructed handles and indices past the end. Handles carry no pool
    // identity: one minted by another pool resolves if its index is in range here.
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;
        ResourcePool(ResourcePool&&) noexcept = default;
        ResourcePool& operator=(ResourcePool&&) noexcept = default;

        // Accepts unique_ptr to enforce ownership transfer
        Handle Add(std::unique_ptr<T> resource)
        {
            const auto index = static_cast<uint32_t>(m_Slots.size());
            // POINTER STABILITY: the resource heap address stays constant when m_Slots reallocates.
            m_Slots.push_back({std::move(resource), kGeneration});
            return {index, kGeneration};
        }

        template<typename... Args>
        Handle Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        [[nodiscard]] Core::Expected<T*> Get(Handle handle) const
        {
            if (handle.Index >= m_Slots.size())
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            const Slot& slot = m_Slots[handle.Index];
            if (!slot.Data || slot.Generation != handle.Generation)
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            return slot.Data.get();
        }

        void Clear() { m_Slots.clear(); }

        [[nodiscard]] size_t Size() const { return m_Slots.size(); }

    private:
        static constexpr uint32_t kGeneration = 1;

        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
        };

        std::vector<Slot> m_Slots;
    };
}
