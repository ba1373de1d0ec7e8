module;
#include <cstdint>
#include <format>
#include <functional>
#include <limits>

export module Core:Handle;

export namespace Core
{
    // Generational handle. The Tag parameter makes handles of different resource
    // kinds distinct types, so a texture handle never converts to a mesh handle:
    //
    //   using MeshHandle = Core::StrongHandle<struct MeshTag>;
    //   using TextureHandle = Core::StrongHandle<struct TextureTag>;
    //
    // Core::ResourcePool never reuses slots and stamps every handle with
    // generation 1; a default-constructed handle (generation 0) never resolves.
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;
        constexpr StrongHandle(uint32_t index, uint32_t generation) : Index(index), Generation(generation) {}

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t key = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;
            // splitmix64 finalizer
            key = (key ^ (key >> 30)) * 0xbf58476d1ce4e5b9ull;
            key = (key ^ (key >> 27)) * 0x94d049bb133111ebull;
            key ^= key >> 31;
            return static_cast<size_t>(key);
        }
    };

    // Logs as "#index/generation", or "#invalid".
    template <typename Tag>
    struct formatter<Core::StrongHandle<Tag>> : formatter<string_view>
    {
        template <typename FormatContext>
        auto format(const Core::StrongHandle<Tag>& h, FormatContext& ctx) const
        {
            if (!h.IsValid()) return formatter<string_view>::format("#invalid", ctx);
            return std::format_to(ctx.out(), "#{}/{}", h.Index, h.Generation);
        }
    };
}
