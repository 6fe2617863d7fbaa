module;

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

export module Core:Handle;

import :Hash;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // The Tag type parameter ensures handles of different resource types
    // cannot be accidentally mixed up at compile time.
    //
    //   struct PayloadTag {};
    //   using PayloadHandle = Core::StrongHandle<PayloadTag>;
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

// Allow StrongHandle to be used in unordered containers
template <typename Tag>
struct std::hash<Core::StrongHandle<Tag>>
{
    std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
    {
        // Pack into 64-bit integer (assuming 32-bit index/gen)
        const uint64_t val = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;
        return static_cast<std::size_t>(Core::Hash::Mix64(val));
    }
};
