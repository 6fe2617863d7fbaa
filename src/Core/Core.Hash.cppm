module;

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

export module Core:Hash;

export namespace Core::Hash
{
    // FNV-1a Hash
    constexpr uint32_t HashString(std::string_view str)
    {
        uint32_t hash = 2166136261u;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 16777619u;
        }
        return hash;
    }

    // FNV-1a 64-bit. Stable across runs and platforms; used for identity-derived seeds.
    constexpr uint64_t HashString64(std::string_view str)
    {
        uint64_t hash = 14695981039346656037ULL;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 1099511628211ULL;
        }
        return hash;
    }

    // MurmurHash3 finalizer (high avalanche).
    constexpr uint64_t Mix64(uint64_t val)
    {
        val ^= val >> 33;
        val *= 0xff51afd7ed558ccdULL;
        val ^= val >> 33;
        val *= 0xc4ceb9fe1a85ec53ULL;
        val ^= val >> 33;
        return val;
    }

    constexpr uint64_t HashCombine(uint64_t seed, uint64_t value)
    {
        return Mix64(seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2)));
    }

    struct StringID
    {
        uint32_t Value;

        constexpr StringID() : Value(0)
        {
        }

        constexpr StringID(uint32_t v) : Value(v)
        {
        }

        constexpr StringID(std::string_view str) : Value(HashString(str))
        {
        }

        auto operator<=>(const StringID&) const = default;
        bool operator==(const StringID& other) const { return Value == other.Value; }
    };

    // User-defined literal for convenient IDs, e.g. "high"_id.
    constexpr StringID operator""_id(const char* str, size_t len)
    {
        return {std::string_view(str, len)};
    }

    // Transparent hasher so unordered containers keyed by std::string accept string_view lookups.
    struct TransparentStringHash
    {
        using is_transparent = void;

        size_t operator()(std::string_view str) const noexcept
        {
            return std::hash<std::string_view>{}(str);
        }
    };
}

template <>
struct std::hash<Core::Hash::StringID>
{
    std::size_t operator()(const Core::Hash::StringID& id) const noexcept
    {
        return std::hash<uint32_t>{}(id.Value);
    }
};
