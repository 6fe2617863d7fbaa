module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

export module Synthesis:ProceduralSynthesizer;

import :Classifier;
import Core;
import Graphics;
import ECS;

export namespace Runtime::Synthesis
{
    // Resolutions at or below this produce the flat radial-gradient thumbnail
    // instead of the layered texture.
    inline constexpr uint32_t kThumbnailResolution = 32;

    // Layered texture size for an entity: >10 -> 512, >5 -> 256, >2 -> 128, else 64.
    // Missing radius -> 256.
    [[nodiscard]] uint32_t DetailResolutionFor(const ECS::Components::PhysicalAttributes::Component& attributes);

    // Deterministic, memoized attributes -> image function.
    //
    // Output for a given (entityId, resolution) is bit-identical across calls:
    // every random choice is drawn from a generator seeded by the id and the
    // resolution. The memo table is the only state; it is owned by the
    // instance and must be used from a single thread.
    class ProceduralSynthesizer
    {
    public:
        struct CacheStats
        {
            size_t Entries = 0;
            size_t Bytes = 0;
            uint64_t Hits = 0;
            uint64_t Misses = 0;
        };

        ProceduralSynthesizer() = default;
        ProceduralSynthesizer(const ProceduralSynthesizer&) = delete;
        ProceduralSynthesizer& operator=(const ProceduralSynthesizer&) = delete;

        [[nodiscard]] std::shared_ptr<const Graphics::Image> Synthesize(
            std::string_view entityId,
            const ECS::Components::PhysicalAttributes::Component& attributes,
            uint32_t resolution);

        [[nodiscard]] CacheStats GetCacheStats() const;
        void ClearCache();

    private:
        struct MemoKey
        {
            std::string EntityId;
            uint32_t Resolution = 0;
            bool operator==(const MemoKey&) const = default;
        };

        struct MemoKeyHash
        {
            size_t operator()(const MemoKey& key) const noexcept
            {
                return static_cast<size_t>(Core::Hash::HashCombine(Core::Hash::HashString64(key.EntityId),
                                                                   key.Resolution));
            }
        };

        std::unordered_map<MemoKey, std::shared_ptr<const Graphics::Image>, MemoKeyHash> m_Memo;
        size_t m_Bytes = 0;
        uint64_t m_Hits = 0;
        uint64_t m_Misses = 0;
    };
}
