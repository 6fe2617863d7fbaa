module;

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Residency:Manager;

import :Types;
import :Thresholds;
import :ResourceSource;
import :ResourceCache;
import Core;
import Graphics;
import ECS;
import Visibility;
import Synthesis;

export namespace Runtime::Residency
{
    // Capacity-bounded, LRU-evicting cache of per-entity image payloads.
    //
    // One resolution pass ("cycle"):
    //   BeginCycle(partition, now)    installs finished fetches, recomputes thresholds
    //   GetOrResolveResource(...)     per entity, nearest first
    //   EndCycle()                    debounced downgrades, eviction sweep, deferred frees
    //
    // All state is instance-owned and mutated on the owning thread only. Fetches
    // run on the task scheduler and hand their results back through a mailbox
    // that is drained at the next BeginCycle/EndCycle.
    class ResidencyManager
    {
    public:
        struct Config
        {
            float BaseHighDistance = 2.0e8f;
            float BaseLowDistance = 4.0e8f;
            ThresholdTable Thresholds = ThresholdTable::Default();

            uint32_t CapacityHigh = 200;
            uint32_t CapacityLow = 400;

            Clock::duration MinUpdateInterval = std::chrono::milliseconds(500);
            Clock::duration IdleGracePeriod = std::chrono::seconds(3);
            Clock::duration FetchRetryDelay = std::chrono::seconds(5);

            // Cycles a retired payload stays readable after replacement/eviction.
            uint32_t FramesInFlight = 2;
        };

        struct Stats
        {
            size_t HighCount = 0;
            size_t LowCount = 0;
            size_t VisibleCount = 0;
            ThresholdSet Thresholds{};

            size_t Entries = 0;
            size_t PendingFetches = 0;
            size_t RetiredPayloads = 0;

            uint64_t Cycles = 0;
            uint64_t Upgrades = 0;
            uint64_t Downgrades = 0;
            uint64_t IdleEvictions = 0;
            uint64_t LruEvictions = 0;
            uint64_t FetchFailures = 0;
            uint64_t StaleFetches = 0;
            uint64_t DebounceBlocked = 0;
            uint64_t CapacityDenied = 0;
            uint64_t DegradedToLow = 0;
        };

        using NotifyCallback = std::function<void(const ResourceView&)>;

        explicit ResidencyManager(Config config = {}, std::shared_ptr<IResourceSource> source = nullptr);
        ~ResidencyManager();

        ResidencyManager(const ResidencyManager&) = delete;
        ResidencyManager& operator=(const ResidencyManager&) = delete;

        [[nodiscard]] static Core::Result ValidateConfig(const Config& config);

        // Rejected configs leave the current one in place. A lowered capacity is
        // enforced by the next sweep.
        [[nodiscard]] Core::Result SetConfig(const Config& config);
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

        void SetResourceSource(std::shared_ptr<IResourceSource> source);

        // --- Cycle -------------------------------------------------------------
        void BeginCycle(const Visibility::VisibilityPartition& partition, Clock::time_point now);

        // Idempotent for a fixed visibleCount; always re-reads the base distances.
        const ThresholdSet& AdjustThresholds(size_t visibleCount);

        [[nodiscard]] Quality Resolve(float distance, bool isVisible) const;

        // Never blocks. Returns what is resident for the entity after this call;
        // an upgrade started here may land in a later cycle.
        ResourceView GetOrResolveResource(const ECS::EntityView& entity, float distance, bool isVisible);

        void EndCycle();

        // --- Render-loop read path ----------------------------------------------
        [[nodiscard]] std::optional<ResourceView> GetResident(std::string_view entityId) const;

        // Fires once, on the owning thread, when the entity's next upgrade is
        // installed. Fires immediately when it already holds HIGH. Callbacks must
        // not call back into the manager.
        void RequestNotify(std::string_view entityId, NotifyCallback callback);

        // --- Observability -------------------------------------------------------
        [[nodiscard]] const ThresholdSet& GetThresholds() const { return m_Thresholds; }
        [[nodiscard]] Stats GetStats() const;
        void LogDetailedStats() const;

        [[nodiscard]] Synthesis::ProceduralSynthesizer& GetSynthesizer() { return m_Synthesizer; }
        [[nodiscard]] size_t Size() const { return m_Cache.Size(); }

        // Drops every entry. In-flight fetches are discarded when they land.
        void Clear();

    private:
        struct CompletedFetch
        {
            std::string EntityId;
            Quality Tier = Quality::None;
            uint64_t Ticket = 0;
            Core::Expected<Graphics::Image> Result;
        };

        // Shared with worker tasks; outlives the manager if a fetch is still running.
        struct FetchMailbox
        {
            std::mutex Mutex;
            std::vector<CompletedFetch> Completed;
        };

        struct CycleSample
        {
            float Distance = 0.0f;
            bool Visible = false;
        };

        [[nodiscard]] uint32_t CapacityFor(Quality tier) const;
        [[nodiscard]] size_t CommittedCount(Quality tier) const;
        [[nodiscard]] bool HasCapacity(Quality tier, Quality current) const;
        [[nodiscard]] bool IsVisibleThisCycle(std::string_view entityId) const;
        [[nodiscard]] uint32_t ResolutionFor(Quality tier, const ECS::Components::PhysicalAttributes::Component& attributes) const;
        [[nodiscard]] ResourceView MakeView(const ResourceEntry& entry) const;

        void StartFetch(ResourceEntry& entry, Quality tier);
        void InstallPayload(ResourceEntry& entry, Quality tier, std::shared_ptr<const Graphics::Image> payload,
                            bool synthesized);
        void InstallSynthesized(ResourceEntry& entry, Quality tier);
        void DrainCompletedFetches();
        void ReleaseReservation(ResourceEntry& entry);
        void RetireEntryAt(size_t index);
        void ApplyDowngrades();
        void FireNotifications(const ResourceEntry& entry);

        // Frees one slot of `tier` for an entity currently at `current`, sweeping at
        // most once per tier and cycle.
        bool MakeRoom(Quality tier, Quality current);

        // Pass 1: invisible and idle past the grace period. Pass 2: LRU, for tiers
        // above capacity and, when `pressured` is full, for entries of that tier not
        // requested this cycle. Returns the number of removed entries.
        size_t RunEvictionSweep(Quality pressured = Quality::None);

        Config m_Config;
        std::shared_ptr<IResourceSource> m_Source;
        std::shared_ptr<FetchMailbox> m_Mailbox;

        ResourceCache m_Cache;
        Core::ResourcePool<Graphics::Image, PayloadHandle> m_Payloads;
        Synthesis::ProceduralSynthesizer m_Synthesizer;

        ThresholdSet m_Thresholds{};
        std::unordered_map<std::string, CycleSample, Core::Hash::TransparentStringHash, std::equal_to<>> m_Samples;
        size_t m_VisibleCount = 0;
        Clock::time_point m_Now{};
        // A request-path sweep freed nothing for this tier this cycle.
        bool m_HighSweepExhausted = false;
        bool m_LowSweepExhausted = false;

        std::unordered_map<std::string, std::vector<NotifyCallback>,
                           Core::Hash::TransparentStringHash, std::equal_to<>> m_Notify;

        size_t m_HighCount = 0;
        size_t m_LowCount = 0;
        size_t m_PendingHigh = 0;
        size_t m_PendingLow = 0;

        uint64_t m_NextInsertionSeq = 0;
        uint64_t m_NextTicket = 1;
        uint64_t m_Cycle = 0;

        Stats m_Counters{};
    };
}
