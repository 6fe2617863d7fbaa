module;

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Residency:Manager.Impl;

import :Manager;
import Core;
import Graphics;
import ECS;
import Visibility;
import Synthesis;

namespace Runtime::Residency
{
    namespace
    {
        double Percent(size_t count, uint32_t capacity)
        {
            return capacity == 0 ? 0.0 : 100.0 * static_cast<double>(count) / static_cast<double>(capacity);
        }

        bool IsAbsence(Core::ErrorCode code)
        {
            return code == Core::ErrorCode::ResourceNotFound || code == Core::ErrorCode::FileNotFound;
        }
    }

    ResidencyManager::ResidencyManager(Config config, std::shared_ptr<IResourceSource> source)
        : m_Config(std::move(config)),
          m_Source(std::move(source)),
          m_Mailbox(std::make_shared<FetchMailbox>())
    {
        if (auto valid = ValidateConfig(m_Config); !valid)
        {
            Core::Log::Error("ResidencyManager: invalid config ({}), falling back to defaults.",
                             Core::ErrorCodeToString(valid.error()));
            m_Config = Config{};
        }

        m_Payloads.Initialize(m_Config.FramesInFlight);
        AdjustThresholds(0);
    }

    ResidencyManager::~ResidencyManager()
    {
        // Fetches still in flight keep the mailbox alive and are dropped with it.
        m_Payloads.Clear();
    }

    Core::Result ResidencyManager::ValidateConfig(const Config& config)
    {
        if (auto tableValid = config.Thresholds.Validate(); !tableValid)
            return tableValid;

        const float high = config.BaseHighDistance;
        const float low = config.BaseLowDistance;
        if (!std::isfinite(high) || !std::isfinite(low) || high <= 0.0f || low <= 0.0f)
        {
            Core::Log::Error("ResidencyManager: base distances must be positive and finite ({}, {}).", high, low);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (high > low)
        {
            Core::Log::Error("ResidencyManager: base high distance {} exceeds base low distance {}.", high, low);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        // The HIGH zone must stay inside the LOW zone in every bucket.
        for (const ThresholdBucket& bucket : config.Thresholds.Buckets)
        {
            if (high * bucket.HighScale > low * bucket.LowScale)
            {
                Core::Log::Error("ResidencyManager: bucket >{} puts the high threshold beyond the low threshold.",
                                 bucket.AboveVisibleCount);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
        }
        if (high * config.Thresholds.DefaultHighScale > low * config.Thresholds.DefaultLowScale)
        {
            Core::Log::Error("ResidencyManager: default scales put the high threshold beyond the low threshold.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (config.MinUpdateInterval < Clock::duration::zero() ||
            config.IdleGracePeriod < Clock::duration::zero() ||
            config.FetchRetryDelay < Clock::duration::zero())
        {
            Core::Log::Error("ResidencyManager: time windows must not be negative.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        return Core::Ok();
    }

    Core::Result ResidencyManager::SetConfig(const Config& config)
    {
        if (auto valid = ValidateConfig(config); !valid)
            return valid;

        m_Config = config;
        m_Payloads.Initialize(m_Config.FramesInFlight);
        AdjustThresholds(m_VisibleCount);

        Core::Log::Info("ResidencyManager: config updated (capacity {} HIGH / {} LOW, base {:.3g} / {:.3g}).",
                        m_Config.CapacityHigh, m_Config.CapacityLow,
                        m_Config.BaseHighDistance, m_Config.BaseLowDistance);
        return Core::Ok();
    }

    void ResidencyManager::SetResourceSource(std::shared_ptr<IResourceSource> source)
    {
        m_Source = std::move(source);
    }

    // -------------------------------------------------------------------------
    // Cycle
    // -------------------------------------------------------------------------

    void ResidencyManager::BeginCycle(const Visibility::VisibilityPartition& partition, Clock::time_point now)
    {
        ++m_Cycle;
        ++m_Counters.Cycles;
        m_Now = now;
        m_HighSweepExhausted = false;
        m_LowSweepExhausted = false;

        m_Samples.clear();
        m_Samples.reserve(partition.Visible.size() + partition.Invisible.size());
        for (const Visibility::ClassifiedEntity& c : partition.Visible)
            m_Samples.insert_or_assign(c.Entity.Id, CycleSample{c.Distance, true});
        for (const Visibility::ClassifiedEntity& c : partition.Invisible)
            m_Samples.try_emplace(c.Entity.Id, CycleSample{c.Distance, false});

        m_VisibleCount = partition.Visible.size();
        AdjustThresholds(m_VisibleCount);

        DrainCompletedFetches();
    }

    const ThresholdSet& ResidencyManager::AdjustThresholds(size_t visibleCount)
    {
        m_Thresholds = m_Config.Thresholds.Compute(visibleCount, m_Config.BaseHighDistance, m_Config.BaseLowDistance);
        return m_Thresholds;
    }

    Quality ResidencyManager::Resolve(float distance, bool isVisible) const
    {
        return ResolveQuality(distance, isVisible, m_Thresholds);
    }

    ResourceView ResidencyManager::GetOrResolveResource(const ECS::EntityView& entity, float distance, bool isVisible)
    {
        const Quality target = Resolve(distance, isVisible);
        ResourceEntry* entry = m_Cache.Find(entity.Id);

        if (entry)
        {
            entry->LastUsed = m_Now;
            entry->LastUsedCycle = m_Cycle;
            entry->LastTarget = target;
            entry->Attributes = entity.Attributes;

            if (entry->Current >= target || entry->PendingTier != Quality::None)
                return MakeView(*entry);

            if (entry->Current != Quality::None &&
                m_Now - entry->LastQualityChange < m_Config.MinUpdateInterval)
            {
                ++m_Counters.DebounceBlocked;
                return MakeView(*entry);
            }
        }
        else if (target == Quality::None)
        {
            return {};
        }

        Quality tier = target;
        const Quality current = entry ? entry->Current : Quality::None;
        if (!MakeRoom(tier, current))
        {
            const bool degrade = tier == Quality::High && current < Quality::Low && MakeRoom(Quality::Low, current);
            entry = m_Cache.Find(entity.Id); // Sweeps compact the arena.
            if (!degrade)
            {
                ++m_Counters.CapacityDenied;
                Core::Log::Debug("ResidencyManager: {} denied for '{}' (capacity exhausted).",
                                 QualityToString(tier), entity.Id);
                return entry ? MakeView(*entry) : ResourceView{};
            }
            tier = Quality::Low;
            ++m_Counters.DegradedToLow;
        }
        entry = m_Cache.Find(entity.Id);

        if (!entry)
        {
            entry = &m_Cache.Emplace(entity.Id, m_NextInsertionSeq++);
            entry->LastUsed = m_Now;
            entry->LastUsedCycle = m_Cycle;
            entry->LastTarget = target;
            entry->Attributes = entity.Attributes;
        }

        if (m_Source && m_Now >= entry->RetryAfter)
            StartFetch(*entry, tier);
        else
            InstallSynthesized(*entry, tier);

        return MakeView(*entry);
    }

    void ResidencyManager::EndCycle()
    {
        DrainCompletedFetches();
        ApplyDowngrades();
        RunEvictionSweep(Quality::None);
        m_Payloads.ProcessDeletions(m_Cycle);
    }

    // -------------------------------------------------------------------------
    // Read path / notifications
    // -------------------------------------------------------------------------

    std::optional<ResourceView> ResidencyManager::GetResident(std::string_view entityId) const
    {
        const ResourceEntry* entry = m_Cache.Find(entityId);
        if (!entry) return std::nullopt;
        return MakeView(*entry);
    }

    void ResidencyManager::RequestNotify(std::string_view entityId, NotifyCallback callback)
    {
        if (!callback) return;

        if (const ResourceEntry* entry = m_Cache.Find(entityId); entry && entry->Current == Quality::High)
        {
            callback(MakeView(*entry));
            return;
        }

        auto it = m_Notify.find(entityId);
        if (it == m_Notify.end())
            it = m_Notify.emplace(std::string(entityId), std::vector<NotifyCallback>{}).first;
        it->second.push_back(std::move(callback));
    }

    void ResidencyManager::FireNotifications(const ResourceEntry& entry)
    {
        auto it = m_Notify.find(entry.EntityId);
        if (it == m_Notify.end()) return;

        std::vector<NotifyCallback> callbacks = std::move(it->second);
        m_Notify.erase(it);

        const ResourceView view = MakeView(entry);
        for (NotifyCallback& callback : callbacks)
            callback(view);
    }

    // -------------------------------------------------------------------------
    // Capacity accounting
    // -------------------------------------------------------------------------

    uint32_t ResidencyManager::CapacityFor(Quality tier) const
    {
        switch (tier)
        {
            case Quality::High: return m_Config.CapacityHigh;
            case Quality::Low:  return m_Config.CapacityLow;
            default:            return 0;
        }
    }

    size_t ResidencyManager::CommittedCount(Quality tier) const
    {
        switch (tier)
        {
            case Quality::High: return m_HighCount + m_PendingHigh;
            case Quality::Low:  return m_LowCount + m_PendingLow;
            default:            return 0;
        }
    }

    bool ResidencyManager::HasCapacity(Quality tier, Quality current) const
    {
        if (tier == Quality::None || tier == current) return true;
        return CommittedCount(tier) < CapacityFor(tier);
    }

    bool ResidencyManager::MakeRoom(Quality tier, Quality current)
    {
        if (HasCapacity(tier, current))
            return true;

        bool& exhausted = (tier == Quality::High) ? m_HighSweepExhausted : m_LowSweepExhausted;
        if (exhausted)
            return false;

        RunEvictionSweep(tier);
        if (HasCapacity(tier, current))
            return true;

        exhausted = true;
        return false;
    }

    bool ResidencyManager::IsVisibleThisCycle(std::string_view entityId) const
    {
        auto it = m_Samples.find(entityId);
        return it != m_Samples.end() && it->second.Visible;
    }

    uint32_t ResidencyManager::ResolutionFor(Quality tier,
                                             const ECS::Components::PhysicalAttributes::Component& attributes) const
    {
        return tier == Quality::High ? Synthesis::DetailResolutionFor(attributes) : Synthesis::kThumbnailResolution;
    }

    ResourceView ResidencyManager::MakeView(const ResourceEntry& entry) const
    {
        ResourceView view;
        view.Level = entry.Current;
        view.Handle = entry.Payload;
        view.Payload = entry.Payload ? m_Payloads.TryGet(entry.Payload) : nullptr;
        view.PendingLevel = entry.PendingTier;
        return view;
    }

    // -------------------------------------------------------------------------
    // Fetch / install
    // -------------------------------------------------------------------------

    void ResidencyManager::StartFetch(ResourceEntry& entry, Quality tier)
    {
        entry.PendingTier = tier;
        entry.PendingTicket = m_NextTicket++;
        if (tier == Quality::High) ++m_PendingHigh;
        else ++m_PendingLow;

        auto task = [mailbox = m_Mailbox, source = m_Source, id = entry.EntityId, tier, ticket = entry.PendingTicket]()
        {
            auto result = source->Fetch(id, tier);

            std::lock_guard lock(mailbox->Mutex);
            mailbox->Completed.push_back(CompletedFetch{id, tier, ticket, std::move(result)});
        };

        // No worker pool: run inline, the result still waits in the mailbox.
        if (!Core::Tasks::Scheduler::Dispatch(task))
            task();
    }

    void ResidencyManager::ReleaseReservation(ResourceEntry& entry)
    {
        if (entry.PendingTier == Quality::High) --m_PendingHigh;
        else if (entry.PendingTier == Quality::Low) --m_PendingLow;

        entry.PendingTier = Quality::None;
        entry.PendingTicket = 0;
    }

    void ResidencyManager::InstallPayload(ResourceEntry& entry, Quality tier,
                                          std::shared_ptr<const Graphics::Image> payload, bool synthesized)
    {
        if (entry.Payload)
            m_Payloads.Remove(entry.Payload, m_Cycle);

        if (entry.Current == Quality::High) --m_HighCount;
        else if (entry.Current == Quality::Low) --m_LowCount;
        if (tier == Quality::High) ++m_HighCount;
        else if (tier == Quality::Low) ++m_LowCount;

        const bool upgrade = tier > entry.Current;

        entry.Payload = m_Payloads.Add(std::move(payload));
        entry.Current = tier;
        entry.Synthesized = synthesized;
        entry.LastQualityChange = m_Now;

        if (upgrade)
        {
            ++m_Counters.Upgrades;
            FireNotifications(entry);
        }
        else
        {
            ++m_Counters.Downgrades;
        }
    }

    void ResidencyManager::InstallSynthesized(ResourceEntry& entry, Quality tier)
    {
        auto payload = m_Synthesizer.Synthesize(entry.EntityId, entry.Attributes, ResolutionFor(tier, entry.Attributes));
        InstallPayload(entry, tier, std::move(payload), true);
    }

    void ResidencyManager::DrainCompletedFetches()
    {
        std::vector<CompletedFetch> completed;
        {
            std::lock_guard lock(m_Mailbox->Mutex);
            completed.swap(m_Mailbox->Completed);
        }

        for (CompletedFetch& done : completed)
        {
            ResourceEntry* entry = m_Cache.Find(done.EntityId);
            if (!entry || entry->PendingTier == Quality::None || entry->PendingTicket != done.Ticket)
            {
                ++m_Counters.StaleFetches;
                continue;
            }

            ReleaseReservation(*entry);

            // A downgrade overtaken by a renewed demand for the current tier.
            if (done.Tier < entry->Current && entry->LastTarget >= entry->Current)
            {
                ++m_Counters.StaleFetches;
                continue;
            }

            if (done.Result && done.Result->IsValid())
            {
                InstallPayload(*entry, done.Tier,
                               std::make_shared<const Graphics::Image>(std::move(*done.Result)), false);
                continue;
            }

            ++m_Counters.FetchFailures;
            entry->RetryAfter = m_Now + m_Config.FetchRetryDelay;

            const Core::ErrorCode code = done.Result ? Core::ErrorCode::ResourceCorrupted : done.Result.error();
            if (IsAbsence(code))
                Core::Log::Debug("ResidencyManager: no precomputed {} for '{}', synthesizing.",
                                 QualityToString(done.Tier), done.EntityId);
            else
                Core::Log::Warn("ResidencyManager: fetch of {} for '{}' failed ({}), synthesizing.",
                                QualityToString(done.Tier), done.EntityId, Core::ErrorCodeToString(code));

            InstallSynthesized(*entry, done.Tier);
        }
    }

    // -------------------------------------------------------------------------
    // Downgrades / eviction
    // -------------------------------------------------------------------------

    void ResidencyManager::ApplyDowngrades()
    {
        for (ResourceEntry& entry : m_Cache.Entries())
        {
            if (entry.Current != Quality::High || entry.PendingTier != Quality::None)
                continue;

            // Gone from the scene: left to the idle sweep.
            auto sample = m_Samples.find(entry.EntityId);
            if (sample == m_Samples.end())
                continue;

            const Quality target = Resolve(sample->second.Distance, sample->second.Visible);
            entry.LastTarget = target;

            if (target == Quality::High)
                continue;

            if (m_Now - entry.LastQualityChange < m_Config.MinUpdateInterval)
            {
                ++m_Counters.DebounceBlocked;
                continue;
            }

            // Keep HIGH until a LOW slot is available.
            if (!HasCapacity(Quality::Low, entry.Current))
                continue;

            if (m_Source && m_Now >= entry.RetryAfter)
                StartFetch(entry, Quality::Low);
            else
                InstallSynthesized(entry, Quality::Low);
        }
    }

    void ResidencyManager::RetireEntryAt(size_t index)
    {
        ResourceEntry& entry = m_Cache.Entries()[index];

        ReleaseReservation(entry);
        if (entry.Payload)
            m_Payloads.Remove(entry.Payload, m_Cycle);

        if (entry.Current == Quality::High) --m_HighCount;
        else if (entry.Current == Quality::Low) --m_LowCount;

        m_Cache.EraseAt(index);
    }

    size_t ResidencyManager::RunEvictionSweep(Quality pressured)
    {
        // Pass 1: invisible and idle past the grace period.
        size_t idle = 0;
        {
            std::vector<ResourceEntry>& entries = m_Cache.Entries();
            for (size_t i = entries.size(); i-- > 0;)
            {
                const ResourceEntry& entry = entries[i];
                if (!IsVisibleThisCycle(entry.EntityId) && m_Now - entry.LastUsed > m_Config.IdleGracePeriod)
                {
                    RetireEntryAt(i);
                    ++idle;
                }
            }
        }

        // Pass 2: least recently used first, ties by insertion order.
        size_t lru = 0;
        const auto overHigh = [this] { return m_HighCount > m_Config.CapacityHigh; };
        const auto overLow = [this] { return m_LowCount > m_Config.CapacityLow; };
        const auto pressuredFull = [this, pressured]
        {
            return pressured != Quality::None && CommittedCount(pressured) >= CapacityFor(pressured);
        };

        if (overHigh() || overLow() || pressuredFull())
        {
            struct Candidate
            {
                Clock::time_point LastUsed;
                uint64_t InsertionSeq;
                std::string EntityId;
            };

            std::vector<Candidate> candidates;
            candidates.reserve(m_Cache.Size());
            for (const ResourceEntry& entry : m_Cache.Entries())
                candidates.push_back({entry.LastUsed, entry.InsertionSeq, entry.EntityId});

            std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b)
            {
                if (a.LastUsed != b.LastUsed) return a.LastUsed < b.LastUsed;
                return a.InsertionSeq < b.InsertionSeq;
            });

            for (const Candidate& candidate : candidates)
            {
                if (!overHigh() && !overLow() && !pressuredFull()) break;

                const ResourceEntry* entry = m_Cache.Find(candidate.EntityId);
                if (!entry) continue;

                const bool overflow = (entry->Current == Quality::High && overHigh()) ||
                                      (entry->Current == Quality::Low && overLow());

                // Entries requested this cycle never make room for each other.
                const bool stale = entry->LastUsedCycle < m_Cycle && pressuredFull() &&
                                   (entry->Current == pressured || entry->PendingTier == pressured);
                if (!overflow && !stale) continue;

                RetireEntryAt(static_cast<size_t>(entry - m_Cache.Entries().data()));
                ++lru;
            }
        }

        m_Counters.IdleEvictions += idle;
        m_Counters.LruEvictions += lru;

        if (idle + lru > 0)
            Core::Log::Info("ResidencyManager: evicted {} idle + {} LRU entries ({} HIGH, {} LOW resident).",
                            idle, lru, m_HighCount, m_LowCount);
        return idle + lru;
    }

    // -------------------------------------------------------------------------
    // Observability
    // -------------------------------------------------------------------------

    ResidencyManager::Stats ResidencyManager::GetStats() const
    {
        Stats stats = m_Counters;
        stats.HighCount = m_HighCount;
        stats.LowCount = m_LowCount;
        stats.VisibleCount = m_VisibleCount;
        stats.Thresholds = m_Thresholds;
        stats.Entries = m_Cache.Size();
        stats.PendingFetches = m_PendingHigh + m_PendingLow;
        stats.RetiredPayloads = m_Payloads.GetPendingDeletionCount();
        return stats;
    }

    void ResidencyManager::LogDetailedStats() const
    {
        const Stats stats = GetStats();
        const auto synth = m_Synthesizer.GetCacheStats();

        Core::Log::Info("=== Residency (cycle {}) ===", stats.Cycles);
        Core::Log::Info("  HIGH: {}/{} ({:.1f}%)  LOW: {}/{} ({:.1f}%)  pending: {}",
                        stats.HighCount, m_Config.CapacityHigh, Percent(stats.HighCount, m_Config.CapacityHigh),
                        stats.LowCount, m_Config.CapacityLow, Percent(stats.LowCount, m_Config.CapacityLow),
                        stats.PendingFetches);
        Core::Log::Info("  visible: {}  thresholds: high {:.3g} / low {:.3g}",
                        stats.VisibleCount, stats.Thresholds.HighDistance, stats.Thresholds.LowDistance);
        Core::Log::Info("  upgrades {}  downgrades {}  evictions {} idle / {} LRU  denied {}  degraded {}",
                        stats.Upgrades, stats.Downgrades, stats.IdleEvictions, stats.LruEvictions,
                        stats.CapacityDenied, stats.DegradedToLow);
        Core::Log::Info("  fetch failures {}  stale {}  debounced {}  retired payloads {}",
                        stats.FetchFailures, stats.StaleFetches, stats.DebounceBlocked, stats.RetiredPayloads);
        Core::Log::Info("  synthesizer memo: {} images, {:.2f} MiB, {} hits / {} misses",
                        synth.Entries, static_cast<double>(synth.Bytes) / (1024.0 * 1024.0), synth.Hits, synth.Misses);
    }

    void ResidencyManager::Clear()
    {
        for (size_t i = m_Cache.Size(); i-- > 0;)
            RetireEntryAt(i);
    }
}
