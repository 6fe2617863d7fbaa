module;

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

export module Residency:ResourceCache;

import :Types;
import Core;
import ECS;

export namespace Runtime::Residency
{
    struct ResourceEntry
    {
        std::string EntityId;

        Quality Current = Quality::None;
        PayloadHandle Payload{};
        bool Synthesized = false; // Payload origin: procedural vs. precomputed

        Clock::time_point LastUsed{};
        uint64_t LastUsedCycle = 0;
        Clock::time_point LastQualityChange{};
        Quality LastTarget = Quality::None;
        uint64_t InsertionSeq = 0;

        // In-flight fetch. Its tier is reserved against capacity until it lands.
        Quality PendingTier = Quality::None;
        uint64_t PendingTicket = 0;

        // No fetch for this entity before this point (set after a failed fetch).
        Clock::time_point RetryAfter{};

        // Latest attributes; needed when a failed fetch falls back to synthesis.
        ECS::Components::PhysicalAttributes::Component Attributes{};
    };

    // Dense arena of entries plus an id -> slot lookup. Erase is swap-and-pop,
    // so indices are only stable until the next erase.
    class ResourceCache
    {
    public:
        [[nodiscard]] ResourceEntry* Find(std::string_view entityId)
        {
            auto it = m_Lookup.find(entityId);
            return it != m_Lookup.end() ? &m_Entries[it->second] : nullptr;
        }

        [[nodiscard]] const ResourceEntry* Find(std::string_view entityId) const
        {
            auto it = m_Lookup.find(entityId);
            return it != m_Lookup.end() ? &m_Entries[it->second] : nullptr;
        }

        // Precondition: no entry for entityId.
        ResourceEntry& Emplace(std::string entityId, uint64_t insertionSeq)
        {
            const size_t index = m_Entries.size();
            ResourceEntry& entry = m_Entries.emplace_back();
            entry.EntityId = std::move(entityId);
            entry.InsertionSeq = insertionSeq;
            m_Lookup.emplace(entry.EntityId, index);
            return entry;
        }

        void EraseAt(size_t index)
        {
            m_Lookup.erase(m_Entries[index].EntityId);

            const size_t last = m_Entries.size() - 1;
            if (index != last)
            {
                m_Entries[index] = std::move(m_Entries[last]);
                m_Lookup[m_Entries[index].EntityId] = index;
            }
            m_Entries.pop_back();
        }

        bool Erase(std::string_view entityId)
        {
            auto it = m_Lookup.find(entityId);
            if (it == m_Lookup.end()) return false;
            EraseAt(it->second);
            return true;
        }

        [[nodiscard]] std::vector<ResourceEntry>& Entries() { return m_Entries; }
        [[nodiscard]] const std::vector<ResourceEntry>& Entries() const { return m_Entries; }

        [[nodiscard]] size_t Size() const { return m_Entries.size(); }
        [[nodiscard]] bool Empty() const { return m_Entries.empty(); }

        void Clear()
        {
            m_Entries.clear();
            m_Lookup.clear();
        }

    private:
        std::vector<ResourceEntry> m_Entries;
        std::unordered_map<std::string, size_t, Core::Hash::TransparentStringHash, std::equal_to<>> m_Lookup;
    };
}
