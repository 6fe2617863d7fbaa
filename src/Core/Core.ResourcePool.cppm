module;

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

export module Core:ResourcePool;

import :Error;

export namespace Core
{
    // Concept to ensure the Handle type fits the engine's requirements
    template <typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Generational slot pool holding shared, immutable payloads.
    //
    // Removal is deferred: Remove() hides the slot immediately (Get() fails),
    // but the payload reference is only dropped once FramesInFlight frames
    // have passed, so a frame that bound the payload before the removal can
    // still finish reading it.
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;

        void Initialize(const uint32_t framesInFlight)
        {
            m_FramesInFlight = framesInFlight;
        }

        Handle Add(std::shared_ptr<const T> resource)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource);
            ++slot.Generation;
            slot.IsActive = true;
            ++m_ActiveCount;

            return {index, slot.Generation};
        }

        void Remove(Handle handle, uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size()) return;

            Slot& slot = m_Slots[handle.Index];
            // Check generation to prevent double-free of reused slots
            if (slot.IsActive && slot.Generation == handle.Generation)
            {
                slot.IsActive = false;
                --m_ActiveCount;

                m_PendingKillList.push_back({
                    .SlotIndex = handle.Index,
                    .Generation = handle.Generation,
                    .KillFrameNumber = currentFrameNumber
                });
            }
        }

        void ProcessDeletions(uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);
            if (m_PendingKillList.empty()) return;

            std::erase_if(m_PendingKillList, [&](const PendingKill& item)
            {
                // Wait for FramesInFlight to pass
                if (currentFrameNumber <= item.KillFrameNumber + m_FramesInFlight)
                    return false;

                if (item.SlotIndex < m_Slots.size())
                {
                    Slot& slot = m_Slots[item.SlotIndex];
                    if (!slot.IsActive && slot.Generation == item.Generation)
                    {
                        slot.Data.reset();
                        m_FreeIndices.push_back(item.SlotIndex);
                    }
                }
                return true;
            });
        }

        [[nodiscard]] Expected<std::shared_ptr<const T>> Get(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size())
                return std::unexpected(ErrorCode::ResourceNotFound);

            const Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation)
                return std::unexpected(ErrorCode::ResourceNotFound);

            return slot.Data;
        }

        // Hot-path access. Returns nullptr for stale or unknown handles.
        [[nodiscard]] const T* TryGet(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);
            if (handle.Index < m_Slots.size())
            {
                const Slot& slot = m_Slots[handle.Index];
                if (slot.IsActive && slot.Generation == handle.Generation)
                    return slot.Data.get();
            }
            return nullptr;
        }

        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_PendingKillList.clear();
            m_Slots.clear();
            m_FreeIndices.clear();
            m_ActiveCount = 0;
        }

        [[nodiscard]] size_t Size() const
        {
            std::shared_lock lock(m_Mutex);
            return m_ActiveCount;
        }

        [[nodiscard]] size_t GetPendingDeletionCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_PendingKillList.size();
        }

    private:
        struct Slot
        {
            std::shared_ptr<const T> Data;
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        struct PendingKill
        {
            uint32_t SlotIndex;
            uint32_t Generation;
            uint64_t KillFrameNumber;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<PendingKill> m_PendingKillList;
        size_t m_ActiveCount = 0;

        mutable std::shared_mutex m_Mutex;
        uint32_t m_FramesInFlight = 2;
    };
}
