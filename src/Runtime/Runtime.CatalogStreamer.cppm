module;

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

export module Runtime.CatalogStreamer;

import Graphics;
import ECS;
import Visibility;
import Residency;

export namespace Runtime
{
    // Drives visibility and residency from the render loop.
    // Every CycleInterval frames:
    //   UpdateFrustum -> Classify -> BeginCycle -> GetOrResolveResource
    //   (nearest MaxUpgradesPerCycle visible entities) -> EndCycle
    // In between, frames only read what is resident.
    class CatalogStreamer
    {
    public:
        struct Config
        {
            uint32_t CycleInterval = 60;        // Frames between cycles
            size_t MaxUpgradesPerCycle = 256;   // Resolution requests per cycle
            uint32_t StatsLogIntervalCycles = 10; // 0 = never
        };

        CatalogStreamer(ECS::SceneObjectRegistry& registry,
                        Config config = {},
                        Visibility::VisibilityEngine::Config visibilityConfig = {},
                        Residency::ResidencyManager::Config residencyConfig = {},
                        std::shared_ptr<Residency::IResourceSource> source = nullptr);

        CatalogStreamer(const CatalogStreamer&) = delete;
        CatalogStreamer& operator=(const CatalogStreamer&) = delete;

        // Returns true when a cycle ran on this frame.
        bool OnFrame(const Graphics::CameraComponent& camera, Residency::Clock::time_point now);

        // Runs a cycle regardless of cadence.
        void RunCycle(const Graphics::CameraComponent& camera, Residency::Clock::time_point now);

        [[nodiscard]] std::optional<Residency::ResourceView> GetResident(std::string_view entityId) const
        {
            return m_Residency.GetResident(entityId);
        }

        [[nodiscard]] Visibility::VisibilityEngine& GetVisibility() { return m_Visibility; }
        [[nodiscard]] Residency::ResidencyManager& GetResidency() { return m_Residency; }
        [[nodiscard]] const Residency::ResidencyManager& GetResidency() const { return m_Residency; }

        void SetConfig(const Config& config) { m_Config = config; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }
        [[nodiscard]] uint64_t GetCycleCount() const { return m_CycleCount; }

    private:
        void LogCycleStats() const;

        ECS::SceneObjectRegistry& m_Registry;
        Config m_Config;

        Visibility::VisibilityEngine m_Visibility;
        Residency::ResidencyManager m_Residency;

        uint64_t m_FrameNumber = 0;
        uint64_t m_LastCycleFrame = 0;
        uint64_t m_CycleCount = 0;
    };
}
