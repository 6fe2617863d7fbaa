module;

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

module Runtime.CatalogStreamer;

import Core;
import Graphics;
import ECS;
import Visibility;
import Residency;

namespace Runtime
{
    CatalogStreamer::CatalogStreamer(ECS::SceneObjectRegistry& registry,
                                     Config config,
                                     Visibility::VisibilityEngine::Config visibilityConfig,
                                     Residency::ResidencyManager::Config residencyConfig,
                                     std::shared_ptr<Residency::IResourceSource> source)
        : m_Registry(registry),
          m_Config(config),
          m_Visibility(visibilityConfig),
          m_Residency(std::move(residencyConfig), std::move(source))
    {
        if (m_Config.CycleInterval == 0)
            m_Config.CycleInterval = 1;

        Core::Log::Info("CatalogStreamer: Initialized (cycle every {} frames, {} upgrades per cycle).",
                        m_Config.CycleInterval, m_Config.MaxUpgradesPerCycle);
    }

    bool CatalogStreamer::OnFrame(const Graphics::CameraComponent& camera, Residency::Clock::time_point now)
    {
        ++m_FrameNumber;

        const bool due = (m_CycleCount == 0) ||
                         (m_FrameNumber - m_LastCycleFrame >= m_Config.CycleInterval);
        if (!due)
            return false;

        RunCycle(camera, now);
        return true;
    }

    void CatalogStreamer::RunCycle(const Graphics::CameraComponent& camera, Residency::Clock::time_point now)
    {
        m_LastCycleFrame = m_FrameNumber;
        ++m_CycleCount;

        // A rejected camera leaves the last partition in place; Classify() serves it.
        if (auto frustum = m_Visibility.UpdateFrustum(camera); !frustum)
            Core::Log::Debug("CatalogStreamer: cycle {} reuses the previous partition.", m_CycleCount);

        const std::vector<ECS::EntityView> entities = m_Registry.Gather();
        const Visibility::VisibilityPartition& partition = m_Visibility.Classify(entities, camera.Position);

        m_Residency.BeginCycle(partition, now);

        // Nearest first.
        for (const Visibility::ClassifiedEntity* candidate :
             Visibility::VisibilityEngine::GetClosestVisible(partition, m_Config.MaxUpgradesPerCycle))
        {
            m_Residency.GetOrResolveResource(candidate->Entity, candidate->Distance, true);
        }

        m_Residency.EndCycle();

        if (m_Config.StatsLogIntervalCycles != 0 && m_CycleCount % m_Config.StatsLogIntervalCycles == 0)
            LogCycleStats();
    }

    void CatalogStreamer::LogCycleStats() const
    {
        const auto stats = m_Residency.GetStats();
        Core::Log::Info("CatalogStreamer: cycle {} | visible {} | HIGH {} LOW {} | thresholds {:.3g}/{:.3g} | pending {}",
                        m_CycleCount, stats.VisibleCount, stats.HighCount, stats.LowCount,
                        stats.Thresholds.HighDistance, stats.Thresholds.LowDistance, stats.PendingFetches);
    }
}
