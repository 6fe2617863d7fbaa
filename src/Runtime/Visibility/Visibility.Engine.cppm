module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Visibility:Engine;

import Core;
import Geometry;
import Graphics;
import ECS;

export namespace Runtime::Visibility
{
    struct ClassifiedEntity
    {
        ECS::EntityView Entity;
        float Distance = 0.0f; // Center to camera, scene units
    };

    // Result of one classification pass. Rebuilt from scratch every cycle.
    struct VisibilityPartition
    {
        std::vector<ClassifiedEntity> Visible;
        std::vector<ClassifiedEntity> Invisible;
        uint64_t Cycle = 0; // Classification pass that produced it; 0 = never classified
    };

    // Binary per-cycle visibility: an entity is visible iff it lies within
    // MaxRenderDistance of the camera AND its bounding sphere intersects the
    // frustum. The distance test runs first.
    //
    // Contract:
    //  - UpdateFrustum() must precede Classify() in the same cycle. A frustum is
    //    consumed by one Classify(); classifying again without a fresh frustum
    //    returns the previous partition unchanged.
    //  - A camera holding NaN/Inf is logged and skipped; the last valid
    //    partition is served until a valid camera arrives.
    class VisibilityEngine
    {
    public:
        struct Config
        {
            float MaxRenderDistance = 5.0e8f;
        };

        struct Stats
        {
            size_t LastVisible = 0;
            size_t LastInvisible = 0;
            uint64_t Classifications = 0;
            uint64_t DegenerateCameraFrames = 0;
            uint64_t StaleClassifyCalls = 0;
        };

        VisibilityEngine() = default;
        explicit VisibilityEngine(const Config& cfg) : m_Config(cfg) {}

        [[nodiscard]] Core::Result UpdateFrustum(const Graphics::CameraComponent& camera);

        const VisibilityPartition& Classify(std::span<const ECS::EntityView> entities,
                                            const glm::vec3& cameraPosition);

        // Single-entity test against the current frustum; does not touch the partition.
        [[nodiscard]] bool IsVisible(const ECS::EntityView& entity, const glm::vec3& cameraPosition) const;

        // The n visible entities nearest to the camera, ascending distance,
        // ties broken by entity id.
        [[nodiscard]] static std::vector<const ClassifiedEntity*> GetClosestVisible(
            const VisibilityPartition& partition, size_t n);

        [[nodiscard]] const VisibilityPartition& GetLastPartition() const { return m_Partition; }
        [[nodiscard]] const Geometry::Frustum& GetFrustum() const { return m_Frustum; }
        [[nodiscard]] bool HasValidFrustum() const { return m_HasValidFrustum; }
        [[nodiscard]] const Stats& GetStats() const { return m_Stats; }

        void SetMaxRenderDistance(float distance) { m_Config.MaxRenderDistance = distance; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        Config m_Config;
        Stats m_Stats;

        Geometry::Frustum m_Frustum{};
        bool m_HasValidFrustum = false;
        bool m_FrustumFresh = false;

        VisibilityPartition m_Partition;
    };
}
