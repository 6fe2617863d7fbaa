module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Visibility:Engine.Impl;

import :Engine;
import Core;
import Utils.BoundedHeap;
import Geometry;
import Graphics;
import ECS;

namespace Runtime::Visibility
{
    namespace
    {
        bool IsFiniteVec(const glm::vec3& v)
        {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        // Strict ordering for "nearest first": distance, then id.
        struct CloserThan
        {
            bool operator()(const ClassifiedEntity* a, const ClassifiedEntity* b) const
            {
                if (a->Distance != b->Distance) return a->Distance < b->Distance;
                return std::string_view(a->Entity.Id) < std::string_view(b->Entity.Id);
            }
        };
    }

    Core::Result VisibilityEngine::UpdateFrustum(const Graphics::CameraComponent& camera)
    {
        if (!Graphics::IsFinite(camera))
        {
            ++m_Stats.DegenerateCameraFrames;
            m_FrustumFresh = false;
            Core::Log::Warn("VisibilityEngine: degenerate camera (NaN/Inf in transform); reusing last partition (cycle {}).",
                            m_Partition.Cycle);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        m_Frustum = Geometry::Frustum::CreateFromMatrix(camera.GetViewProjection());
        m_HasValidFrustum = true;
        m_FrustumFresh = true;
        return Core::Ok();
    }

    bool VisibilityEngine::IsVisible(const ECS::EntityView& entity, const glm::vec3& cameraPosition) const
    {
        if (!m_HasValidFrustum) return false;

        // Distance culling first (cheaper)
        const glm::vec3 delta = entity.Position - cameraPosition;
        const float maxDist = m_Config.MaxRenderDistance;
        if (glm::dot(delta, delta) > maxDist * maxDist)
            return false;

        return Geometry::TestOverlap(m_Frustum, Geometry::Sphere{entity.Position, entity.BoundingRadius});
    }

    const VisibilityPartition& VisibilityEngine::Classify(std::span<const ECS::EntityView> entities,
                                                         const glm::vec3& cameraPosition)
    {
        if (!m_FrustumFresh || !IsFiniteVec(cameraPosition))
        {
            ++m_Stats.StaleClassifyCalls;
            if (!m_HasValidFrustum)
                Core::Log::Error("VisibilityEngine: Classify() without a valid frustum; partition stays empty.");
            else
                Core::Log::Debug("VisibilityEngine: no fresh frustum this cycle; serving partition of cycle {}.",
                                 m_Partition.Cycle);
            return m_Partition;
        }
        m_FrustumFresh = false;

        VisibilityPartition next;
        next.Cycle = m_Partition.Cycle + 1;
        next.Visible.reserve(entities.size());

        const float maxDist = m_Config.MaxRenderDistance;
        const float maxDistSq = maxDist * maxDist;

        for (const ECS::EntityView& entity : entities)
        {
            const glm::vec3 delta = entity.Position - cameraPosition;
            const float distSq = glm::dot(delta, delta);
            const float distance = std::sqrt(distSq);

            const bool visible = (distSq <= maxDistSq) &&
                Geometry::TestOverlap(m_Frustum, Geometry::Sphere{entity.Position, entity.BoundingRadius});

            if (visible)
                next.Visible.push_back({entity, distance});
            else
                next.Invisible.push_back({entity, distance});
        }

        m_Partition = std::move(next);

        ++m_Stats.Classifications;
        m_Stats.LastVisible = m_Partition.Visible.size();
        m_Stats.LastInvisible = m_Partition.Invisible.size();

        return m_Partition;
    }

    std::vector<const ClassifiedEntity*> VisibilityEngine::GetClosestVisible(const VisibilityPartition& partition,
                                                                            size_t n)
    {
        Utils::BoundedHeap<const ClassifiedEntity*, CloserThan> heap(std::min(n, partition.Visible.size()));
        for (const ClassifiedEntity& candidate : partition.Visible)
            heap.Push(&candidate);

        return heap.TakeSorted();
    }
}
