module;

#include <glm/glm.hpp>

export module Geometry:Overlap;

import :Primitives;

export namespace Runtime::Geometry
{
    namespace Internal
    {
        // --- Frustum vs Sphere (Plane-Based) ---
        // Conservative: a sphere straddling a corner outside two planes may pass.
        [[nodiscard]] inline bool Overlap_Analytic(const Frustum& f, const Sphere& s)
        {
            for (const auto& plane : f.Planes)
            {
                if (plane.SignedDistance(s.Center) < -s.Radius)
                    return false;
            }
            return true;
        }

        // --- Frustum vs Point ---
        [[nodiscard]] inline bool Overlap_Analytic(const Frustum& f, const glm::vec3& p)
        {
            for (const auto& plane : f.Planes)
            {
                if (plane.SignedDistance(p) < 0.0f)
                    return false;
            }
            return true;
        }
    }

    template <typename A, typename B>
    [[nodiscard]] bool TestOverlap(const A& a, const B& b)
    {
        if constexpr (requires { Internal::Overlap_Analytic(a, b); })
        {
            return Internal::Overlap_Analytic(a, b);
        }
        else
        {
            return Internal::Overlap_Analytic(b, a);
        }
    }
}
