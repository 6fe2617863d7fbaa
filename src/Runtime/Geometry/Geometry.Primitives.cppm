module;

#include <array>

#include <glm/glm.hpp>

export module Geometry:Primitives;

export namespace Runtime::Geometry
{
    struct Sphere
    {
        glm::vec3 Center;
        float Radius;
    };

    struct Plane
    {
        glm::vec3 Normal;
        float Distance;

        void Normalize()
        {
            const float len = glm::length(Normal);
            if (len < 1e-6f) {
                Normal = glm::vec3(0, 1, 0);
                Distance = 0.0f;
                return;
            }
            Normal /= len;
            Distance /= len;
        }

        // Positive on the inner side of a frustum plane.
        [[nodiscard]] float SignedDistance(const glm::vec3& p) const
        {
            return glm::dot(Normal, p) + Distance;
        }
    };

    struct Frustum
    {
        enum Side : int { Left = 0, Right, Bottom, Top, Near, Far };

        std::array<glm::vec3, 8> Corners;
        std::array<Plane, 6> Planes;

        // Gribb/Hartmann plane extraction from a combined projection * view matrix.
        // Expects an OpenGL-style clip volume (glm::perspective default, depth -1..1).
        static Frustum CreateFromMatrix(const glm::mat4& viewProj)
        {
            Frustum f;
            auto extract = [&](int i, float a, float b, float c, float d)
            {
                f.Planes[i] = Plane{{a, b, c}, d};
                f.Planes[i].Normalize();
            };
            const float* m = &viewProj[0][0];
            extract(Left,   m[3] + m[0], m[7] + m[4], m[11] + m[8],  m[15] + m[12]);
            extract(Right,  m[3] - m[0], m[7] - m[4], m[11] - m[8],  m[15] - m[12]);
            extract(Bottom, m[3] + m[1], m[7] + m[5], m[11] + m[9],  m[15] + m[13]);
            extract(Top,    m[3] - m[1], m[7] - m[5], m[11] - m[9],  m[15] - m[13]);
            extract(Near,   m[3] + m[2], m[7] + m[6], m[11] + m[10], m[15] + m[14]);
            extract(Far,    m[3] - m[2], m[7] - m[6], m[11] - m[10], m[15] - m[14]);

            // Corners via Inverse
            const glm::mat4 inv = glm::inverse(viewProj);
            const glm::vec4 ndc[8] = {
                {-1, -1, -1, 1}, {1, -1, -1, 1}, {1, 1, -1, 1}, {-1, 1, -1, 1},
                {-1, -1, 1, 1}, {1, -1, 1, 1}, {1, 1, 1, 1}, {-1, 1, 1, 1}
            };
            for (int i = 0; i < 8; ++i)
            {
                const glm::vec4 res = inv * ndc[i];
                f.Corners[i] = glm::vec3(res) / res.w;
            }
            return f;
        }
    };
}
