module;

#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/quaternion.hpp>

module Graphics:Camera.Impl;

import :Camera;

namespace Runtime::Graphics
{
    namespace
    {
        bool IsFiniteMatrix(const glm::mat4& m)
        {
            for (int c = 0; c < 4; ++c)
                for (int r = 0; r < 4; ++r)
                    if (!std::isfinite(m[c][r])) return false;
            return true;
        }
    }

    void UpdateMatrices(CameraComponent& camera)
    {
        // View
        const glm::mat4 rotate = glm::toMat4(glm::conjugate(camera.Orientation));
        const glm::mat4 translate = glm::translate(glm::mat4(1.0f), -camera.Position);
        camera.ViewMatrix = rotate * translate;

        // Projection (OpenGL clip volume, depth -1..1)
        camera.ProjectionMatrix = glm::perspective(glm::radians(camera.Fov), camera.AspectRatio, camera.Near, camera.Far);
    }

    void LookAt(CameraComponent& camera, const glm::vec3& target, const glm::vec3& worldUp)
    {
        const glm::vec3 dir = target - camera.Position;
        if (glm::dot(dir, dir) < 1e-12f) return;

        glm::vec3 up = worldUp;
        if (std::abs(glm::dot(glm::normalize(dir), glm::normalize(up))) > 0.999f)
            up = glm::vec3(0.0f, 0.0f, 1.0f);

        // quatLookAt maps -Z onto dir, matching GetForward().
        camera.Orientation = glm::quatLookAt(glm::normalize(dir), up);
        UpdateMatrices(camera);
    }

    void Orbit(CameraComponent& camera, const glm::vec3& target, float yawRadians, float distance, float height)
    {
        camera.Position = target + glm::vec3(std::sin(yawRadians) * distance, height, std::cos(yawRadians) * distance);
        LookAt(camera, target);
    }

    void OnResize(CameraComponent& camera, uint32_t width, uint32_t height)
    {
        if (height > 0) camera.AspectRatio = (float)width / (float)height;
    }

    bool IsFinite(const CameraComponent& camera)
    {
        if (!std::isfinite(camera.Position.x) || !std::isfinite(camera.Position.y) || !std::isfinite(camera.Position.z))
            return false;
        return IsFiniteMatrix(camera.ViewMatrix) && IsFiniteMatrix(camera.ProjectionMatrix);
    }
}
