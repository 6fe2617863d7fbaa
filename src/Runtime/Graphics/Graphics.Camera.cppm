module;

#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/quaternion.hpp>

export module Graphics:Camera;

export namespace Runtime::Graphics
{
    // --- Pure Data Class ---
    struct CameraComponent
    {
        glm::vec3 Position{0.0f, 0.0f, 4.0f};
        glm::quat Orientation{1.0f, 0.0f, 0.0f, 0.0f}; // Identity, looking down -Z

        float Fov = 45.0f; // Vertical, degrees
        float AspectRatio = 1.77f;
        float Near = 0.1f;
        float Far = 1000.0f;

        glm::mat4 ViewMatrix{1.0f};
        glm::mat4 ProjectionMatrix{1.0f};

        [[nodiscard]] glm::vec3 GetForward() const
        {
            return glm::rotate(Orientation, glm::vec3(0.0f, 0.0f, -1.0f));
        }

        [[nodiscard]] glm::vec3 GetRight() const
        {
            return glm::rotate(Orientation, glm::vec3(1.0f, 0.0f, 0.0f));
        }

        [[nodiscard]] glm::vec3 GetUp() const
        {
            return glm::rotate(Orientation, glm::vec3(0.0f, 1.0f, 0.0f));
        }

        [[nodiscard]] glm::mat4 GetViewProjection() const
        {
            return ProjectionMatrix * ViewMatrix;
        }
    };

    // Rebuilds View/Projection from Position, Orientation and lens parameters.
    void UpdateMatrices(CameraComponent& camera);

    // Points the camera at target, keeping worldUp as close to the screen up as possible.
    void LookAt(CameraComponent& camera, const glm::vec3& target, const glm::vec3& worldUp = {0.0f, 1.0f, 0.0f});

    // Places the camera on a horizontal circle around target and looks at it.
    void Orbit(CameraComponent& camera, const glm::vec3& target, float yawRadians, float distance, float height = 0.0f);

    void OnResize(CameraComponent& camera, uint32_t width, uint32_t height);

    // False when the position or either matrix holds NaN/Inf.
    [[nodiscard]] bool IsFinite(const CameraComponent& camera);
}
