module;

#include <optional>
#include <string>

#include <glm/glm.hpp>

export module ECS:Components;

export namespace Runtime::ECS::Components
{
    namespace Transform
    {
        // Catalog entities do not rotate or scale; position is all the core reads.
        struct Component
        {
            glm::vec3 Position{0.0f};
        };
    }

    namespace CatalogId
    {
        // Stable identity from the catalog (database id, else name).
        struct Component
        {
            std::string Id;
        };
    }

    namespace PhysicalAttributes
    {
        // Raw catalog values; missing measurements stay empty.
        //  Mass        - Earth masses
        //  Radius      - Earth radii
        //  Temperature - Kelvin (calculated, else measured)
        struct Component
        {
            std::optional<float> Mass;
            std::optional<float> Radius;
            std::optional<float> Temperature;
        };
    }

    namespace Bounds
    {
        // Bounding sphere radius in scene units, centered on Transform::Position.
        struct Component
        {
            float Radius = 0.0f;
        };
    }
}
