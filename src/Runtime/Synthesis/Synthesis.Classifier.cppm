module;

#include <cstdint>
#include <string_view>

#include <glm/glm.hpp>

export module Synthesis:Classifier;

import ECS;

export namespace Runtime::Synthesis
{
    enum class Category : uint8_t
    {
        HotJupiter,
        WarmNeptune,
        IceGiant,
        MiniNeptune,
        SuperEarth,
        Terrestrial,
        Unknown // Invalid attributes; neutral gray palette
    };

    [[nodiscard]] constexpr std::string_view CategoryToString(Category category)
    {
        switch (category)
        {
            case Category::HotJupiter:  return "HotJupiter";
            case Category::WarmNeptune: return "WarmNeptune";
            case Category::IceGiant:    return "IceGiant";
            case Category::MiniNeptune: return "MiniNeptune";
            case Category::SuperEarth:  return "SuperEarth";
            case Category::Terrestrial: return "Terrestrial";
            default:                    return "Unknown";
        }
    }

    struct Palette
    {
        glm::vec3 Base{0.0f};
        glm::vec3 Secondary{0.0f};
        glm::vec3 Accent{0.0f};

        bool operator==(const Palette&) const = default;
    };

    // Attributes after defaults are applied (mass/radius in Earth units, temperature in K).
    struct DerivedAttributes
    {
        float Mass = 1.0f;
        float Radius = 1.0f;
        float Temperature = 300.0f;
        float Density = 1.0f; // Mass / Radius^3, Earth = 1
        bool Valid = true;
    };

    // Missing or zero mass/radius/temperature fall back to 1 / 1 / 300.
    // Negative or non-finite values mark the attributes invalid.
    [[nodiscard]] DerivedAttributes Derive(const ECS::Components::PhysicalAttributes::Component& attributes);

    // Ordered rule table; the first matching rule wins:
    //   1. HotJupiter   radius > 8, T > 1000, density < 0.4
    //   2. WarmNeptune  3 < radius < 8, 500 < T < 1000, density < 0.8
    //   3. IceGiant     radius > 3, T < 500, density < 0.8
    //   4. MiniNeptune  1.5 < radius < 4, density < 1.2
    //   5. SuperEarth   radius > 1.5, density >= 1.2
    //   6. Terrestrial  otherwise
    [[nodiscard]] Category Classify(const DerivedAttributes& attributes);
    [[nodiscard]] Category Classify(const ECS::Components::PhysicalAttributes::Component& attributes);

    // Fixed lookup keyed by category and temperature band. `variation` in [0,1)
    // picks among alternative looks for the temperate bands and must be derived
    // from the entity identity (see VariationFor).
    [[nodiscard]] Palette ColorsFor(Category category, float temperature, float variation);

    // Stable per-entity value in [0,1), identical for every resolution of the same entity.
    [[nodiscard]] float VariationFor(std::string_view entityId);
}
