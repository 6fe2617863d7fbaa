module;

#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

module Synthesis:Classifier.Impl;

import :Classifier;
import Core;
import Graphics;
import ECS;

namespace Runtime::Synthesis
{
    using Graphics::Color::FromHex;

    namespace
    {
        constexpr uint64_t kPaletteSalt = 0x70616c6574746531ULL;

        constexpr Palette MakePalette(uint32_t base, uint32_t secondary, uint32_t accent)
        {
            return {FromHex(base), FromHex(secondary), FromHex(accent)};
        }

        // Optional attribute -> value, with zero treated as missing.
        bool ResolveAttribute(const std::optional<float>& value, float fallback, float& out)
        {
            if (!value.has_value() || *value == 0.0f)
            {
                out = fallback;
                return true;
            }
            if (!std::isfinite(*value) || *value < 0.0f)
                return false;
            out = *value;
            return true;
        }
    }

    DerivedAttributes Derive(const ECS::Components::PhysicalAttributes::Component& attributes)
    {
        DerivedAttributes derived;
        const bool massOk = ResolveAttribute(attributes.Mass, 1.0f, derived.Mass);
        const bool radiusOk = ResolveAttribute(attributes.Radius, 1.0f, derived.Radius);
        const bool tempOk = ResolveAttribute(attributes.Temperature, 300.0f, derived.Temperature);

        derived.Valid = massOk && radiusOk && tempOk;
        if (!derived.Valid)
            return DerivedAttributes{.Valid = false};

        derived.Density = derived.Mass / (derived.Radius * derived.Radius * derived.Radius);
        if (!std::isfinite(derived.Density))
            derived.Valid = false;
        return derived;
    }

    Category Classify(const DerivedAttributes& a)
    {
        if (!a.Valid) return Category::Unknown;

        const float r = a.Radius;
        const float t = a.Temperature;
        const float rho = a.Density;

        if (r > 8.0f && t > 1000.0f && rho < 0.4f)
            return Category::HotJupiter;
        if (r > 3.0f && r < 8.0f && t > 500.0f && t < 1000.0f && rho < 0.8f)
            return Category::WarmNeptune;
        if (r > 3.0f && t < 500.0f && rho < 0.8f)
            return Category::IceGiant;
        if (r > 1.5f && r < 4.0f && rho < 1.2f)
            return Category::MiniNeptune;
        if (r > 1.5f && rho >= 1.2f)
            return Category::SuperEarth;
        return Category::Terrestrial;
    }

    Category Classify(const ECS::Components::PhysicalAttributes::Component& attributes)
    {
        return Classify(Derive(attributes));
    }

    Palette ColorsFor(Category category, float t, float variation)
    {
        switch (category)
        {
        case Category::HotJupiter:
            if (t > 2000.0f) return MakePalette(0x5a3820, 0x3d2510, 0x8a5530);
            if (t > 1500.0f) return MakePalette(0x6a4530, 0x4a3020, 0x9a6540);
            return MakePalette(0x7a5840, 0x5a4030, 0xaa7860);

        case Category::WarmNeptune:
            return MakePalette(0x8bc5e8, 0x6ba3d0, 0xaae5ff);

        case Category::IceGiant:
            if (t < 100.0f) return MakePalette(0x6a8fc5, 0x4a6fa5, 0x8aafe5);
            return MakePalette(0x9ad8e5, 0x7ab8c5, 0xbaf8ff);

        case Category::MiniNeptune:
            // Cloud cover
            if (variation > 0.7f) return MakePalette(0xe5f5ff, 0xc5d5e5, 0xffffff);
            if (variation > 0.4f) return MakePalette(0xaad5f5, 0x8ab5d5, 0xcaf5ff);
            return MakePalette(0x8aafb5, 0x6a8fa5, 0xaacfd5);

        case Category::SuperEarth:
            if (t > 700.0f) return MakePalette(0xff7a40, 0xe85a20, 0xffaa70); // Lava
            if (t > 400.0f) return MakePalette(0xd8b090, 0xb89070, 0xf8d0b0); // Desert
            if (t > 250.0f)
            {
                if (variation < 0.4f) return MakePalette(0x4d7aaa, 0x3d6a9a, 0x6d9aca); // Ocean
                if (variation < 0.7f) return MakePalette(0x6a9a7a, 0x5a8a6a, 0x8aba9a);
                return MakePalette(0xaa9a7a, 0x8a7a5a, 0xcaba9a);
            }
            return MakePalette(0xe5f5ff, 0xc5d5e5, 0xffffff); // Frozen

        case Category::Terrestrial:
            if (t > 600.0f) return MakePalette(0xf8e0b0, 0xd8c090, 0xffffd0);
            if (t > 350.0f) return MakePalette(0xe8b080, 0xc89060, 0xffd0a0);
            if (t > 200.0f)
            {
                if (variation < 0.3f) return MakePalette(0x5d8aba, 0x4d7aaa, 0x7daadd);
                if (variation < 0.6f) return MakePalette(0x7a9a8a, 0x6a8a7a, 0x9abaaa);
                return MakePalette(0xbaaa8a, 0x9a8a6a, 0xdacaaa);
            }
            if (t > 150.0f) return MakePalette(0xe89a70, 0xc87a50, 0xffba90);
            return MakePalette(0xf5ffff, 0xd5e5f5, 0xffffff);

        default:
            return MakePalette(0xa0a0a0, 0x808080, 0xc0c0c0);
        }
    }

    float VariationFor(std::string_view entityId)
    {
        const uint64_t bits = Core::Hash::HashCombine(Core::Hash::HashString64(entityId), kPaletteSalt);
        // Top 24 bits -> exact float in [0,1)
        return static_cast<float>(bits >> 40) * (1.0f / 16777216.0f);
    }
}
