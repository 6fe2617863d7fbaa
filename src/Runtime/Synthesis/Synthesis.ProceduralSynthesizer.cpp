module;

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

module Synthesis:ProceduralSynthesizer.Impl;

import :ProceduralSynthesizer;
import :Layers;
import :Classifier;
import Core;
import Graphics;
import ECS;

namespace Runtime::Synthesis
{
    namespace
    {
        // Per-category layer program.
        void DrawLayers(Canvas& canvas, Category category, const Palette& palette, float temperature,
                        LayerRandom& rng)
        {
            switch (category)
            {
            case Category::HotJupiter:
                DrawAtmosphericBands(canvas, palette, 1.5f, rng);
                DrawClouds(canvas, palette, 0.4f, CloudPattern::Spots, rng);
                AddDetailLayer(canvas, 0.3f);
                AddNoise(canvas, 25.0f, rng);
                break;

            case Category::WarmNeptune:
                DrawAtmosphericBands(canvas, palette, 1.0f, rng);
                DrawClouds(canvas, palette, 0.3f, CloudPattern::Bands, rng);
                AddDetailLayer(canvas, 0.25f);
                AddNoise(canvas, 20.0f, rng);
                break;

            case Category::IceGiant:
                DrawAtmosphericBands(canvas, palette, 0.5f, rng);
                if (rng.NextFloat() > 0.7f)
                    DrawClouds(canvas, palette, 0.2f, CloudPattern::Spots, rng);
                AddDetailLayer(canvas, 0.2f);
                AddNoise(canvas, 15.0f, rng);
                break;

            case Category::MiniNeptune:
                if (rng.NextFloat() > 0.5f)
                    DrawAtmosphericBands(canvas, palette, 0.7f, rng);
                DrawClouds(canvas, palette, 0.4f, CloudPattern::Wisps, rng);
                AddDetailLayer(canvas, 0.25f);
                AddNoise(canvas, 18.0f, rng);
                break;

            case Category::SuperEarth:
                if (temperature > 700.0f)
                {
                    // Lava flows
                    DrawAtmosphericBands(canvas, palette, 0.8f, rng);
                    AddDetailLayer(canvas, 0.4f);
                    AddNoise(canvas, 30.0f, rng);
                }
                else if (temperature > 250.0f && temperature < 400.0f)
                {
                    const bool hasWater = rng.NextFloat() > 0.3f;
                    DrawRockySurface(canvas, palette, hasWater, rng);
                    if (hasWater)
                        DrawClouds(canvas, palette, 0.3f, CloudPattern::Wisps, rng);
                    AddDetailLayer(canvas, 0.3f);
                    AddNoise(canvas, 20.0f, rng);
                }
                else
                {
                    DrawRockySurface(canvas, palette, false, rng);
                    AddDetailLayer(canvas, 0.3f);
                    AddNoise(canvas, 22.0f, rng);
                }
                break;

            case Category::Terrestrial:
                if (temperature > 600.0f)
                {
                    DrawClouds(canvas, palette, 0.8f, CloudPattern::Wisps, rng);
                    AddDetailLayer(canvas, 0.25f);
                    AddNoise(canvas, 18.0f, rng);
                }
                else if (temperature > 200.0f && temperature < 350.0f)
                {
                    const bool hasWater = rng.NextFloat() > 0.4f;
                    DrawRockySurface(canvas, palette, hasWater, rng);
                    DrawClouds(canvas, palette, 0.25f, CloudPattern::Wisps, rng);
                    AddDetailLayer(canvas, 0.3f);
                    AddNoise(canvas, 20.0f, rng);
                }
                else if (temperature > 150.0f)
                {
                    DrawRockySurface(canvas, palette, false, rng);
                    AddDetailLayer(canvas, 0.35f);
                    AddNoise(canvas, 25.0f, rng);
                }
                else
                {
                    DrawRockySurface(canvas, palette, false, rng);
                    AddDetailLayer(canvas, 0.2f);
                    AddNoise(canvas, 15.0f, rng);
                }
                break;

            default:
                // Unknown: flat neutral surface
                AddNoise(canvas, 10.0f, rng);
                break;
            }
        }
    }

    uint32_t DetailResolutionFor(const ECS::Components::PhysicalAttributes::Component& attributes)
    {
        if (!attributes.Radius.has_value() || *attributes.Radius == 0.0f) return 256;

        const float radius = *attributes.Radius;
        if (radius > 10.0f) return 512;
        if (radius > 5.0f) return 256;
        if (radius > 2.0f) return 128;
        return 64;
    }

    std::shared_ptr<const Graphics::Image> ProceduralSynthesizer::Synthesize(
        std::string_view entityId,
        const ECS::Components::PhysicalAttributes::Component& attributes,
        uint32_t resolution)
    {
        if (resolution == 0) resolution = kThumbnailResolution;

        MemoKey key{std::string(entityId), resolution};
        if (auto it = m_Memo.find(key); it != m_Memo.end())
        {
            ++m_Hits;
            return it->second;
        }
        ++m_Misses;

        const DerivedAttributes derived = Derive(attributes);
        const Category category = Classify(derived);
        if (category == Category::Unknown)
            Core::Log::Warn("ProceduralSynthesizer: invalid attributes for '{}', using neutral palette.", entityId);

        const Palette palette = ColorsFor(category, derived.Temperature, VariationFor(entityId));

        Canvas canvas(resolution);
        if (resolution <= kThumbnailResolution)
        {
            FillRadialGradient(canvas, palette.Base, palette.Secondary);
        }
        else
        {
            LayerRandom rng(Core::Hash::HashCombine(Core::Hash::HashString64(entityId), resolution));
            FillSolid(canvas, palette.Base);
            DrawLayers(canvas, category, palette, derived.Temperature, rng);
        }

        auto image = std::make_shared<const Graphics::Image>(canvas.ToImage());
        m_Bytes += image->SizeBytes();

        Core::Log::Debug("ProceduralSynthesizer: generated '{}' ({}x{}, {}).",
                         entityId, resolution, resolution, CategoryToString(category));

        m_Memo.emplace(std::move(key), image);
        return image;
    }

    ProceduralSynthesizer::CacheStats ProceduralSynthesizer::GetCacheStats() const
    {
        return {m_Memo.size(), m_Bytes, m_Hits, m_Misses};
    }

    void ProceduralSynthesizer::ClearCache()
    {
        m_Memo.clear();
        m_Bytes = 0;
        Core::Log::Debug("ProceduralSynthesizer: memo cleared.");
    }
}
