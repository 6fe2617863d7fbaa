module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <vector>

#include <glm/glm.hpp>

module Synthesis:Layers.Impl;

import :Layers;
import Graphics;

namespace Runtime::Synthesis
{
    namespace
    {
        float OverlayChannel(float base, float blend)
        {
            return base < 0.5f ? 2.0f * base * blend
                               : 1.0f - 2.0f * (1.0f - base) * (1.0f - blend);
        }

        glm::vec3 Overlay(const glm::vec3& base, const glm::vec3& blend)
        {
            return {OverlayChannel(base.r, blend.r), OverlayChannel(base.g, blend.g), OverlayChannel(base.b, blend.b)};
        }

        // Three-stop vertical gradient, t in [0,1]
        glm::vec3 Gradient3(const glm::vec3& top, const glm::vec3& mid, const glm::vec3& bottom, float t)
        {
            if (t < 0.5f) return glm::mix(top, mid, t * 2.0f);
            return glm::mix(mid, bottom, (t - 0.5f) * 2.0f);
        }
    }

    Canvas::Canvas(uint32_t size)
        : m_Size(size), m_Texels(static_cast<size_t>(size) * size, glm::vec3(0.0f))
    {
    }

    void Canvas::Blend(int x, int y, const glm::vec3& color, float alpha, BlendMode mode)
    {
        if (x < 0 || y < 0 || x >= static_cast<int>(m_Size) || y >= static_cast<int>(m_Size)) return;
        if (alpha <= 0.0f) return;
        alpha = std::min(alpha, 1.0f);

        glm::vec3& dst = At(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
        const glm::vec3 src = (mode == BlendMode::Overlay) ? Overlay(dst, color) : color;
        dst = glm::mix(dst, src, alpha);
    }

    void Canvas::FillRect(float x, float y, float w, float h, const glm::vec3& color, float alpha, BlendMode mode)
    {
        const int x0 = std::max(0, static_cast<int>(std::floor(x)));
        const int y0 = std::max(0, static_cast<int>(std::floor(y)));
        const int x1 = std::min(static_cast<int>(m_Size), static_cast<int>(std::ceil(x + w)));
        const int y1 = std::min(static_cast<int>(m_Size), static_cast<int>(std::ceil(y + h)));

        for (int py = y0; py < y1; ++py)
            for (int px = x0; px < x1; ++px)
                Blend(px, py, color, alpha, mode);
    }

    Graphics::Image Canvas::ToImage() const
    {
        Graphics::Image image;
        image.Width = m_Size;
        image.Height = m_Size;
        image.Pixels.resize(m_Texels.size() * 4u);

        size_t o = 0;
        for (const glm::vec3& texel : m_Texels)
        {
            image.Pixels[o++] = Graphics::Color::ToUnorm8(texel.r);
            image.Pixels[o++] = Graphics::Color::ToUnorm8(texel.g);
            image.Pixels[o++] = Graphics::Color::ToUnorm8(texel.b);
            image.Pixels[o++] = 255;
        }
        return image;
    }

    float WaveNoise(float x, float y, float scale, int octaves)
    {
        float value = 0.0f;
        float amplitude = 1.0f;
        float frequency = scale;
        float maxValue = 0.0f;

        for (int i = 0; i < octaves; ++i)
        {
            value += std::sin(x * frequency) * std::cos(y * frequency) * amplitude;
            maxValue += amplitude;
            amplitude *= 0.5f;
            frequency *= 2.0f;
        }

        return (value / maxValue + 1.0f) * 0.5f;
    }

    void FillSolid(Canvas& canvas, const glm::vec3& color)
    {
        const uint32_t size = canvas.Size();
        for (uint32_t y = 0; y < size; ++y)
            for (uint32_t x = 0; x < size; ++x)
                canvas.At(x, y) = color;
    }

    void DrawAtmosphericBands(Canvas& canvas, const Palette& palette, float turbulence, LayerRandom& rng)
    {
        const float size = static_cast<float>(canvas.Size());
        const uint32_t bands = 6 + rng.NextInt(6);
        const float bandHeight = size / static_cast<float>(bands);
        // Wave amplitudes are authored for a 256 px canvas.
        const float pixelScale = size / 256.0f;
        constexpr float pi = std::numbers::pi_v<float>;

        for (uint32_t i = 0; i < bands; ++i)
        {
            const float top = static_cast<float>(i) * bandHeight;
            const float alpha = rng.NextFloat() * 0.2f + 0.8f;
            const bool even = (i % 2) == 0;
            const glm::vec3& first = even ? palette.Secondary : palette.Accent;
            const glm::vec3& last = even ? palette.Accent : palette.Secondary;
            const float phase = static_cast<float>(i);

            for (uint32_t x = 0; x < canvas.Size(); ++x)
            {
                const float u = static_cast<float>(x) / size;
                const float wave1 = std::sin(u * pi * 6.0f + phase) * turbulence * 8.0f * pixelScale;
                const float wave2 = std::sin(u * pi * 3.0f + phase * 2.0f) * turbulence * 4.0f * pixelScale;
                const float edge = top + wave1 + wave2;

                const int yStart = static_cast<int>(std::floor(edge));
                const int yEnd = static_cast<int>(std::ceil(top + bandHeight));
                for (int y = yStart; y < yEnd; ++y)
                {
                    const float t = std::clamp((static_cast<float>(y) - top) / bandHeight, 0.0f, 1.0f);
                    canvas.Blend(static_cast<int>(x), y, Gradient3(first, palette.Base, last, t), alpha);
                }
            }
        }
    }

    void DrawClouds(Canvas& canvas, const Palette& palette, float density, CloudPattern pattern, LayerRandom& rng)
    {
        const uint32_t sizeU = canvas.Size();
        const float size = static_cast<float>(sizeU);

        switch (pattern)
        {
        case CloudPattern::Bands:
        {
            const uint32_t bands = 5 + rng.NextInt(5);
            const float bandHeight = size / static_cast<float>(bands);
            for (uint32_t i = 0; i < bands; ++i)
            {
                const float alpha = 0.3f + rng.NextFloat() * 0.4f;
                canvas.FillRect(0.0f, static_cast<float>(i) * bandHeight, size, bandHeight,
                                palette.Secondary, alpha, BlendMode::Overlay);
            }
            break;
        }
        case CloudPattern::Spots:
        {
            const uint32_t spots = 3 + rng.NextInt(5);
            const float pixelScale = size / 256.0f;
            for (uint32_t i = 0; i < spots; ++i)
            {
                const float cx = rng.NextFloat() * size;
                const float cy = rng.NextFloat() * size;
                const float radius = (10.0f + rng.NextFloat() * 30.0f) * pixelScale;
                const float r2 = radius * radius;

                const int x0 = static_cast<int>(std::floor(cx - radius));
                const int x1 = static_cast<int>(std::ceil(cx + radius));
                const int y0 = static_cast<int>(std::floor(cy - radius));
                const int y1 = static_cast<int>(std::ceil(cy + radius));
                for (int y = y0; y <= y1; ++y)
                {
                    for (int x = x0; x <= x1; ++x)
                    {
                        const float dx = static_cast<float>(x) + 0.5f - cx;
                        const float dy = static_cast<float>(y) + 0.5f - cy;
                        if (dx * dx + dy * dy <= r2)
                            canvas.Blend(x, y, palette.Secondary, 0.4f, BlendMode::Overlay);
                    }
                }
            }
            break;
        }
        case CloudPattern::Wisps:
        {
            if (density <= 0.0f) break;
            const uint32_t step = sizeU < 128 ? 4 : 2;
            const float threshold = 1.0f - density;
            for (uint32_t y = 0; y < sizeU; y += step)
            {
                for (uint32_t x = 0; x < sizeU; x += step)
                {
                    const float noise = WaveNoise(static_cast<float>(x) / size, static_cast<float>(y) / size, 8.0f, 2);
                    if (noise > threshold)
                    {
                        const float alpha = (noise - threshold) / density * 0.5f;
                        canvas.FillRect(static_cast<float>(x), static_cast<float>(y),
                                        static_cast<float>(step), static_cast<float>(step),
                                        palette.Secondary, alpha, BlendMode::Overlay);
                    }
                }
            }
            break;
        }
        }
    }

    void DrawRockySurface(Canvas& canvas, const Palette& palette, bool hasWater, LayerRandom& rng)
    {
        const float size = static_cast<float>(canvas.Size());
        const float scale = canvas.Size() < 128 ? 0.5f : 1.0f;

        if (hasWater)
        {
            const auto waterAreas = static_cast<uint32_t>(static_cast<float>(3 + rng.NextInt(4)) * scale);
            for (uint32_t i = 0; i < waterAreas; ++i)
            {
                const float x = rng.NextFloat() * size;
                const float y = rng.NextFloat() * size;
                const float w = (20.0f + rng.NextFloat() * 60.0f) * scale;
                const float h = (20.0f + rng.NextFloat() * 60.0f) * scale;
                canvas.FillRect(x - w * 0.5f, y - h * 0.5f, w, h, palette.Accent, 0.6f);
            }
        }

        // Terrain regions: radial falloff of the secondary color
        const auto regions = static_cast<uint32_t>(static_cast<float>(8 + rng.NextInt(8)) * scale);
        for (uint32_t i = 0; i < regions; ++i)
        {
            const float cx = rng.NextFloat() * size;
            const float cy = rng.NextFloat() * size;
            const float radius = (15.0f + rng.NextFloat() * 40.0f) * scale;

            const int x0 = static_cast<int>(std::floor(cx - radius));
            const int x1 = static_cast<int>(std::ceil(cx + radius));
            const int y0 = static_cast<int>(std::floor(cy - radius));
            const int y1 = static_cast<int>(std::ceil(cy + radius));
            for (int y = y0; y < y1; ++y)
            {
                for (int x = x0; x < x1; ++x)
                {
                    const float d = glm::length(glm::vec2(static_cast<float>(x) + 0.5f - cx,
                                                          static_cast<float>(y) + 0.5f - cy));
                    if (d < radius)
                        canvas.Blend(x, y, palette.Secondary, 0.5f * (1.0f - d / radius));
                }
            }
        }
    }

    void AddDetailLayer(Canvas& canvas, float intensity)
    {
        const uint32_t sizeU = canvas.Size();
        const float size = static_cast<float>(sizeU);
        const uint32_t step = sizeU < 128 ? 4 : (sizeU < 256 ? 2 : 1);

        for (uint32_t y = 0; y < sizeU; y += step)
        {
            for (uint32_t x = 0; x < sizeU; x += step)
            {
                const float detail = WaveNoise(static_cast<float>(x) / size * 2.0f,
                                               static_cast<float>(y) / size * 2.0f, 16.0f, 3);
                canvas.FillRect(static_cast<float>(x), static_cast<float>(y),
                                static_cast<float>(step), static_cast<float>(step),
                                glm::vec3(detail), intensity, BlendMode::Overlay);
            }
        }
    }

    void AddNoise(Canvas& canvas, float intensity, LayerRandom& rng)
    {
        const uint32_t size = canvas.Size();
        const uint32_t step = size < 128 ? 2 : 1;
        const float scale = intensity / 255.0f;

        for (uint32_t y = 0; y < size; y += step)
        {
            for (uint32_t x = 0; x < size; x += step)
            {
                glm::vec3& texel = canvas.At(x, y);
                texel = glm::clamp(texel + glm::vec3((rng.NextFloat() - 0.5f) * scale), 0.0f, 1.0f);

                if (step > 1 && x + 1 < size)
                    canvas.At(x + 1, y) = texel;
            }
        }
    }

    void FillRadialGradient(Canvas& canvas, const glm::vec3& inner, const glm::vec3& outer)
    {
        const uint32_t size = canvas.Size();
        const float half = static_cast<float>(size) * 0.5f;

        for (uint32_t y = 0; y < size; ++y)
        {
            for (uint32_t x = 0; x < size; ++x)
            {
                const float d = glm::length(glm::vec2(static_cast<float>(x) + 0.5f - half,
                                                      static_cast<float>(y) + 0.5f - half));
                canvas.At(x, y) = glm::mix(inner, outer, std::min(d / half, 1.0f));
            }
        }
    }
}
