module;

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <glm/glm.hpp>

export module Synthesis:Layers;

import :Classifier;
import Graphics;

export namespace Runtime::Synthesis
{
    // Seeded generator for the layer routines. Output depends only on the seed,
    // never on the standard library's distribution implementations.
    class LayerRandom
    {
    public:
        explicit LayerRandom(uint64_t seed) : m_Engine(seed) {}

        // [0, 1)
        float NextFloat() { return static_cast<float>(m_Engine() >> 40) * (1.0f / 16777216.0f); }

        // [0, bound)
        uint32_t NextInt(uint32_t bound) { return static_cast<uint32_t>(NextFloat() * static_cast<float>(bound)); }

    private:
        std::mt19937_64 m_Engine;
    };

    enum class BlendMode : uint8_t
    {
        Normal,
        Overlay
    };

    // Square float RGB working surface; converted to RGBA8 once all layers are drawn.
    class Canvas
    {
    public:
        explicit Canvas(uint32_t size);

        [[nodiscard]] uint32_t Size() const { return m_Size; }

        [[nodiscard]] glm::vec3& At(uint32_t x, uint32_t y) { return m_Texels[static_cast<size_t>(y) * m_Size + x]; }
        [[nodiscard]] const glm::vec3& At(uint32_t x, uint32_t y) const { return m_Texels[static_cast<size_t>(y) * m_Size + x]; }

        void Blend(int x, int y, const glm::vec3& color, float alpha, BlendMode mode = BlendMode::Normal);
        void FillRect(float x, float y, float w, float h, const glm::vec3& color, float alpha,
                      BlendMode mode = BlendMode::Normal);

        [[nodiscard]] Graphics::Image ToImage() const;

    private:
        uint32_t m_Size;
        std::vector<glm::vec3> m_Texels;
    };

    // Sum of sin*cos octaves, normalized to [0,1].
    [[nodiscard]] float WaveNoise(float x, float y, float scale, int octaves);

    enum class CloudPattern : uint8_t
    {
        Wisps,
        Bands,
        Spots
    };

    // Layer routines. Sampling steps and feature counts shrink with canvas size.
    void FillSolid(Canvas& canvas, const glm::vec3& color);
    void DrawAtmosphericBands(Canvas& canvas, const Palette& palette, float turbulence, LayerRandom& rng);
    void DrawClouds(Canvas& canvas, const Palette& palette, float density, CloudPattern pattern, LayerRandom& rng);
    void DrawRockySurface(Canvas& canvas, const Palette& palette, bool hasWater, LayerRandom& rng);
    void AddDetailLayer(Canvas& canvas, float intensity);
    void AddNoise(Canvas& canvas, float intensity, LayerRandom& rng);
    void FillRadialGradient(Canvas& canvas, const glm::vec3& inner, const glm::vec3& outer);
}
