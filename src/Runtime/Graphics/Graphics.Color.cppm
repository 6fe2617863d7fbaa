module;

#include <cstdint>

#include <glm/glm.hpp>

export module Graphics:Color;

// =============================================================================
// Color helpers shared by the synthesizer and the payload codecs.
//
// Convention: packed ABGR, R in the low byte (same byte order as RGBA8 memory).
//   PackColor(255, 0, 0)  -> opaque red
//   FromHex(0xff0000)     -> vec3(1, 0, 0)
// =============================================================================

export namespace Runtime::Graphics::Color
{
    [[nodiscard]] constexpr uint32_t PackColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) noexcept
    {
        return static_cast<uint32_t>(r)
             | (static_cast<uint32_t>(g) << 8)
             | (static_cast<uint32_t>(b) << 16)
             | (static_cast<uint32_t>(a) << 24);
    }

    [[nodiscard]] constexpr uint8_t ToUnorm8(float v) noexcept
    {
        if (!(v > 0.0f)) return 0; // also catches NaN
        if (v >= 1.0f) return 255;
        return static_cast<uint8_t>(v * 255.0f + 0.5f);
    }

    [[nodiscard]] constexpr uint32_t PackColorF(float r, float g, float b, float a = 1.0f) noexcept
    {
        return PackColor(ToUnorm8(r), ToUnorm8(g), ToUnorm8(b), ToUnorm8(a));
    }

    // 0xRRGGBB -> linear [0,1] triple (no gamma conversion).
    [[nodiscard]] constexpr glm::vec3 FromHex(uint32_t rgb) noexcept
    {
        return {
            static_cast<float>((rgb >> 16) & 0xFFu) / 255.0f,
            static_cast<float>((rgb >> 8) & 0xFFu) / 255.0f,
            static_cast<float>(rgb & 0xFFu) / 255.0f
        };
    }
}
