module;

#include <chrono>
#include <cstdint>
#include <string_view>

export module Residency:Types;

import Core;
import Graphics;

export namespace Runtime::Residency
{
    using Clock = std::chrono::steady_clock;

    // Ordered: None < Low < High.
    enum class Quality : uint8_t
    {
        None = 0,
        Low = 1,
        High = 2
    };

    [[nodiscard]] constexpr std::string_view QualityToString(Quality quality)
    {
        switch (quality)
        {
            case Quality::Low:  return "LOW";
            case Quality::High: return "HIGH";
            default:            return "NONE";
        }
    }

    struct PayloadTag {};
    using PayloadHandle = Core::StrongHandle<PayloadTag>;

    // Distances are in scene units.
    struct ThresholdSet
    {
        float HighDistance = 0.0f;
        float LowDistance = 0.0f;

        bool operator==(const ThresholdSet&) const = default;
    };

    // What the render loop binds for one entity. Payload stays readable for
    // FramesInFlight cycles after the entry is replaced or evicted.
    struct ResourceView
    {
        Quality Level = Quality::None;
        PayloadHandle Handle{};
        const Graphics::Image* Payload = nullptr;
        Quality PendingLevel = Quality::None; // Tier of an in-flight fetch, if any
    };
}
