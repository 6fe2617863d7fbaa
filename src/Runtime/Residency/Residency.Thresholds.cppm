module;

#include <cstddef>
#include <vector>

export module Residency:Thresholds;

import :Types;
import Core;

export namespace Runtime::Residency
{
    // Applies when visibleCount > AboveVisibleCount.
    struct ThresholdBucket
    {
        size_t AboveVisibleCount = 0;
        float HighScale = 1.0f;
        float LowScale = 1.0f;
    };

    // Step function visibleCount -> scale of the base distances.
    // Buckets are ordered by descending AboveVisibleCount; the first bucket whose
    // boundary is strictly exceeded wins, otherwise the default scales apply.
    struct ThresholdTable
    {
        std::vector<ThresholdBucket> Buckets;
        float DefaultHighScale = 1.5f;
        float DefaultLowScale = 1.5f;

        // >150 -> (0.5, 0.6), >100 -> (0.75, 0.8), >50 -> (1.0, 1.0), else (1.5, 1.5)
        [[nodiscard]] static ThresholdTable Default();

        // Rejects unsorted boundaries, non-positive scales, and scales that grow
        // with the visible count.
        [[nodiscard]] Core::Result Validate() const;

        [[nodiscard]] ThresholdSet Compute(size_t visibleCount, float baseHigh, float baseLow) const;
    };

    // NONE beyond the low distance; LOW beyond the high distance or when not
    // visible; HIGH otherwise.
    [[nodiscard]] constexpr Quality ResolveQuality(float distance, bool isVisible, const ThresholdSet& thresholds)
    {
        if (distance > thresholds.LowDistance) return Quality::None;
        if (distance > thresholds.HighDistance || !isVisible) return Quality::Low;
        return Quality::High;
    }
}
