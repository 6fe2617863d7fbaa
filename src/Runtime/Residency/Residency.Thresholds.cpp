module;

#include <cmath>
#include <cstddef>
#include <vector>

module Residency:Thresholds.Impl;

import :Thresholds;
import Core;

namespace Runtime::Residency
{
    namespace
    {
        bool IsPositiveScale(float s) { return std::isfinite(s) && s > 0.0f; }
    }

    ThresholdTable ThresholdTable::Default()
    {
        ThresholdTable table;
        table.Buckets = {
            {150, 0.5f, 0.6f},
            {100, 0.75f, 0.8f},
            {50, 1.0f, 1.0f},
        };
        table.DefaultHighScale = 1.5f;
        table.DefaultLowScale = 1.5f;
        return table;
    }

    Core::Result ThresholdTable::Validate() const
    {
        if (!IsPositiveScale(DefaultHighScale) || !IsPositiveScale(DefaultLowScale))
        {
            Core::Log::Error("ThresholdTable: default scales must be positive and finite.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        for (size_t i = 0; i < Buckets.size(); ++i)
        {
            const ThresholdBucket& bucket = Buckets[i];
            if (!IsPositiveScale(bucket.HighScale) || !IsPositiveScale(bucket.LowScale))
            {
                Core::Log::Error("ThresholdTable: bucket {} has a non-positive scale.", i);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }

            // Next less-loaded bucket (or the defaults) must not scale down.
            const bool last = (i + 1 == Buckets.size());
            const size_t nextBoundary = last ? 0 : Buckets[i + 1].AboveVisibleCount;
            const float nextHigh = last ? DefaultHighScale : Buckets[i + 1].HighScale;
            const float nextLow = last ? DefaultLowScale : Buckets[i + 1].LowScale;

            if (!last && nextBoundary >= bucket.AboveVisibleCount)
            {
                Core::Log::Error("ThresholdTable: boundaries must strictly descend (bucket {}: {} then {}).",
                                 i, bucket.AboveVisibleCount, nextBoundary);
                return Core::Err(Core::ErrorCode::InvalidFormat);
            }
            if (bucket.HighScale > nextHigh || bucket.LowScale > nextLow)
            {
                Core::Log::Error("ThresholdTable: scales must not grow with the visible count (bucket {}).", i);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
        }
        return Core::Ok();
    }

    ThresholdSet ThresholdTable::Compute(size_t visibleCount, float baseHigh, float baseLow) const
    {
        for (const ThresholdBucket& bucket : Buckets)
        {
            if (visibleCount > bucket.AboveVisibleCount)
                return {baseHigh * bucket.HighScale, baseLow * bucket.LowScale};
        }
        return {baseHigh * DefaultHighScale, baseLow * DefaultLowScale};
    }
}
