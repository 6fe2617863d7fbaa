#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <vector>

import Core;
import Residency;

using namespace Runtime::Residency;

namespace
{
    constexpr float kBaseHigh = 2.0e8f;
    constexpr float kBaseLow = 4.0e8f;

    void ExpectSet(const ThresholdSet& actual, float high, float low)
    {
        EXPECT_FLOAT_EQ(actual.HighDistance, high);
        EXPECT_FLOAT_EQ(actual.LowDistance, low);
    }
}

TEST(ResidencyThresholds, DefaultTableSteps)
{
    const ThresholdTable table = ThresholdTable::Default();
    ASSERT_TRUE(table.Validate().has_value());

    ExpectSet(table.Compute(0, kBaseHigh, kBaseLow), 3.0e8f, 6.0e8f);
    ExpectSet(table.Compute(50, kBaseHigh, kBaseLow), 3.0e8f, 6.0e8f);
    ExpectSet(table.Compute(51, kBaseHigh, kBaseLow), 2.0e8f, 4.0e8f);
    ExpectSet(table.Compute(101, kBaseHigh, kBaseLow), 1.5e8f, 3.2e8f);
    ExpectSet(table.Compute(151, kBaseHigh, kBaseLow), 1.0e8f, 2.4e8f);
    ExpectSet(table.Compute(10000, kBaseHigh, kBaseLow), 1.0e8f, 2.4e8f);
}

TEST(ResidencyThresholds, BoundaryIsStrict)
{
    const ThresholdTable table = ThresholdTable::Default();
    EXPECT_EQ(table.Compute(49, kBaseHigh, kBaseLow), table.Compute(50, kBaseHigh, kBaseLow));
    EXPECT_NE(table.Compute(50, kBaseHigh, kBaseLow), table.Compute(51, kBaseHigh, kBaseLow));
    EXPECT_EQ(table.Compute(100, kBaseHigh, kBaseLow), table.Compute(51, kBaseHigh, kBaseLow));
}

TEST(ResidencyThresholds, ComputeIsIdempotent)
{
    const ThresholdTable table = ThresholdTable::Default();
    const ThresholdSet first = table.Compute(120, kBaseHigh, kBaseLow);
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(table.Compute(120, kBaseHigh, kBaseLow), first);
}

TEST(ResidencyThresholds, ShrinksMonotonicallyWithLoad)
{
    const ThresholdTable table = ThresholdTable::Default();
    ThresholdSet previous = table.Compute(0, kBaseHigh, kBaseLow);
    for (size_t n = 1; n <= 300; ++n)
    {
        const ThresholdSet current = table.Compute(n, kBaseHigh, kBaseLow);
        EXPECT_LE(current.HighDistance, previous.HighDistance) << n;
        EXPECT_LE(current.LowDistance, previous.LowDistance) << n;
        previous = current;
    }
}

TEST(ResidencyThresholds, Validate_RejectsBadTables)
{
    ThresholdTable unsorted = ThresholdTable::Default();
    unsorted.Buckets[1].AboveVisibleCount = 200;
    ASSERT_FALSE(unsorted.Validate().has_value());
    EXPECT_EQ(unsorted.Validate().error(), Core::ErrorCode::InvalidFormat);

    ThresholdTable growing = ThresholdTable::Default();
    growing.Buckets[0].HighScale = 2.0f;
    ASSERT_FALSE(growing.Validate().has_value());
    EXPECT_EQ(growing.Validate().error(), Core::ErrorCode::InvalidArgument);

    ThresholdTable zeroScale = ThresholdTable::Default();
    zeroScale.Buckets[2].LowScale = 0.0f;
    EXPECT_FALSE(zeroScale.Validate().has_value());

    ThresholdTable badDefault = ThresholdTable::Default();
    badDefault.DefaultHighScale = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(badDefault.Validate().has_value());

    ThresholdTable empty;
    EXPECT_TRUE(empty.Validate().has_value());
    ExpectSet(empty.Compute(500, 1.0f, 2.0f), 1.5f, 3.0f);
}

TEST(ResidencyThresholds, ResolveQuality)
{
    const ThresholdSet t{100.0f, 200.0f};

    EXPECT_EQ(ResolveQuality(50.0f, true, t), Quality::High);
    EXPECT_EQ(ResolveQuality(100.0f, true, t), Quality::High);
    EXPECT_EQ(ResolveQuality(100.5f, true, t), Quality::Low);
    EXPECT_EQ(ResolveQuality(50.0f, false, t), Quality::Low);
    EXPECT_EQ(ResolveQuality(200.0f, false, t), Quality::Low);
    EXPECT_EQ(ResolveQuality(200.5f, true, t), Quality::None);
    EXPECT_EQ(ResolveQuality(1e30f, false, t), Quality::None);

    static_assert(ResolveQuality(0.0f, true, ThresholdSet{1.0f, 2.0f}) == Quality::High);
}
