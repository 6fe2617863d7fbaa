#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

import ECS;
import Synthesis;

using namespace Runtime;
using namespace Runtime::Synthesis;

using Attributes = ECS::Components::PhysicalAttributes::Component;

namespace
{
    Attributes Make(float mass, float radius, float temperature)
    {
        return Attributes{mass, radius, temperature};
    }
}

TEST(SynthesisClassifier, RuleTable)
{
    EXPECT_EQ(Classify(Make(100.0f, 10.0f, 1500.0f)), Category::HotJupiter);
    EXPECT_EQ(Classify(Make(30.0f, 5.0f, 700.0f)), Category::WarmNeptune);
    EXPECT_EQ(Classify(Make(30.0f, 5.0f, 300.0f)), Category::IceGiant);
    EXPECT_EQ(Classify(Make(10.0f, 2.5f, 300.0f)), Category::MiniNeptune);
    EXPECT_EQ(Classify(Make(20.0f, 2.0f, 300.0f)), Category::SuperEarth);
    EXPECT_EQ(Classify(Make(1.0f, 1.0f, 288.0f)), Category::Terrestrial);
}

TEST(SynthesisClassifier, FirstMatchingRuleWins)
{
    // Satisfies both the ice giant (radius > 3) and mini-Neptune (1.5 < radius < 4) rules.
    EXPECT_EQ(Classify(Make(10.0f, 3.5f, 300.0f)), Category::IceGiant);

    // Dense but hot giant: fails the density test of rule 1, lands on super-Earth.
    EXPECT_EQ(Classify(Make(3000.0f, 9.0f, 1500.0f)), Category::SuperEarth);
}

TEST(SynthesisClassifier, MissingAndZeroValuesUseDefaults)
{
    const DerivedAttributes missing = Derive(Attributes{});
    EXPECT_TRUE(missing.Valid);
    EXPECT_FLOAT_EQ(missing.Mass, 1.0f);
    EXPECT_FLOAT_EQ(missing.Radius, 1.0f);
    EXPECT_FLOAT_EQ(missing.Temperature, 300.0f);
    EXPECT_FLOAT_EQ(missing.Density, 1.0f);

    const DerivedAttributes zero = Derive(Make(0.0f, 0.0f, 0.0f));
    EXPECT_TRUE(zero.Valid);
    EXPECT_FLOAT_EQ(zero.Radius, 1.0f);
    EXPECT_EQ(Classify(zero), Category::Terrestrial);
}

TEST(SynthesisClassifier, InvalidAttributesAreUnknown)
{
    EXPECT_EQ(Classify(Make(-1.0f, 1.0f, 300.0f)), Category::Unknown);
    EXPECT_EQ(Classify(Make(1.0f, std::numeric_limits<float>::quiet_NaN(), 300.0f)), Category::Unknown);
    EXPECT_EQ(Classify(Make(1.0f, 1.0f, std::numeric_limits<float>::infinity())), Category::Unknown);

    const Palette gray = ColorsFor(Category::Unknown, 300.0f, 0.5f);
    EXPECT_EQ(gray, ColorsFor(Category::Unknown, 5000.0f, 0.1f));
}

TEST(SynthesisClassifier, PaletteDependsOnTemperatureBandAndVariation)
{
    EXPECT_NE(ColorsFor(Category::SuperEarth, 800.0f, 0.5f), ColorsFor(Category::SuperEarth, 100.0f, 0.5f));
    EXPECT_NE(ColorsFor(Category::Terrestrial, 288.0f, 0.1f), ColorsFor(Category::Terrestrial, 288.0f, 0.9f));
    EXPECT_EQ(ColorsFor(Category::WarmNeptune, 600.0f, 0.1f), ColorsFor(Category::WarmNeptune, 900.0f, 0.9f));
}

TEST(SynthesisClassifier, VariationIsStablePerIdentity)
{
    const float a = VariationFor("Kepler-452b");
    EXPECT_EQ(a, VariationFor("Kepler-452b"));
    EXPECT_GE(a, 0.0f);
    EXPECT_LT(a, 1.0f);
    EXPECT_NE(a, VariationFor("Kepler-452c"));
}

TEST(ProceduralSynthesizer, SameInputsSameBytes)
{
    const Attributes earthLike = Make(1.0f, 1.0f, 288.0f);

    ProceduralSynthesizer first;
    ProceduralSynthesizer second;
    const auto a = first.Synthesize("earth-twin", earthLike, 128);
    const auto b = second.Synthesize("earth-twin", earthLike, 128);

    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(*a, *b);
    EXPECT_TRUE(a->IsValid());
    EXPECT_EQ(a->Width, 128u);
    EXPECT_EQ(a->Height, 128u);
}

TEST(ProceduralSynthesizer, MemoizesPerIdAndResolution)
{
    ProceduralSynthesizer synthesizer;
    const Attributes attributes = Make(30.0f, 5.0f, 300.0f);

    const auto a = synthesizer.Synthesize("neptune-ish", attributes, 64);
    const auto b = synthesizer.Synthesize("neptune-ish", attributes, 64);
    const auto c = synthesizer.Synthesize("neptune-ish", attributes, 128);
    const auto d = synthesizer.Synthesize("other", attributes, 64);

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), c.get());
    EXPECT_NE(*a, *d);

    const auto stats = synthesizer.GetCacheStats();
    EXPECT_EQ(stats.Entries, 3u);
    EXPECT_EQ(stats.Hits, 1u);
    EXPECT_EQ(stats.Misses, 3u);
    EXPECT_EQ(stats.Bytes, (64u * 64u * 2u + 128u * 128u) * 4u);

    synthesizer.ClearCache();
    EXPECT_EQ(synthesizer.GetCacheStats().Entries, 0u);
    EXPECT_EQ(synthesizer.GetCacheStats().Bytes, 0u);

    // Regenerated after clearing, still bit-identical.
    const auto again = synthesizer.Synthesize("neptune-ish", attributes, 64);
    EXPECT_NE(again.get(), a.get());
    EXPECT_EQ(*again, *a);
}

TEST(ProceduralSynthesizer, ThumbnailIsRadialGradient)
{
    ProceduralSynthesizer synthesizer;
    const auto thumb = synthesizer.Synthesize("bad-data", Make(-5.0f, 1.0f, 300.0f), kThumbnailResolution);

    ASSERT_NE(thumb, nullptr);
    ASSERT_EQ(thumb->Width, kThumbnailResolution);
    ASSERT_EQ(thumb->Height, kThumbnailResolution);

    // Unknown palette: base a0a0a0 in the middle, secondary 808080 in the corners.
    const size_t center = (static_cast<size_t>(16) * kThumbnailResolution + 16) * 4;
    EXPECT_NEAR(thumb->Pixels[center], 0xa0, 3);
    EXPECT_NEAR(thumb->Pixels[0], 0x80, 1);
    EXPECT_EQ(thumb->Pixels[0], thumb->Pixels[1]);
    EXPECT_EQ(thumb->Pixels[3], 255);
}

TEST(ProceduralSynthesizer, EveryCategoryProducesValidImages)
{
    ProceduralSynthesizer synthesizer;
    const Attributes samples[] = {
        Make(100.0f, 10.0f, 2500.0f), Make(30.0f, 5.0f, 700.0f), Make(30.0f, 5.0f, 50.0f),
        Make(10.0f, 2.5f, 300.0f), Make(20.0f, 2.0f, 800.0f), Make(20.0f, 2.0f, 300.0f),
        Make(1.0f, 1.0f, 700.0f), Make(1.0f, 1.0f, 288.0f), Make(1.0f, 1.0f, 100.0f),
    };

    int i = 0;
    for (const Attributes& attributes : samples)
    {
        const auto image = synthesizer.Synthesize("sample-" + std::to_string(i++), attributes, 64);
        ASSERT_NE(image, nullptr);
        EXPECT_TRUE(image->IsValid());
    }
}

TEST(ProceduralSynthesizer, DetailResolutionFromRadius)
{
    EXPECT_EQ(DetailResolutionFor(Make(1.0f, 11.0f, 300.0f)), 512u);
    EXPECT_EQ(DetailResolutionFor(Make(1.0f, 10.0f, 300.0f)), 256u);
    EXPECT_EQ(DetailResolutionFor(Make(1.0f, 3.0f, 300.0f)), 128u);
    EXPECT_EQ(DetailResolutionFor(Make(1.0f, 2.0f, 300.0f)), 64u);
    EXPECT_EQ(DetailResolutionFor(Attributes{}), 256u);
}
