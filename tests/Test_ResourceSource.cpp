#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

import Core;
import Graphics;
import ECS;
import Visibility;
import Residency;

using namespace Runtime;
using namespace Runtime::Residency;

namespace
{
    std::filesystem::path TempDir(const std::string& name)
    {
        const auto dir = std::filesystem::path(ORRERY_TEST_TMP_DIR) / name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    Graphics::Image Checker(uint32_t side)
    {
        Graphics::Image image;
        image.Width = image.Height = side;
        image.Pixels.resize(static_cast<size_t>(side) * side * 4u);
        for (size_t i = 0; i < image.Pixels.size(); ++i)
            image.Pixels[i] = static_cast<uint8_t>((i / 4) % 2 ? 255 : i % 251);
        return image;
    }
}

TEST(FileResourceSource, PathNamesTier)
{
    FileResourceSource source("/data/precomputed");
    EXPECT_EQ(source.PathFor("Kepler-22b", Quality::High).filename().string(), "Kepler-22b_high.rgba");
    EXPECT_EQ(source.PathFor("Kepler-22b", Quality::Low).filename().string(), "Kepler-22b_low.rgba");
}

TEST(FileResourceSource, IdsCannotEscapeRoot)
{
    const auto dir = TempDir("source_escape");
    FileResourceSource source(dir / "root");

    const auto traversal = source.PathFor("../../evil", Quality::High);
    EXPECT_EQ(traversal.parent_path().string(), (dir / "root").string());
    EXPECT_EQ(traversal.filename().string(), "..%2F..%2Fevil_high.rgba");

    EXPECT_EQ(source.PathFor("/etc/passwd", Quality::Low).parent_path().string(), (dir / "root").string());
    EXPECT_EQ(source.PathFor("50%", Quality::Low).filename().string(), "50%25_low.rgba");

    ASSERT_TRUE(source.Store("../evil", Quality::Low, Checker(2)).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir / "evil_low.rgba"));
    EXPECT_TRUE(std::filesystem::exists(dir / "root" / "..%2Fevil_low.rgba"));

    const auto fetched = source.Fetch("../evil", Quality::Low);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(*fetched, Checker(2));
}

TEST(FileResourceSource, StoreThenFetch)
{
    FileResourceSource source(TempDir("source_roundtrip"));
    const Graphics::Image image = Checker(16);

    ASSERT_TRUE(source.Store("p1", Quality::High, image).has_value());

    const auto fetched = source.Fetch("p1", Quality::High);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(*fetched, image);

    // Tiers are stored independently.
    const auto low = source.Fetch("p1", Quality::Low);
    ASSERT_FALSE(low.has_value());
    EXPECT_EQ(low.error(), Core::ErrorCode::FileNotFound);
}

TEST(FileResourceSource, RejectsBadInput)
{
    const auto dir = TempDir("source_bad");
    FileResourceSource source(dir);

    EXPECT_EQ(source.Fetch("p1", Quality::None).error(), Core::ErrorCode::InvalidArgument);

    Graphics::Image wide;
    wide.Width = 4;
    wide.Height = 2;
    wide.Pixels.resize(4 * 2 * 4);
    EXPECT_FALSE(source.Store("wide", Quality::Low, wide).has_value());

    // Three texels cannot form a square.
    Core::IO::FileIOBackend backend;
    Core::IO::IORequest request;
    request.Path = source.PathFor("odd", Quality::Low).string();
    const std::vector<std::byte> bytes(12, std::byte{7});
    ASSERT_TRUE(backend.Write(request, bytes).has_value());

    const auto odd = source.Fetch("odd", Quality::Low);
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error(), Core::ErrorCode::InvalidFormat);
}

TEST(FileResourceSource, DecodeSquareRGBA8)
{
    const std::vector<std::byte> four(4 * 4 * 4, std::byte{1});
    const auto decoded = DecodeSquareRGBA8(four);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->Width, 4u);
    EXPECT_TRUE(decoded->IsValid());

    EXPECT_FALSE(DecodeSquareRGBA8({}).has_value());
    EXPECT_FALSE(DecodeSquareRGBA8(std::vector<std::byte>(10)).has_value());
}

TEST(FileResourceSource, ManagerPrefersBakedImages)
{
    const auto dir = TempDir("source_manager");
    auto source = std::make_shared<FileResourceSource>(dir);
    ASSERT_TRUE(source->Store("baked", Quality::High, Checker(8)).has_value());

    ResidencyManager manager({}, source);
    const auto t0 = Clock::now();

    Visibility::VisibilityPartition partition;
    ECS::EntityView baked;
    baked.Id = "baked";
    ECS::EntityView plain;
    plain.Id = "plain";
    plain.Attributes.Radius = 1.0f;
    partition.Visible.push_back({baked, 10.0f});
    partition.Visible.push_back({plain, 20.0f});

    manager.BeginCycle(partition, t0);
    manager.GetOrResolveResource(baked, 10.0f, true);
    manager.GetOrResolveResource(plain, 20.0f, true);
    manager.EndCycle();

    const auto bakedView = manager.GetResident("baked");
    ASSERT_TRUE(bakedView.has_value());
    EXPECT_EQ(bakedView->Level, Quality::High);
    ASSERT_NE(bakedView->Payload, nullptr);
    EXPECT_EQ(*bakedView->Payload, Checker(8));

    // Nothing baked for "plain": synthesized at its detail resolution instead.
    const auto plainView = manager.GetResident("plain");
    ASSERT_TRUE(plainView.has_value());
    EXPECT_EQ(plainView->Level, Quality::High);
    ASSERT_NE(plainView->Payload, nullptr);
    EXPECT_EQ(plainView->Payload->Width, 64u);
    EXPECT_EQ(manager.GetStats().FetchFailures, 1u);
}
