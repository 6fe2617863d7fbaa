#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

import Graphics;
import ECS;
import Residency;
import Runtime.CatalogStreamer;

using namespace Runtime;
using namespace std::chrono_literals;

namespace
{
    Graphics::CameraComponent MakeCamera()
    {
        Graphics::CameraComponent camera;
        camera.Position = glm::vec3(0.0f);
        camera.Fov = 60.0f;
        camera.AspectRatio = 1.0f;
        camera.Near = 0.1f;
        camera.Far = 1.0e4f;
        Graphics::LookAt(camera, glm::vec3(1.0f, 0.0f, 0.0f));
        return camera;
    }

    void AddAhead(ECS::SceneObjectRegistry& registry, const std::string& id, float distance)
    {
        ECS::Components::PhysicalAttributes::Component attributes;
        attributes.Radius = 1.0f;
        registry.CreateEntity(id, {distance, 0.0f, 0.0f}, attributes, 1.0f);
    }
}

TEST(CatalogStreamer, RunsCycleOnFirstFrameThenEveryInterval)
{
    ECS::SceneObjectRegistry registry;
    AddAhead(registry, "a", 100.0f);

    CatalogStreamer streamer(registry, CatalogStreamer::Config{.CycleInterval = 3});
    const auto camera = MakeCamera();
    auto now = Residency::Clock::now();

    std::vector<uint64_t> cycleFrames;
    for (int frame = 0; frame < 10; ++frame)
    {
        now += 16ms;
        if (streamer.OnFrame(camera, now))
            cycleFrames.push_back(streamer.GetFrameNumber());
    }

    EXPECT_EQ(cycleFrames, (std::vector<uint64_t>{1, 4, 7, 10}));
    EXPECT_EQ(streamer.GetCycleCount(), 4u);
}

TEST(CatalogStreamer, VisibleEntitiesBecomeResident)
{
    ECS::SceneObjectRegistry registry;
    AddAhead(registry, "ahead", 100.0f);
    AddAhead(registry, "behind", -100.0f);

    CatalogStreamer streamer(registry);
    ASSERT_TRUE(streamer.OnFrame(MakeCamera(), Residency::Clock::now()));

    const auto ahead = streamer.GetResident("ahead");
    ASSERT_TRUE(ahead.has_value());
    EXPECT_EQ(ahead->Level, Residency::Quality::High);
    ASSERT_NE(ahead->Payload, nullptr);
    EXPECT_TRUE(ahead->Payload->IsValid());

    EXPECT_FALSE(streamer.GetResident("behind").has_value());
    EXPECT_EQ(streamer.GetVisibility().GetStats().LastVisible, 1u);
}

TEST(CatalogStreamer, UpgradeBudget_NearestFirst)
{
    ECS::SceneObjectRegistry registry;
    for (int i = 0; i < 5; ++i)
        AddAhead(registry, "p" + std::to_string(i), 100.0f * static_cast<float>(5 - i));

    CatalogStreamer streamer(registry, CatalogStreamer::Config{.CycleInterval = 1, .MaxUpgradesPerCycle = 2});
    streamer.OnFrame(MakeCamera(), Residency::Clock::now());

    // p4 (100) and p3 (200) are the nearest.
    EXPECT_TRUE(streamer.GetResident("p4").has_value());
    EXPECT_TRUE(streamer.GetResident("p3").has_value());
    EXPECT_FALSE(streamer.GetResident("p2").has_value());
    EXPECT_EQ(streamer.GetResidency().Size(), 2u);
}

TEST(CatalogStreamer, NewEntitiesPickedUpNextCycle)
{
    ECS::SceneObjectRegistry registry;
    AddAhead(registry, "first", 100.0f);

    CatalogStreamer streamer(registry, CatalogStreamer::Config{.CycleInterval = 1});
    const auto camera = MakeCamera();
    const auto t0 = Residency::Clock::now();

    streamer.OnFrame(camera, t0);
    EXPECT_FALSE(streamer.GetResident("second").has_value());

    registry.CreateEntity("second", {0.0f, 0.0f, 0.0f}, {}, 1.0f);
    registry.SetPosition(registry.Find("second"), {150.0f, 0.0f, 0.0f});
    streamer.OnFrame(camera, t0 + 1s);
    EXPECT_TRUE(streamer.GetResident("second").has_value());
}

TEST(CatalogStreamer, DegenerateCamera_KeepsServingResidents)
{
    ECS::SceneObjectRegistry registry;
    AddAhead(registry, "a", 100.0f);

    CatalogStreamer streamer(registry, CatalogStreamer::Config{.CycleInterval = 1});
    auto camera = MakeCamera();
    const auto t0 = Residency::Clock::now();
    streamer.OnFrame(camera, t0);

    camera.Position.y = std::numeric_limits<float>::infinity();
    EXPECT_TRUE(streamer.OnFrame(camera, t0 + 100ms));

    const auto resident = streamer.GetResident("a");
    ASSERT_TRUE(resident.has_value());
    EXPECT_EQ(resident->Level, Residency::Quality::High);
    EXPECT_EQ(streamer.GetVisibility().GetStats().DegenerateCameraFrames, 1u);
}
