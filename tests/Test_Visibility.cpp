#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Graphics;
import ECS;
import Visibility;

using namespace Runtime;
using namespace Runtime::Visibility;

namespace
{
    // Camera at the origin looking down +X; 90 degree field of view on both axes.
    Graphics::CameraComponent MakeCamera()
    {
        Graphics::CameraComponent camera;
        camera.Position = glm::vec3(0.0f);
        camera.Fov = 90.0f;
        camera.AspectRatio = 1.0f;
        camera.Near = 0.1f;
        camera.Far = 100.0f;
        Graphics::LookAt(camera, glm::vec3(1.0f, 0.0f, 0.0f));
        return camera;
    }

    ECS::EntityView MakeView(std::string id, const glm::vec3& position, float radius = 0.0f)
    {
        ECS::EntityView view;
        view.Id = std::move(id);
        view.Position = position;
        view.BoundingRadius = radius;
        return view;
    }

    struct LogCapture
    {
        std::vector<std::pair<Core::Log::Level, std::string>> Messages;

        LogCapture()
        {
            Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg)
            {
                Messages.emplace_back(level, std::string(msg));
            });
        }

        ~LogCapture() { Core::Log::ResetSink(); }

        [[nodiscard]] size_t Count(Core::Log::Level level) const
        {
            size_t n = 0;
            for (const auto& [l, m] : Messages)
                if (l == level) ++n;
            return n;
        }
    };
}

TEST(VisibilityEngine, RandomScene_MatchesAnalyticFrustum)
{
    VisibilityEngine engine(VisibilityEngine::Config{.MaxRenderDistance = 40.0f});
    const auto camera = MakeCamera();
    ASSERT_TRUE(engine.UpdateFrustum(camera).has_value());

    // 1000 entities at distance 1..50 from the origin, uniformly random directions.
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> distance(1.0f, 50.0f);
    std::normal_distribution<float> axis(0.0f, 1.0f);

    constexpr float kMargin = 1e-2f;
    std::vector<ECS::EntityView> entities;
    std::vector<bool> expected;
    while (entities.size() < 1000)
    {
        const glm::vec3 direction(axis(rng), axis(rng), axis(rng));
        if (glm::length(direction) < 1e-3f)
            continue;

        const float d = distance(rng);
        const glm::vec3 p = glm::normalize(direction) * d;

        // Stay clear of every boundary so plane extraction round-off cannot flip the answer.
        if (std::abs(std::abs(p.y) - p.x) < kMargin || std::abs(std::abs(p.z) - p.x) < kMargin ||
            std::abs(p.x - 0.1f) < kMargin || std::abs(d - 40.0f) < kMargin)
            continue;

        const bool inside = p.x > 0.1f && std::abs(p.y) < p.x && std::abs(p.z) < p.x && d < 40.0f;
        entities.push_back(MakeView("e" + std::to_string(entities.size()), p));
        expected.push_back(inside);
    }

    const VisibilityPartition& partition = engine.Classify(entities, camera.Position);
    ASSERT_EQ(partition.Visible.size() + partition.Invisible.size(), entities.size());

    size_t expectedVisible = 0;
    for (bool v : expected)
        if (v) ++expectedVisible;
    EXPECT_EQ(partition.Visible.size(), expectedVisible);

    for (const ClassifiedEntity& c : partition.Visible)
    {
        const size_t index = std::stoul(c.Entity.Id.substr(1));
        EXPECT_TRUE(expected[index]) << c.Entity.Id;
        EXPECT_NEAR(c.Distance, glm::length(c.Entity.Position), 1e-4f);
    }
    for (const ClassifiedEntity& c : partition.Invisible)
    {
        const size_t index = std::stoul(c.Entity.Id.substr(1));
        EXPECT_FALSE(expected[index]) << c.Entity.Id;
    }
    EXPECT_EQ(engine.GetStats().LastVisible, expectedVisible);
}

TEST(VisibilityEngine, BeyondMaxRenderDistance_IsInvisibleEvenInsideFrustum)
{
    VisibilityEngine engine(VisibilityEngine::Config{.MaxRenderDistance = 40.0f});
    const auto camera = MakeCamera();
    ASSERT_TRUE(engine.UpdateFrustum(camera).has_value());

    const std::vector<ECS::EntityView> entities{
        MakeView("near", {10.0f, 0.0f, 0.0f}),
        MakeView("far", {60.0f, 0.0f, 0.0f}, 30.0f),
        MakeView("behind", {-10.0f, 0.0f, 0.0f}),
    };

    const auto& partition = engine.Classify(entities, camera.Position);
    ASSERT_EQ(partition.Visible.size(), 1u);
    EXPECT_EQ(partition.Visible[0].Entity.Id, "near");
    EXPECT_EQ(partition.Invisible.size(), 2u);

    EXPECT_TRUE(engine.IsVisible(entities[0], camera.Position));
    EXPECT_FALSE(engine.IsVisible(entities[1], camera.Position));
}

TEST(VisibilityEngine, LargeSphereStraddlingPlane_IsVisible)
{
    VisibilityEngine engine;
    const auto camera = MakeCamera();
    ASSERT_TRUE(engine.UpdateFrustum(camera).has_value());

    // Center above the top plane, but the sphere reaches in.
    const std::vector<ECS::EntityView> entities{MakeView("big", {10.0f, 14.0f, 0.0f}, 5.0f)};
    EXPECT_EQ(engine.Classify(entities, camera.Position).Visible.size(), 1u);
}

TEST(VisibilityEngine, DegenerateCamera_ReusesLastPartition)
{
    VisibilityEngine engine;
    auto camera = MakeCamera();
    ASSERT_TRUE(engine.UpdateFrustum(camera).has_value());

    const std::vector<ECS::EntityView> entities{MakeView("a", {5.0f, 0.0f, 0.0f})};
    const uint64_t validCycle = engine.Classify(entities, camera.Position).Cycle;
    EXPECT_EQ(validCycle, 1u);

    LogCapture capture;
    camera.Position.x = std::numeric_limits<float>::quiet_NaN();
    Graphics::UpdateMatrices(camera);

    const auto result = engine.UpdateFrustum(camera);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);
    EXPECT_EQ(capture.Count(Core::Log::Level::Warning), 1u);

    // Moving everything away must not change the served partition.
    const std::vector<ECS::EntityView> moved{MakeView("a", {-5.0f, 0.0f, 0.0f})};
    const auto& partition = engine.Classify(moved, glm::vec3(0.0f));
    EXPECT_EQ(partition.Cycle, validCycle);
    ASSERT_EQ(partition.Visible.size(), 1u);
    EXPECT_EQ(engine.GetStats().DegenerateCameraFrames, 1u);
}

TEST(VisibilityEngine, ClassifyWithoutFreshFrustum_ServesPreviousPartition)
{
    VisibilityEngine engine;
    const std::vector<ECS::EntityView> entities{MakeView("a", {5.0f, 0.0f, 0.0f})};

    {
        LogCapture capture;
        const auto& empty = engine.Classify(entities, glm::vec3(0.0f));
        EXPECT_EQ(empty.Cycle, 0u);
        EXPECT_TRUE(empty.Visible.empty());
        EXPECT_EQ(capture.Count(Core::Log::Level::Error), 1u);
    }

    const auto camera = MakeCamera();
    ASSERT_TRUE(engine.UpdateFrustum(camera).has_value());
    EXPECT_EQ(engine.Classify(entities, camera.Position).Cycle, 1u);
    EXPECT_EQ(engine.Classify(entities, camera.Position).Cycle, 1u);
    EXPECT_EQ(engine.GetStats().StaleClassifyCalls, 2u);
}

TEST(VisibilityEngine, GetClosestVisible_OrdersByDistanceThenId)
{
    VisibilityPartition partition;
    partition.Visible.push_back({MakeView("c", {}), 3.0f});
    partition.Visible.push_back({MakeView("b", {}), 1.0f});
    partition.Visible.push_back({MakeView("a", {}), 1.0f});
    partition.Visible.push_back({MakeView("d", {}), 0.5f});
    partition.Invisible.push_back({MakeView("hidden", {}), 0.1f});

    const auto closest = VisibilityEngine::GetClosestVisible(partition, 3);
    ASSERT_EQ(closest.size(), 3u);
    EXPECT_EQ(closest[0]->Entity.Id, "d");
    EXPECT_EQ(closest[1]->Entity.Id, "a");
    EXPECT_EQ(closest[2]->Entity.Id, "b");

    EXPECT_EQ(VisibilityEngine::GetClosestVisible(partition, 100).size(), 4u);
    EXPECT_TRUE(VisibilityEngine::GetClosestVisible(partition, 0).empty());
}
