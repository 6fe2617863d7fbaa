#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

import ECS;

using namespace Runtime;
using namespace Runtime::ECS;

namespace
{
    Components::PhysicalAttributes::Component Attributes(float mass, float radius, float temperature)
    {
        return {mass, radius, temperature};
    }
}

TEST(SceneObjectRegistry, CreateAndFind)
{
    SceneObjectRegistry registry;

    const entt::entity e = registry.CreateEntity("Kepler-452b", {1.0f, 2.0f, 3.0f}, Attributes(5.0f, 1.6f, 265.0f), 8.0f);
    ASSERT_NE(e, entt::null);
    EXPECT_EQ(registry.Find("Kepler-452b"), e);
    EXPECT_EQ(registry.Find("missing"), entt::null);
    EXPECT_EQ(registry.Size(), 1u);

    const auto& bounds = registry.GetRegistry().get<Components::Bounds::Component>(e);
    EXPECT_FLOAT_EQ(bounds.Radius, 8.0f);
}

TEST(SceneObjectRegistry, DuplicateIdRejected)
{
    SceneObjectRegistry registry;
    ASSERT_NE(registry.CreateEntity("a", {}, {}, 1.0f), entt::null);
    EXPECT_EQ(registry.CreateEntity("a", {5.0f, 0.0f, 0.0f}, {}, 1.0f), entt::null);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(SceneObjectRegistry, GatherReflectsAdditionsAndRemovals)
{
    SceneObjectRegistry registry;
    registry.CreateEntity("a", {1.0f, 0.0f, 0.0f}, Attributes(1.0f, 1.0f, 300.0f), 1.0f);
    registry.CreateEntity("b", {2.0f, 0.0f, 0.0f}, {}, 2.0f);

    auto views = registry.Gather();
    ASSERT_EQ(views.size(), 2u);

    auto it = std::find_if(views.begin(), views.end(), [](const EntityView& v) { return v.Id == "a"; });
    ASSERT_NE(it, views.end());
    EXPECT_EQ(it->Position, glm::vec3(1.0f, 0.0f, 0.0f));
    ASSERT_TRUE(it->Attributes.Temperature.has_value());
    EXPECT_FLOAT_EQ(*it->Attributes.Temperature, 300.0f);

    EXPECT_TRUE(registry.DestroyEntity("a"));
    EXPECT_FALSE(registry.DestroyEntity("a"));
    registry.CreateEntity("c", {}, {}, 1.0f);

    views = registry.Gather();
    ASSERT_EQ(views.size(), 2u);
    EXPECT_TRUE(std::none_of(views.begin(), views.end(), [](const EntityView& v) { return v.Id == "a"; }));
}

TEST(SceneObjectRegistry, SetPosition_VisibleInNextGather)
{
    SceneObjectRegistry registry;
    const entt::entity e = registry.CreateEntity("moving", {}, {}, 1.0f);

    registry.SetPosition(e, {7.0f, 8.0f, 9.0f});
    const auto views = registry.Gather();
    ASSERT_EQ(views.size(), 1u);
    EXPECT_EQ(views[0].Position, glm::vec3(7.0f, 8.0f, 9.0f));
}

TEST(SceneObjectRegistry, Clear_RemovesEverything)
{
    SceneObjectRegistry registry;
    registry.CreateEntity("x", {}, {}, 1.0f);
    registry.Clear();
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_TRUE(registry.Gather().empty());
    EXPECT_NE(registry.CreateEntity("x", {}, {}, 1.0f), entt::null);
}
