module;

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

export module ECS:SceneObjectRegistry;

import :Components;
import Core;

export namespace Runtime::ECS
{
    // Value copy of one catalog entity, taken once per cycle.
    // Safe to keep across cycles; it does not reference registry storage.
    struct EntityView
    {
        entt::entity Handle = entt::null;
        std::string Id;
        glm::vec3 Position{0.0f};
        float BoundingRadius = 0.0f;
        Components::PhysicalAttributes::Component Attributes{};
    };

    // Owns the catalog entities (identity, position, physical attributes, bounds).
    // Additions and removals between cycles need no migration step: the next
    // Gather() simply reflects the new set.
    class SceneObjectRegistry
    {
    public:
        SceneObjectRegistry() = default;

        SceneObjectRegistry(const SceneObjectRegistry&) = delete;
        SceneObjectRegistry& operator=(const SceneObjectRegistry&) = delete;

        // Returns entt::null when an entity with the same id already exists.
        entt::entity CreateEntity(std::string id,
                                  const glm::vec3& position,
                                  const Components::PhysicalAttributes::Component& attributes,
                                  float boundingRadius);

        bool DestroyEntity(std::string_view id);

        [[nodiscard]] entt::entity Find(std::string_view id) const;

        void SetPosition(entt::entity entity, const glm::vec3& position);

        [[nodiscard]] std::vector<EntityView> Gather() const;

        [[nodiscard]] entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const { return m_Lookup.size(); }

        void Clear();

    private:
        entt::registry m_Registry;
        std::unordered_map<std::string, entt::entity, Core::Hash::TransparentStringHash, std::equal_to<>> m_Lookup;
    };
}
