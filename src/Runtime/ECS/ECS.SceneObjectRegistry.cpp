module;

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module ECS:SceneObjectRegistry.Impl;

import :SceneObjectRegistry;
import Core;

namespace Runtime::ECS
{
    entt::entity SceneObjectRegistry::CreateEntity(std::string id,
                                                   const glm::vec3& position,
                                                   const Components::PhysicalAttributes::Component& attributes,
                                                   float boundingRadius)
    {
        if (m_Lookup.contains(id))
        {
            Core::Log::Warn("SceneObjectRegistry: duplicate entity id '{}' ignored.", id);
            return entt::null;
        }

        const entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::Transform::Component>(e, position);
        m_Registry.emplace<Components::PhysicalAttributes::Component>(e, attributes);
        m_Registry.emplace<Components::Bounds::Component>(e, boundingRadius);
        m_Registry.emplace<Components::CatalogId::Component>(e, id);
        m_Lookup.emplace(std::move(id), e);
        return e;
    }

    bool SceneObjectRegistry::DestroyEntity(std::string_view id)
    {
        auto it = m_Lookup.find(id);
        if (it == m_Lookup.end()) return false;

        m_Registry.destroy(it->second);
        m_Lookup.erase(it);
        return true;
    }

    entt::entity SceneObjectRegistry::Find(std::string_view id) const
    {
        auto it = m_Lookup.find(id);
        return it == m_Lookup.end() ? entt::null : it->second;
    }

    void SceneObjectRegistry::SetPosition(entt::entity entity, const glm::vec3& position)
    {
        if (!m_Registry.valid(entity)) return;
        m_Registry.get<Components::Transform::Component>(entity).Position = position;
    }

    std::vector<EntityView> SceneObjectRegistry::Gather() const
    {
        std::vector<EntityView> out;
        out.reserve(m_Lookup.size());

        auto view = m_Registry.view<const Components::CatalogId::Component,
                                    const Components::Transform::Component,
                                    const Components::PhysicalAttributes::Component,
                                    const Components::Bounds::Component>();

        for (auto [entity, id, transform, attributes, bounds] : view.each())
        {
            out.push_back(EntityView{
                .Handle = entity,
                .Id = id.Id,
                .Position = transform.Position,
                .BoundingRadius = bounds.Radius,
                .Attributes = attributes
            });
        }
        return out;
    }

    void SceneObjectRegistry::Clear()
    {
        m_Registry.clear();
        m_Lookup.clear();
    }
}
