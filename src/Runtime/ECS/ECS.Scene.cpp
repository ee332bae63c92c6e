module;
#include <string>
#include <entt/entity/registry.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;

namespace ECS
{
    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        return e;
    }
}
