module;

#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

import :Components;

export namespace ECS
{
    // Owns the registry shared by the authoring layer (symbolic definitions)
    // and the construction runtime (resolved geometry).
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        entt::entity CreateEntity(const std::string& name);

        entt::registry& GetRegistry() { return m_Registry; }
        const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const { return m_Registry.storage<entt::entity>()->size(); }

    private:
        entt::registry m_Registry;
    };
}
