module;

#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Runtime.ChangeQueue;

import ECS;

export namespace Runtime
{
    namespace Events
    {
        // A definition was attached to an existing registry entity.
        struct Inserted
        {
            entt::entity Entity = entt::null;
            ECS::Components::Symbolic::Definition Definition;
        };

        // The entity leaves the construction. Carries the definition it had so
        // its edges can be dropped.
        struct Removed
        {
            entt::entity Entity = entt::null;
            ECS::Components::Symbolic::Definition Definition;
        };

        // The entity's own parameters changed (e.g. a Free point was dragged).
        struct Modified
        {
            entt::entity Entity = entt::null;
        };
    }

    using GeometryEvent = std::variant<Events::Inserted, Events::Removed, Events::Modified>;

    // Single-threaded FIFO of authoring changes, drained once per frame.
    class ChangeQueue
    {
    public:
        void Push(GeometryEvent event) { m_Pending.push_back(std::move(event)); }

        // Returns all pending events in submission order and empties the queue.
        [[nodiscard]] std::vector<GeometryEvent> Drain()
        {
            std::vector<GeometryEvent> events;
            events.swap(m_Pending);
            return events;
        }

        [[nodiscard]] std::size_t Size() const { return m_Pending.size(); }
        [[nodiscard]] bool Empty() const { return m_Pending.empty(); }

    private:
        std::vector<GeometryEvent> m_Pending;
    };
}
