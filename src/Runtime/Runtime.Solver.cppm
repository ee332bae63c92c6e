module;

#include <cstddef>
#include <span>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

export module Runtime.Solver;

import Core;
import Geometry;
import Runtime.DependencyGraph;

export namespace Runtime
{
    // Concrete value handed to the renderer, in virtual coordinates.
    using ResolvedValue = std::variant<Geometry::Point, Geometry::Line, Geometry::Circle>;

    struct GeometryUpdate
    {
        entt::entity Entity = entt::null;
        ResolvedValue Value;
    };

    struct SolveReport
    {
        // Entities whose resolved value was created or changed, in solve order.
        std::vector<GeometryUpdate> Updated;
        // Entities that were valid (or new) before this pass and are now Invalid.
        std::vector<entt::entity> Invalidated;
        std::size_t Visited = 0;
    };

    // Re-resolves the dependency closure of a set of changed entities.
    //
    // Reads the symbolic components (ECS::Components::Symbolic) and writes the
    // resolved ones (ECS::Components::Resolved). Unresolvable entities lose
    // their resolved value and get the Invalid tag; their dependents then fail
    // the same way because the lookup of the missing value fails.
    class Solver
    {
    public:
        struct Config
        {
            // Tolerance for parallel / tangent / coincident decisions.
            double Epsilon = Geometry::kEpsilon;
        };

        Solver();
        explicit Solver(const Config& config);

        [[nodiscard]] Core::Expected<SolveReport> Solve(entt::registry& registry,
                                                        const DependencyGraph& graph,
                                                        std::span<const entt::entity> changed) const;

        // Resolves a single entity from the current values of its dependencies.
        // Returns true if the entity ended up valid.
        bool ResolveEntity(entt::registry& registry, entt::entity entity, SolveReport& report) const;

        [[nodiscard]] Config& GetConfig() { return m_Config; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        Config m_Config;
    };
}
