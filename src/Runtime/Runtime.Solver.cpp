module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Runtime.Solver;

import Core;
import Geometry;
import ECS;
import Runtime.DependencyGraph;

namespace Runtime
{
    namespace Symbolic = ECS::Components::Symbolic;
    namespace Resolved = ECS::Components::Resolved;

    namespace
    {
        template<class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template<class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

        // ---------------------------------------------------------------------
        // Dependency lookup. An invalid or missing dependency has no resolved
        // component, which is exactly what propagates invalidity downstream.
        // ---------------------------------------------------------------------

        const Geometry::Vector2* LookupPoint(const entt::registry& registry, entt::entity e)
        {
            if (!registry.valid(e)) return nullptr;
            const auto* c = registry.try_get<Resolved::Point>(e);
            return c ? &c->Value : nullptr;
        }

        const Geometry::Line* LookupLine(const entt::registry& registry, entt::entity e)
        {
            if (!registry.valid(e)) return nullptr;
            const auto* c = registry.try_get<Resolved::Line>(e);
            return c ? &c->Value : nullptr;
        }

        const Geometry::Circle* LookupCircle(const entt::registry& registry, entt::entity e)
        {
            if (!registry.valid(e)) return nullptr;
            const auto* c = registry.try_get<Resolved::Circle>(e);
            return c ? &c->Value : nullptr;
        }

        // Picks one solution of a two-valued intersection. The remembered value
        // wins over the creation-time branch index once it exists.
        std::optional<Geometry::Vector2> SelectBranch(const Geometry::CircleIntersection& hits,
                                                      std::uint8_t branch,
                                                      const Resolved::BranchMemory* memory)
        {
            if (hits.Empty()) return std::nullopt;
            if (hits.Count == 1) return hits.Points[0];

            if (memory)
            {
                const double d0 = glm::length(hits.Points[0] - memory->Last);
                const double d1 = glm::length(hits.Points[1] - memory->Last);
                return d1 < d0 ? hits.Points[1] : hits.Points[0];
            }

            return hits.Points[std::min<std::size_t>(branch, 1)];
        }

        std::optional<Geometry::Line> LineThrough(const entt::registry& registry,
                                                  entt::entity a,
                                                  entt::entity b,
                                                  Geometry::LineKind kind,
                                                  double epsilon)
        {
            const auto* pa = LookupPoint(registry, a);
            const auto* pb = LookupPoint(registry, b);
            if (!pa || !pb) return std::nullopt;

            const Geometry::Vector2 delta = *pb - *pa;
            const auto direction = Geometry::TryNormalize(delta, epsilon);
            if (!direction) return std::nullopt;

            Geometry::Line line;
            line.Origin = *pa;
            line.Direction = *direction;
            line.Kind = kind;
            line.Length = kind == Geometry::LineKind::Segment ? glm::length(delta) : 0.0;
            return line;
        }

        // ---------------------------------------------------------------------
        // Per-type resolution rules
        // ---------------------------------------------------------------------

        std::optional<Geometry::Vector2> ResolvePoint(const entt::registry& registry,
                                                      entt::entity self,
                                                      const Symbolic::SymbolicPoint& definition,
                                                      double epsilon)
        {
            const auto* memory = registry.try_get<Resolved::BranchMemory>(self);

            return std::visit(Overloaded{
                [](const Symbolic::Fixed& d) -> std::optional<Geometry::Vector2> { return d.Position; },
                [](const Symbolic::Free& d) -> std::optional<Geometry::Vector2> { return d.Position; },
                [&](const Symbolic::MidPoint& d) -> std::optional<Geometry::Vector2>
                {
                    const auto* a = LookupPoint(registry, d.A);
                    const auto* b = LookupPoint(registry, d.B);
                    if (!a || !b) return std::nullopt;
                    return (*a + *b) * 0.5;
                },
                [&](const Symbolic::OnLine& d) -> std::optional<Geometry::Vector2>
                {
                    const auto* line = LookupLine(registry, d.Line);
                    if (!line) return std::nullopt;
                    return line->PointAt(d.T);
                },
                [&](const Symbolic::LineLineIntersect& d) -> std::optional<Geometry::Vector2>
                {
                    const auto* first = LookupLine(registry, d.First);
                    const auto* second = LookupLine(registry, d.Second);
                    if (!first || !second) return std::nullopt;
                    return Geometry::IntersectLines(*first, *second, epsilon);
                },
                [&](const Symbolic::OnCircle& d) -> std::optional<Geometry::Vector2>
                {
                    const auto* circle = LookupCircle(registry, d.Circle);
                    if (!circle) return std::nullopt;
                    return circle->Center + circle->Radius * Geometry::Vector2(std::cos(d.Angle), std::sin(d.Angle));
                },
                [&](const Symbolic::CircleLineIntersect& d) -> std::optional<Geometry::Vector2>
                {
                    const auto* circle = LookupCircle(registry, d.Circle);
                    const auto* line = LookupLine(registry, d.Line);
                    if (!circle || !line) return std::nullopt;
                    return SelectBranch(Geometry::IntersectCircleLine(*circle, *line, epsilon), d.Branch, memory);
                },
                [&](const Symbolic::CircleCircleIntersect& d) -> std::optional<Geometry::Vector2>
                {
                    const auto* first = LookupCircle(registry, d.First);
                    const auto* second = LookupCircle(registry, d.Second);
                    if (!first || !second) return std::nullopt;
                    return SelectBranch(Geometry::IntersectCircles(*first, *second, epsilon), d.Branch, memory);
                }
            }, definition);
        }

        std::optional<Geometry::Line> ResolveLine(const entt::registry& registry,
                                                  const Symbolic::SymbolicLine& definition,
                                                  double epsilon)
        {
            return std::visit(Overloaded{
                [&](const Symbolic::Straight& d) { return LineThrough(registry, d.A, d.B, Geometry::LineKind::Full, epsilon); },
                [&](const Symbolic::Ray& d) { return LineThrough(registry, d.A, d.B, Geometry::LineKind::Ray, epsilon); },
                [&](const Symbolic::Segment& d) { return LineThrough(registry, d.A, d.B, Geometry::LineKind::Segment, epsilon); },
                [&](const Symbolic::Parallel& d) -> std::optional<Geometry::Line>
                {
                    const auto* line = LookupLine(registry, d.Line);
                    const auto* point = LookupPoint(registry, d.Point);
                    if (!line || !point) return std::nullopt;
                    return Geometry::Line{*point, line->Direction, Geometry::LineKind::Full, 0.0};
                },
                [&](const Symbolic::Perpendicular& d) -> std::optional<Geometry::Line>
                {
                    const auto* line = LookupLine(registry, d.Line);
                    const auto* point = LookupPoint(registry, d.Point);
                    if (!line || !point) return std::nullopt;
                    return Geometry::Line{*point, Geometry::Perpendicular(line->Direction), Geometry::LineKind::Full, 0.0};
                }
            }, definition);
        }

        std::optional<Geometry::Circle> ResolveCircle(const entt::registry& registry,
                                                      const Symbolic::SymbolicCircle& definition,
                                                      double epsilon)
        {
            return std::visit([&](const Symbolic::CenterRadius& d) -> std::optional<Geometry::Circle>
            {
                const auto* center = LookupPoint(registry, d.Center);
                const auto* rim = LookupPoint(registry, d.RadiusPoint);
                if (!center || !rim) return std::nullopt;

                const double radius = glm::length(*rim - *center);
                if (radius <= epsilon) return std::nullopt;
                return Geometry::Circle{*center, radius};
            }, definition);
        }

        bool IsBranching(const Symbolic::SymbolicPoint& definition)
        {
            return std::holds_alternative<Symbolic::CircleLineIntersect>(definition) ||
                   std::holds_alternative<Symbolic::CircleCircleIntersect>(definition);
        }

        // Writes the outcome of one resolution and records it in the report.
        template<typename TResolved, typename TValue>
        bool Commit(entt::registry& registry,
                    entt::entity entity,
                    const std::optional<TValue>& value,
                    SolveReport& report)
        {
            if (value)
            {
                const auto* previous = registry.try_get<TResolved>(entity);
                const bool changed = !previous || previous->Value != *value;

                registry.emplace_or_replace<TResolved>(entity, *value);
                registry.remove<Resolved::Invalid>(entity);

                if (changed)
                {
                    report.Updated.push_back({entity, *value});
                }
                return true;
            }

            if (!registry.all_of<Resolved::Invalid>(entity))
            {
                registry.emplace<Resolved::Invalid>(entity);
                report.Invalidated.push_back(entity);
                Core::Log::Debug("Solver: entity {} is now invalid", entt::to_integral(entity));
            }
            registry.remove<TResolved>(entity);
            return false;
        }
    }

    // -------------------------------------------------------------------------
    // Solver
    // -------------------------------------------------------------------------

    Solver::Solver() = default;

    Solver::Solver(const Config& config) : m_Config(config) {}

    bool Solver::ResolveEntity(entt::registry& registry, entt::entity entity, SolveReport& report) const
    {
        if (!registry.valid(entity)) return false;

        if (const auto* point = registry.try_get<Symbolic::SymbolicPoint>(entity))
        {
            const auto value = ResolvePoint(registry, entity, *point, m_Config.Epsilon);
            const bool valid = Commit<Resolved::Point>(registry, entity, value, report);
            if (valid && IsBranching(*point))
            {
                registry.emplace_or_replace<Resolved::BranchMemory>(entity, *value);
            }
            return valid;
        }

        if (const auto* line = registry.try_get<Symbolic::SymbolicLine>(entity))
        {
            return Commit<Resolved::Line>(registry, entity, ResolveLine(registry, *line, m_Config.Epsilon), report);
        }

        if (const auto* circle = registry.try_get<Symbolic::SymbolicCircle>(entity))
        {
            return Commit<Resolved::Circle>(registry, entity, ResolveCircle(registry, *circle, m_Config.Epsilon), report);
        }

        // Entity was removed from the construction earlier in this batch.
        return false;
    }

    Core::Expected<SolveReport> Solver::Solve(entt::registry& registry,
                                              const DependencyGraph& graph,
                                              std::span<const entt::entity> changed) const
    {
        auto order = graph.RecomputeOrder(changed);
        if (!order)
        {
            return std::unexpected(order.error());
        }

        SolveReport report;
        report.Visited = order->size();

        for (entt::entity entity : *order)
        {
            ResolveEntity(registry, entity, report);
        }

        return report;
    }
}
