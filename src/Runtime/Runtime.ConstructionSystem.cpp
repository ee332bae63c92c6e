module;

#include <cstdint>
#include <expected>
#include <optional>
#include <tuple>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Runtime.ConstructionSystem;

import Core;
import Geometry;
import ECS;
import Runtime.ChangeQueue;
import Runtime.DependencyGraph;
import Runtime.Solver;
import Runtime.SpatialHashTable;

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

        [[nodiscard]] inline bool HasDefinition(const entt::registry& r, entt::entity e)
        {
            return r.any_of<Symbolic::SymbolicPoint, Symbolic::SymbolicLine, Symbolic::SymbolicCircle>(e);
        }

        void AppendVisibleLine(ConstructionSystem::FrameResult& result,
                               entt::entity entity,
                               const Geometry::Line& line,
                               const Geometry::Viewport& viewport)
        {
            if (const auto clipped = Geometry::ClipLine(viewport.ToActual(line), viewport.ActualAabb()))
            {
                result.VisibleLines.push_back({entity, clipped->first, clipped->second});
            }
        }
    }

    ConstructionSystem::ConstructionSystem(ECS::Scene& scene)
        : ConstructionSystem(scene, Config{})
    {
    }

    ConstructionSystem::ConstructionSystem(ECS::Scene& scene, const Config& config)
        : m_Scene(scene)
        , m_Config(config)
        , m_Solver(config.Solving)
        , m_SpatialHash(config.SpatialHash)
    {
    }

    // -------------------------------------------------------------------------
    // Authoring input
    // -------------------------------------------------------------------------

    void ConstructionSystem::Submit(GeometryEvent event)
    {
        m_Queue.Push(std::move(event));
    }

    Core::Result ConstructionSystem::MoveFreePoint(entt::entity entity, const Geometry::Vector2& position)
    {
        auto& registry = m_Scene.GetRegistry();
        if (!registry.valid(entity))
        {
            Core::Log::Warn("ConstructionSystem: cannot move unknown entity {}", entt::to_integral(entity));
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        auto* point = registry.try_get<Symbolic::SymbolicPoint>(entity);
        auto* free = point ? std::get_if<Symbolic::Free>(point) : nullptr;
        if (!free)
        {
            Core::Log::Warn("ConstructionSystem: entity {} is not a free point", entt::to_integral(entity));
            return Core::Err(Core::ErrorCode::TypeMismatch);
        }

        if (!Geometry::IsFinite(position))
        {
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        free->Position = position;
        m_Queue.Push(Events::Modified{entity});
        return Core::Ok();
    }

    void ConstructionSystem::ApplyInserted(const Events::Inserted& event, std::vector<entt::entity>& changed)
    {
        auto& registry = m_Scene.GetRegistry();
        if (!registry.valid(event.Entity))
        {
            Core::Log::Warn("ConstructionSystem: insert for unknown entity {} ignored", entt::to_integral(event.Entity));
            return;
        }
        if (HasDefinition(registry, event.Entity))
        {
            Core::Log::Warn("ConstructionSystem: entity {} already has a definition", entt::to_integral(event.Entity));
            return;
        }

        std::visit([&](const auto& definition)
        {
            registry.emplace<std::decay_t<decltype(definition)>>(event.Entity, definition);
        }, event.Definition);

        m_Graph.Link(event.Entity, event.Definition);
        changed.push_back(event.Entity);
    }

    void ConstructionSystem::ApplyRemoved(const Events::Removed& event,
                                          std::vector<entt::entity>& changed,
                                          FrameResult& result)
    {
        // Dependents lose their input and must resolve (to Invalid) this frame.
        for (entt::entity dependent : m_Graph.GetDependents(event.Entity))
        {
            changed.push_back(dependent);
        }

        m_Graph.Unlink(event.Entity, event.Definition);
        m_Graph.Remove(event.Entity);
        m_SpatialHash.RemoveFromAll(event.Entity);

        auto& registry = m_Scene.GetRegistry();
        if (registry.valid(event.Entity))
        {
            registry.remove<Symbolic::SymbolicPoint, Symbolic::SymbolicLine, Symbolic::SymbolicCircle,
                            Resolved::Point, Resolved::Line, Resolved::Circle,
                            Resolved::Invalid, Resolved::BranchMemory>(event.Entity);
        }

        result.Removed.push_back(event.Entity);
    }

    // -------------------------------------------------------------------------
    // Frame
    // -------------------------------------------------------------------------

    Core::Expected<ConstructionSystem::FrameResult> ConstructionSystem::Tick(const Geometry::Viewport& viewport)
    {
        auto& registry = m_Scene.GetRegistry();

        FrameResult result;
        std::vector<entt::entity> changed;

        for (const GeometryEvent& event : m_Queue.Drain())
        {
            std::visit(Overloaded{
                [&](const Events::Inserted& e) { ApplyInserted(e, changed); },
                [&](const Events::Removed& e) { ApplyRemoved(e, changed, result); },
                [&](const Events::Modified& e) { changed.push_back(e.Entity); }
            }, event);
        }

        auto report = m_Solver.Solve(registry, m_Graph, changed);
        if (!report)
        {
            Core::Log::Error("ConstructionSystem: solve failed ({})", Core::ErrorCodeToString(report.error()));
            return std::unexpected(report.error());
        }

        const bool resized = !m_Viewport || !m_Viewport->HasSameActualSize(viewport);
        const bool moved = !m_Viewport || *m_Viewport != viewport;
        m_Viewport = viewport;

        if (resized)
        {
            m_SpatialHash.InitViewport(viewport);
        }

        if (moved)
        {
            ReindexAll(viewport);
            for (auto [entity, line] : registry.view<Resolved::Line>().each())
            {
                AppendVisibleLine(result, entity, line.Value, viewport);
            }
        }
        else
        {
            for (const GeometryUpdate& update : report->Updated)
            {
                IndexEntity(update.Entity, viewport);
                if (const auto* line = std::get_if<Geometry::Line>(&update.Value))
                {
                    AppendVisibleLine(result, update.Entity, *line, viewport);
                }
            }
            for (entt::entity entity : report->Invalidated)
            {
                m_SpatialHash.RemoveFromAll(entity);
            }
        }

        result.Updated = std::move(report->Updated);
        result.Invalidated = std::move(report->Invalidated);
        return result;
    }

    // -------------------------------------------------------------------------
    // Spatial index maintenance
    // -------------------------------------------------------------------------

    void ConstructionSystem::IndexEntity(entt::entity entity, const Geometry::Viewport& viewport)
    {
        const auto& registry = m_Scene.GetRegistry();
        m_SpatialHash.RemoveFromAll(entity);

        if (const auto* point = registry.try_get<Resolved::Point>(entity))
            m_SpatialHash.InsertPoint(entity, point->Value, viewport);
        else if (const auto* line = registry.try_get<Resolved::Line>(entity))
            m_SpatialHash.InsertLine(entity, line->Value, viewport);
        else if (const auto* circle = registry.try_get<Resolved::Circle>(entity))
            m_SpatialHash.InsertCircle(entity, circle->Value, viewport);
    }

    void ConstructionSystem::ReindexAll(const Geometry::Viewport& viewport)
    {
        const auto& registry = m_Scene.GetRegistry();
        m_SpatialHash.Clear();

        for (auto [entity, point] : registry.view<Resolved::Point>().each())
            m_SpatialHash.InsertPoint(entity, point.Value, viewport);
        for (auto [entity, line] : registry.view<Resolved::Line>().each())
            m_SpatialHash.InsertLine(entity, line.Value, viewport);
        for (auto [entity, circle] : registry.view<Resolved::Circle>().each())
            m_SpatialHash.InsertCircle(entity, circle.Value, viewport);
    }

    // -------------------------------------------------------------------------
    // Picking
    // -------------------------------------------------------------------------

    std::optional<std::vector<entt::entity>> ConstructionSystem::GetNeighborEntitiesOfPoint(const Geometry::Vector2& virtualPoint) const
    {
        if (!m_Viewport) return std::nullopt;
        return m_SpatialHash.GetNeighborEntitiesOfPoint(virtualPoint, *m_Viewport);
    }

    std::unordered_set<entt::entity> ConstructionSystem::GetNeighborEntitiesOfAabb(const Geometry::AABB& actualBox) const
    {
        return m_SpatialHash.GetNeighborEntitiesOfAabb(actualBox);
    }

    std::optional<entt::entity> ConstructionSystem::PickNearest(const Geometry::Vector2& virtualPoint) const
    {
        const auto candidates = GetNeighborEntitiesOfPoint(virtualPoint);
        if (!candidates) return std::nullopt;

        const auto& registry = m_Scene.GetRegistry();
        const Geometry::Viewport& viewport = *m_Viewport;
        const Geometry::Vector2 query = viewport.ToActual(virtualPoint);

        // (priority, pixel distance, id): smaller is better. Points have priority 0.
        using Rank = std::tuple<int, double, std::uint32_t>;
        std::optional<Rank> bestRank;
        std::optional<entt::entity> best;

        for (entt::entity entity : *candidates)
        {
            int priority = 1;
            double distance = 0.0;

            if (const auto* point = registry.try_get<Resolved::Point>(entity))
            {
                priority = 0;
                distance = glm::length(viewport.ToActual(point->Value) - query);
            }
            else if (const auto* line = registry.try_get<Resolved::Line>(entity))
            {
                distance = Geometry::Distance(viewport.ToActual(line->Value), query);
            }
            else if (const auto* circle = registry.try_get<Resolved::Circle>(entity))
            {
                distance = Geometry::Distance(viewport.ToActual(circle->Value), query);
            }
            else
            {
                continue;
            }

            if (distance > m_Config.PickTolerance) continue;

            const Rank rank{priority, distance, static_cast<std::uint32_t>(entt::to_integral(entity))};
            if (!bestRank || rank < *bestRank)
            {
                bestRank = rank;
                best = entity;
            }
        }

        return best;
    }
}
