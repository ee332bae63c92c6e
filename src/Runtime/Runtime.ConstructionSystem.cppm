module;

#include <cstddef>
#include <optional>
#include <unordered_set>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

export module Runtime.ConstructionSystem;

import Core;
import Geometry;
import ECS;
import Runtime.ChangeQueue;
import Runtime.DependencyGraph;
import Runtime.Solver;
import Runtime.SpatialHashTable;

export namespace Runtime
{
    // Per-frame driver of the construction.
    // Owns:
    //  - the dependency graph mirroring the symbolic definitions
    //  - the solver writing resolved geometry into the scene registry
    //  - the screen-space spatial hash used for picking
    //
    // Contract:
    //  - Authoring code calls Submit()/MoveFreePoint() at any time during a frame.
    //  - Tick() is called once per frame with the current viewport. It applies
    //    all pending events, re-solves the affected closure and keeps the
    //    spatial hash in sync with the resolved geometry and the viewport.
    class ConstructionSystem
    {
    public:
        struct Config
        {
            Solver::Config Solving{};
            SpatialHashTable::Config SpatialHash{};

            // Pick radius in pixels.
            double PickTolerance = 6.0;
        };

        // Actual-space part of a line inside the viewport.
        struct VisibleSegment
        {
            entt::entity Entity = entt::null;
            Geometry::Vector2 From{0.0};
            Geometry::Vector2 To{0.0};
        };

        struct FrameResult
        {
            std::vector<GeometryUpdate> Updated;
            std::vector<entt::entity> Invalidated;
            std::vector<entt::entity> Removed;
            // Clipped lines to redraw: the updated ones, or every valid line
            // when the viewport changed.
            std::vector<VisibleSegment> VisibleLines;
        };

        explicit ConstructionSystem(ECS::Scene& scene);
        ConstructionSystem(ECS::Scene& scene, const Config& config);

        void Submit(GeometryEvent event);

        // Edits the position of a Free point. Takes effect on the next Tick().
        Core::Result MoveFreePoint(entt::entity entity, const Geometry::Vector2& position);

        [[nodiscard]] Core::Expected<FrameResult> Tick(const Geometry::Viewport& viewport);

        // ----- Picking (against the viewport of the last Tick) -----
        [[nodiscard]] std::optional<std::vector<entt::entity>> GetNeighborEntitiesOfPoint(const Geometry::Vector2& virtualPoint) const;
        [[nodiscard]] std::unordered_set<entt::entity> GetNeighborEntitiesOfAabb(const Geometry::AABB& actualBox) const;

        // Closest valid entity within PickTolerance pixels. Points take
        // precedence over lines and circles.
        [[nodiscard]] std::optional<entt::entity> PickNearest(const Geometry::Vector2& virtualPoint) const;

        [[nodiscard]] const DependencyGraph& GetDependencyGraph() const { return m_Graph; }
        [[nodiscard]] const SpatialHashTable& GetSpatialHashTable() const { return m_SpatialHash; }
        [[nodiscard]] const std::optional<Geometry::Viewport>& GetViewport() const { return m_Viewport; }
        [[nodiscard]] std::size_t GetPendingEventCount() const { return m_Queue.Size(); }

        [[nodiscard]] Config& GetConfig() { return m_Config; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        ECS::Scene& m_Scene;
        Config m_Config;

        ChangeQueue m_Queue;
        DependencyGraph m_Graph;
        Solver m_Solver;
        SpatialHashTable m_SpatialHash;

        std::optional<Geometry::Viewport> m_Viewport;

        void ApplyInserted(const Events::Inserted& event, std::vector<entt::entity>& changed);
        void ApplyRemoved(const Events::Removed& event, std::vector<entt::entity>& changed, FrameResult& result);

        // Re-inserts one entity from its resolved component (or drops it if invalid).
        void IndexEntity(entt::entity entity, const Geometry::Viewport& viewport);
        void ReindexAll(const Geometry::Viewport& viewport);
    };
}
