#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>
#include <entt/entity/registry.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

import Core;
import Geometry;
import ECS;
import Runtime.ChangeQueue;
import Runtime.DependencyGraph;
import Runtime.SpatialHashTable;
import Runtime.Solver;
import Runtime.ConstructionSystem;

using namespace Runtime;
namespace Symbolic = ECS::Components::Symbolic;
namespace Resolved = ECS::Components::Resolved;

// -------------------------------------------------------------------------
// Helpers
// -------------------------------------------------------------------------
namespace
{
    void ExpectVec2Near(const Geometry::Vector2& a, const Geometry::Vector2& b, double epsilon = 1e-9)
    {
        EXPECT_NEAR(a.x, b.x, epsilon) << "A=(" << a.x << ", " << a.y << ") B=(" << b.x << ", " << b.y << ")";
        EXPECT_NEAR(a.y, b.y, epsilon) << "A=(" << a.x << ", " << a.y << ") B=(" << b.x << ", " << b.y << ")";
    }

    bool Contains(const std::vector<entt::entity>& v, entt::entity e)
    {
        return std::find(v.begin(), v.end(), e) != v.end();
    }

    bool WasUpdated(const ConstructionSystem::FrameResult& frame, entt::entity e)
    {
        return std::any_of(frame.Updated.begin(), frame.Updated.end(),
                           [e](const GeometryUpdate& u) { return u.Entity == e; });
    }

    bool IsIndexed(const ConstructionSystem& system, entt::entity e)
    {
        const auto& table = system.GetSpatialHashTable();
        for (std::uint32_t t = 0; t < table.TileCount(); ++t)
        {
            if (table.GetEntitiesInTile(t).contains(e)) return true;
        }
        return false;
    }

    // 2x2 virtual units over 80x80 px: 40 px per unit, 2x2 tiles.
    const Geometry::Viewport kViewport{{0.0, 0.0}, {2.0, 2.0}, {80.0, 80.0}};

    class ConstructionSystemTest : public ::testing::Test
    {
    protected:
        entt::entity Insert(const Symbolic::Definition& definition, const std::string& name = "Entity")
        {
            const auto e = m_Scene.CreateEntity(name);
            m_System.Submit(Events::Inserted{e, definition});
            return e;
        }

        entt::entity Fixed(Geometry::Vector2 p) { return Insert(Symbolic::SymbolicPoint{Symbolic::Fixed{p}}); }
        entt::entity Free(Geometry::Vector2 p) { return Insert(Symbolic::SymbolicPoint{Symbolic::Free{p}}); }

        ConstructionSystem::FrameResult Tick(const Geometry::Viewport& viewport = kViewport)
        {
            auto frame = m_System.Tick(viewport);
            EXPECT_TRUE(frame.has_value());
            return frame.value_or(ConstructionSystem::FrameResult{});
        }

        entt::registry& Registry() { return m_Scene.GetRegistry(); }

        ECS::Scene m_Scene;
        ConstructionSystem m_System{m_Scene};
    };
}

// =========================================================================
// Event application
// =========================================================================

TEST_F(ConstructionSystemTest, EventsApplyOnTick)
{
    const auto p = Fixed({0, 0});

    EXPECT_EQ(m_System.GetPendingEventCount(), 1u);
    EXPECT_FALSE(Registry().all_of<Symbolic::SymbolicPoint>(p));
    EXPECT_FALSE(Registry().all_of<Resolved::Point>(p));

    auto frame = Tick();

    EXPECT_EQ(m_System.GetPendingEventCount(), 0u);
    ASSERT_TRUE(Registry().all_of<Resolved::Point>(p));
    EXPECT_TRUE(WasUpdated(frame, p));
}

TEST_F(ConstructionSystemTest, TickResolvesAndIndexes)
{
    const auto a = Fixed({0, 0});
    const auto b = Free({0.5, 0.5});
    const auto seg = Insert(Symbolic::SymbolicLine{Symbolic::Segment{a, b}});

    auto frame = Tick();

    EXPECT_EQ(frame.Updated.size(), 3u);
    EXPECT_TRUE(frame.Invalidated.empty());
    EXPECT_TRUE(m_System.GetDependencyGraph().HasEdge(a, seg));
    EXPECT_TRUE(m_System.GetDependencyGraph().HasEdge(b, seg));

    const auto& table = m_System.GetSpatialHashTable();
    EXPECT_EQ(table.TileCount(), 4u);
    EXPECT_TRUE(table.GetEntitiesInTile(3).contains(a));
    EXPECT_TRUE(table.GetEntitiesInTile(1).contains(b));
    EXPECT_TRUE(table.GetEntitiesInTile(1).contains(seg));

    ASSERT_EQ(frame.VisibleLines.size(), 1u);
    EXPECT_EQ(frame.VisibleLines[0].Entity, seg);
    ExpectVec2Near(frame.VisibleLines[0].From, {40, 40});
    ExpectVec2Near(frame.VisibleLines[0].To, {60, 20});
}

TEST_F(ConstructionSystemTest, InsertForUnknownEntityIsIgnored)
{
    const auto ghost = Registry().create();
    Registry().destroy(ghost);
    m_System.Submit(Events::Inserted{ghost, Symbolic::SymbolicPoint{Symbolic::Fixed{{0, 0}}}});

    auto frame = Tick();
    EXPECT_TRUE(frame.Updated.empty());
}

TEST_F(ConstructionSystemTest, SecondDefinitionIsIgnored)
{
    const auto p = Fixed({0, 0});
    m_System.Submit(Events::Inserted{p, Symbolic::SymbolicPoint{Symbolic::Fixed{{0.5, 0.5}}}});

    Tick();

    ExpectVec2Near(Registry().get<Resolved::Point>(p).Value, {0, 0});
}

TEST_F(ConstructionSystemTest, InsertThenRemoveInSameFrame)
{
    const Symbolic::Definition def = Symbolic::SymbolicPoint{Symbolic::Fixed{{0, 0}}};
    const auto p = Insert(def);
    m_System.Submit(Events::Removed{p, def});

    auto frame = Tick();

    EXPECT_EQ(frame.Removed, (std::vector<entt::entity>{p}));
    EXPECT_FALSE(WasUpdated(frame, p));
    EXPECT_FALSE(Registry().all_of<Resolved::Point>(p));
    EXPECT_FALSE(IsIndexed(m_System, p));
}

// =========================================================================
// Editing
// =========================================================================

TEST_F(ConstructionSystemTest, MoveFreePoint)
{
    const auto p = Free({0.5, 0.5});
    const auto anchor = Fixed({-0.5, 0.5});
    const auto mid = Insert(Symbolic::SymbolicPoint{Symbolic::MidPoint{p, anchor}});
    Tick();
    ASSERT_TRUE(m_System.GetSpatialHashTable().GetEntitiesInTile(1).contains(p));

    ASSERT_TRUE(m_System.MoveFreePoint(p, {0.5, -0.5}).has_value());

    // Resolved geometry only changes on the next frame.
    ExpectVec2Near(Registry().get<Resolved::Point>(p).Value, {0.5, 0.5});

    auto frame = Tick();

    EXPECT_TRUE(WasUpdated(frame, p));
    EXPECT_TRUE(WasUpdated(frame, mid));
    EXPECT_FALSE(WasUpdated(frame, anchor));
    ExpectVec2Near(Registry().get<Resolved::Point>(mid).Value, {0, 0});

    const auto& table = m_System.GetSpatialHashTable();
    EXPECT_FALSE(table.GetEntitiesInTile(1).contains(p));
    EXPECT_TRUE(table.GetEntitiesInTile(3).contains(p));
}

TEST_F(ConstructionSystemTest, MoveFreePointRejectsOtherDefinitions)
{
    const auto fixed = Fixed({0, 0});
    const auto free = Free({0.5, 0});
    const auto mid = Insert(Symbolic::SymbolicPoint{Symbolic::MidPoint{fixed, free}});
    const auto line = Insert(Symbolic::SymbolicLine{Symbolic::Straight{fixed, free}});
    Tick();

    auto r1 = m_System.MoveFreePoint(fixed, {1, 1});
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error(), Core::ErrorCode::TypeMismatch);

    auto r2 = m_System.MoveFreePoint(mid, {1, 1});
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error(), Core::ErrorCode::TypeMismatch);

    auto r3 = m_System.MoveFreePoint(line, {1, 1});
    ASSERT_FALSE(r3.has_value());
    EXPECT_EQ(r3.error(), Core::ErrorCode::TypeMismatch);

    auto r4 = m_System.MoveFreePoint(free, {std::numeric_limits<double>::quiet_NaN(), 0});
    ASSERT_FALSE(r4.has_value());
    EXPECT_EQ(r4.error(), Core::ErrorCode::InvalidArgument);

    const auto ghost = Registry().create();
    Registry().destroy(ghost);
    auto r5 = m_System.MoveFreePoint(ghost, {1, 1});
    ASSERT_FALSE(r5.has_value());
    EXPECT_EQ(r5.error(), Core::ErrorCode::ResourceNotFound);

    EXPECT_EQ(m_System.GetPendingEventCount(), 0u);
}

TEST_F(ConstructionSystemTest, RemovalInvalidatesDependents)
{
    const auto a = Fixed({-0.5, 0});
    const Symbolic::Definition bDef = Symbolic::SymbolicPoint{Symbolic::Fixed{{0.5, 0}}};
    const auto b = Insert(bDef);
    const auto mid = Insert(Symbolic::SymbolicPoint{Symbolic::MidPoint{a, b}});
    Tick();
    ASSERT_TRUE(IsIndexed(m_System, mid));

    m_System.Submit(Events::Removed{b, bDef});
    auto frame = Tick();

    EXPECT_EQ(frame.Removed, (std::vector<entt::entity>{b}));
    EXPECT_EQ(frame.Invalidated, (std::vector<entt::entity>{mid}));
    EXPECT_FALSE((Registry().any_of<Symbolic::SymbolicPoint, Resolved::Point>(b)));
    EXPECT_TRUE(Registry().all_of<Resolved::Invalid>(mid));
    EXPECT_FALSE(IsIndexed(m_System, b));
    EXPECT_FALSE(IsIndexed(m_System, mid));

    EXPECT_FALSE(m_System.GetDependencyGraph().HasEdge(b, mid));
    EXPECT_TRUE(m_System.GetDependencyGraph().HasEdge(a, mid));
}

TEST_F(ConstructionSystemTest, RemovingDependentDropsItsEdges)
{
    const auto a = Fixed({-0.5, 0});
    const auto b = Fixed({0.5, 0});
    const Symbolic::Definition lineDef = Symbolic::SymbolicLine{Symbolic::Straight{a, b}};
    const auto line = Insert(lineDef);
    Tick();

    m_System.Submit(Events::Removed{line, lineDef});
    Tick();

    EXPECT_FALSE(m_System.GetDependencyGraph().HasEdge(a, line));
    EXPECT_FALSE(m_System.GetDependencyGraph().HasEdge(b, line));
    EXPECT_FALSE(IsIndexed(m_System, line));
}

TEST_F(ConstructionSystemTest, InvalidEntitiesLeaveTheIndex)
{
    const auto center = Free({0, 0});
    const auto rim = Free({0.5, 0});
    const auto circle = Insert(Symbolic::SymbolicCircle{Symbolic::CenterRadius{center, rim}});
    Tick();
    ASSERT_TRUE(IsIndexed(m_System, circle));

    ASSERT_TRUE(m_System.MoveFreePoint(rim, {0, 0}).has_value());
    auto collapsed = Tick();
    EXPECT_TRUE(Contains(collapsed.Invalidated, circle));
    EXPECT_FALSE(IsIndexed(m_System, circle));

    ASSERT_TRUE(m_System.MoveFreePoint(rim, {0.25, 0}).has_value());
    auto restored = Tick();
    EXPECT_TRUE(WasUpdated(restored, circle));
    EXPECT_TRUE(IsIndexed(m_System, circle));
}

TEST_F(ConstructionSystemTest, VisibleLinesFollowUpdates)
{
    const auto a = Free({-0.5, 0});
    const auto b = Fixed({0.5, 0});
    const auto ray = Insert(Symbolic::SymbolicLine{Symbolic::Ray{a, b}});
    const auto other = Insert(Symbolic::SymbolicLine{Symbolic::Straight{b, Fixed({0.5, 0.5})}});
    Tick();

    ASSERT_TRUE(m_System.MoveFreePoint(a, {-0.5, -0.5}).has_value());
    auto frame = Tick();

    ASSERT_EQ(frame.VisibleLines.size(), 1u);
    EXPECT_EQ(frame.VisibleLines[0].Entity, ray);
    EXPECT_NE(frame.VisibleLines[0].Entity, other);
    ExpectVec2Near(frame.VisibleLines[0].From, {20, 60});
    ExpectVec2Near(frame.VisibleLines[0].To, {80, 30});
}

// =========================================================================
// Viewport handling
// =========================================================================

TEST_F(ConstructionSystemTest, PanReindexesWithoutGeometryUpdates)
{
    const auto p = Fixed({0, 0});
    Tick();
    ASSERT_TRUE(m_System.GetSpatialHashTable().GetEntitiesInTile(3).contains(p));

    Geometry::Viewport panned = kViewport;
    panned.Center = {0.5, 0.0};
    auto frame = Tick(panned);

    EXPECT_TRUE(frame.Updated.empty());
    EXPECT_EQ(m_System.GetSpatialHashTable().TileCount(), 4u);
    EXPECT_FALSE(m_System.GetSpatialHashTable().GetEntitiesInTile(3).contains(p));
    EXPECT_TRUE(m_System.GetSpatialHashTable().GetEntitiesInTile(2).contains(p));
}

TEST_F(ConstructionSystemTest, ResizeReinitialisesGrid)
{
    const auto p = Fixed({0, 0});
    Tick();
    ASSERT_EQ(m_System.GetSpatialHashTable().TileCount(), 4u);

    const Geometry::Viewport larger{{0.0, 0.0}, {3.0, 3.0}, {120.0, 120.0}};
    Tick(larger);

    const auto& table = m_System.GetSpatialHashTable();
    EXPECT_EQ(table.XTiles(), 3u);
    EXPECT_EQ(table.YTiles(), 3u);
    EXPECT_TRUE(table.GetEntitiesInTile(4).contains(p));
    ASSERT_TRUE(m_System.GetViewport().has_value());
    EXPECT_EQ(*m_System.GetViewport(), larger);
}

TEST_F(ConstructionSystemTest, ViewportChangeReportsAllVisibleLines)
{
    const auto a = Fixed({-0.5, 0});
    const auto b = Fixed({0.5, 0});
    Insert(Symbolic::SymbolicLine{Symbolic::Straight{a, b}});
    Insert(Symbolic::SymbolicLine{Symbolic::Perpendicular{Insert(Symbolic::SymbolicLine{Symbolic::Segment{a, b}}), a}});
    Tick();

    Geometry::Viewport zoomed = kViewport;
    zoomed.Size = {4.0, 4.0};
    auto frame = Tick(zoomed);

    EXPECT_TRUE(frame.Updated.empty());
    EXPECT_EQ(frame.VisibleLines.size(), 3u);
}

// =========================================================================
// Picking
// =========================================================================

TEST_F(ConstructionSystemTest, PickBeforeFirstTick)
{
    EXPECT_FALSE(m_System.PickNearest({0, 0}).has_value());
    EXPECT_FALSE(m_System.GetNeighborEntitiesOfPoint({0, 0}).has_value());
}

TEST_F(ConstructionSystemTest, PickNearest)
{
    const auto origin = Fixed({0, 0});
    const auto lineStart = Fixed({-0.9, 0.1});
    const auto lineEnd = Fixed({-0.8, 0.1});
    const auto line = Insert(Symbolic::SymbolicLine{Symbolic::Straight{lineStart, lineEnd}});
    const auto center = Fixed({0, -0.5});
    const auto circle = Insert(Symbolic::SymbolicCircle{Symbolic::CenterRadius{center, Fixed({0.25, -0.5})}});
    Tick();

    // Close to both the point and the line: the point wins.
    EXPECT_EQ(m_System.PickNearest({0.02, 0.03}), origin);

    // Near the line only (0.8 px away).
    EXPECT_EQ(m_System.PickNearest({0.3, 0.12}), line);

    // On top of the circle, 10 px from every point.
    EXPECT_EQ(m_System.PickNearest({0, -0.25}), circle);

    // Nothing within tolerance.
    EXPECT_FALSE(m_System.PickNearest({0.7, -0.9}).has_value());

    // Outside the grid.
    EXPECT_FALSE(m_System.PickNearest({5, 5}).has_value());
}

TEST(ConstructionSystem, PickToleranceIsConfigurable)
{
    ECS::Scene scene;
    ConstructionSystem::Config config;
    config.PickTolerance = 1.0;
    ConstructionSystem system(scene, config);

    const auto p = scene.CreateEntity("P");
    system.Submit(Events::Inserted{p, Symbolic::SymbolicPoint{Symbolic::Fixed{{0, 0}}}});
    ASSERT_TRUE(system.Tick(kViewport).has_value());

    // 2 px away.
    EXPECT_FALSE(system.PickNearest({0.05, 0}).has_value());
    EXPECT_EQ(system.PickNearest({0.01, 0}), p);
}

TEST_F(ConstructionSystemTest, NeighborQueriesForward)
{
    const auto p = Fixed({0.5, 0.5});
    Tick();

    auto near = m_System.GetNeighborEntitiesOfPoint({0.4, 0.4});
    ASSERT_TRUE(near.has_value());
    EXPECT_TRUE(Contains(*near, p));

    const auto inBox = m_System.GetNeighborEntitiesOfAabb(Geometry::AABB{{41, 1}, {79, 39}});
    EXPECT_TRUE(inBox.contains(p));
}
