module;

#include <glm/glm.hpp>

export module ECS:Components.Resolved;

import Geometry;

// Concrete geometry written by the solver only. An entity whose definition
// cannot be resolved this pass has none of Point/Line/Circle and carries the
// Invalid tag instead.
export namespace ECS::Components::Resolved
{
    struct Point
    {
        Geometry::Vector2 Value{0.0};
    };

    struct Line
    {
        Geometry::Line Value{};
    };

    struct Circle
    {
        Geometry::Circle Value{};
    };

    struct Invalid {};

    // Last valid value of a multi-valued intersection point. Survives periods
    // of invalidity so branch continuity resumes where the user left off.
    struct BranchMemory
    {
        Geometry::Vector2 Last{0.0};
    };
}
