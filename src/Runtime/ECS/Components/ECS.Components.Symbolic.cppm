module;

#include <array>
#include <cstdint>
#include <variant>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module ECS:Components.Symbolic;

import Geometry;

// -------------------------------------------------------------------------
// Symbolic definitions
// -------------------------------------------------------------------------
// Every geometric entity carries exactly one of SymbolicPoint, SymbolicLine
// or SymbolicCircle as a component. Definitions only reference entities that
// existed when the definition was created, which keeps the dependency graph
// acyclic by construction.
// -------------------------------------------------------------------------

export namespace ECS::Components::Symbolic
{
    // ----- Points -----

    // Not editable after creation.
    struct Fixed
    {
        Geometry::Vector2 Position{0.0};
    };

    // Directly draggable by the authoring layer.
    struct Free
    {
        Geometry::Vector2 Position{0.0};
    };

    struct MidPoint
    {
        entt::entity A = entt::null;
        entt::entity B = entt::null;
    };

    // Line.Origin + T * Line.Direction. T is not clamped to the drawn extent.
    struct OnLine
    {
        entt::entity Line = entt::null;
        double T = 0.0;
    };

    struct LineLineIntersect
    {
        entt::entity First = entt::null;
        entt::entity Second = entt::null;
    };

    // Center + Radius * (cos Angle, sin Angle).
    struct OnCircle
    {
        entt::entity Circle = entt::null;
        double Angle = 0.0;
    };

    // Branch picks the solution on first resolution; afterwards the solution
    // nearest to the previous value wins.
    struct CircleLineIntersect
    {
        entt::entity Circle = entt::null;
        entt::entity Line = entt::null;
        std::uint8_t Branch = 0;
    };

    struct CircleCircleIntersect
    {
        entt::entity First = entt::null;
        entt::entity Second = entt::null;
        std::uint8_t Branch = 0;
    };

    using SymbolicPoint = std::variant<Fixed, Free, MidPoint, OnLine, LineLineIntersect, OnCircle,
                                       CircleLineIntersect, CircleCircleIntersect>;

    // ----- Lines -----

    struct Straight
    {
        entt::entity A = entt::null;
        entt::entity B = entt::null;
    };

    struct Ray
    {
        entt::entity A = entt::null;
        entt::entity B = entt::null;
    };

    struct Segment
    {
        entt::entity A = entt::null;
        entt::entity B = entt::null;
    };

    struct Parallel
    {
        entt::entity Line = entt::null;
        entt::entity Point = entt::null;
    };

    struct Perpendicular
    {
        entt::entity Line = entt::null;
        entt::entity Point = entt::null;
    };

    using SymbolicLine = std::variant<Straight, Ray, Segment, Parallel, Perpendicular>;

    // ----- Circles -----

    struct CenterRadius
    {
        entt::entity Center = entt::null;
        entt::entity RadiusPoint = entt::null;
    };

    using SymbolicCircle = std::variant<CenterRadius>;

    // Any definition, as carried by change events.
    using Definition = std::variant<SymbolicPoint, SymbolicLine, SymbolicCircle>;

    // Entities named by a definition, in declaration order. At most two;
    // null handles are dropped.
    struct ReferenceList
    {
        std::array<entt::entity, 2> Entities{entt::null, entt::null};
        std::uint32_t Count = 0;

        void Push(entt::entity e)
        {
            if (e == entt::null || Count == Entities.size()) return;
            Entities[Count++] = e;
        }

        [[nodiscard]] const entt::entity* begin() const { return Entities.data(); }
        [[nodiscard]] const entt::entity* end() const { return Entities.data() + Count; }
        [[nodiscard]] bool Empty() const { return Count == 0; }
    };

    [[nodiscard]] ReferenceList References(const SymbolicPoint& point);
    [[nodiscard]] ReferenceList References(const SymbolicLine& line);
    [[nodiscard]] ReferenceList References(const SymbolicCircle& circle);
    [[nodiscard]] ReferenceList References(const Definition& definition);
}
