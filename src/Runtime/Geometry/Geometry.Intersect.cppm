module;

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <glm/glm.hpp>

export module Geometry:Intersect;

import :Vector;
import :AABB;
import :Primitives;

export namespace Geometry
{
    // Zero, one (tangency) or two solutions. When two, Points[0] and Points[1]
    // follow an implementation-defined canonical order:
    //   circle/line:   increasing parameter along the line direction
    //   circle/circle: left of the first->second centre axis, then right
    struct CircleIntersection
    {
        std::uint32_t Count = 0;
        std::array<Vector2, 2> Points{};

        [[nodiscard]] bool Empty() const noexcept { return Count == 0; }
    };

    // Intersection of the two infinite carriers. std::nullopt when the
    // directions are parallel within epsilon.
    [[nodiscard]] std::optional<Vector2> IntersectLines(const Line& a, const Line& b, double epsilon = kEpsilon);

    // Uses the infinite carrier of the line.
    [[nodiscard]] CircleIntersection IntersectCircleLine(const Circle& circle, const Line& line, double epsilon = kEpsilon);

    [[nodiscard]] CircleIntersection IntersectCircles(const Circle& a, const Circle& b, double epsilon = kEpsilon);

    // Visible part of the line inside the box, honouring Ray/Segment extents
    // (Liang-Barsky). Endpoints are returned in increasing parameter order.
    [[nodiscard]] std::optional<std::pair<Vector2, Vector2>> ClipLine(const Line& line, const AABB& box);

    // Projection parameter on the infinite carrier.
    [[nodiscard]] double ClosestParameter(const Line& line, const Vector2& p);

    // Closest point on the drawn extent of the line.
    [[nodiscard]] Vector2 ClosestPoint(const Line& line, const Vector2& p);

    // Closest point on the circle outline; std::nullopt if p is the centre.
    [[nodiscard]] std::optional<Vector2> ClosestPoint(const Circle& circle, const Vector2& p, double epsilon = kEpsilon);

    [[nodiscard]] double Distance(const Line& line, const Vector2& p);
    [[nodiscard]] double Distance(const Circle& circle, const Vector2& p);
}
