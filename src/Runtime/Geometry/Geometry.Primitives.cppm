module;

#include <cstdint>
#include <limits>
#include <utility>
#include <glm/glm.hpp>

export module Geometry:Primitives;

import :Vector;

export namespace Geometry
{
    using Point = Vector2;

    enum class LineKind : std::uint8_t
    {
        Full,
        Ray,
        Segment
    };

    // Origin + t * Direction. Direction is unit length for every resolved line;
    // Length is only meaningful for segments.
    struct Line
    {
        Vector2 Origin{0.0};
        Vector2 Direction{1.0, 0.0};
        LineKind Kind = LineKind::Full;
        double Length = 0.0;

        [[nodiscard]] Vector2 PointAt(double t) const
        {
            return Origin + t * Direction;
        }

        // Parameter interval covered by the drawn extent.
        [[nodiscard]] std::pair<double, double> ParameterRange() const
        {
            constexpr double inf = std::numeric_limits<double>::infinity();
            switch (Kind)
            {
            case LineKind::Ray:     return {0.0, inf};
            case LineKind::Segment: return {0.0, Length};
            case LineKind::Full:
            default:                return {-inf, inf};
            }
        }

        bool operator==(const Line&) const = default;
    };

    struct Circle
    {
        Vector2 Center{0.0};
        double Radius = 0.0;

        bool operator==(const Circle&) const = default;
    };
}
