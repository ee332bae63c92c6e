module;

#include <glm/glm.hpp>

export module Geometry:Viewport;

import :Vector;
import :AABB;
import :Primitives;

export namespace Geometry
{
    // Maps virtual (construction) space to actual (pixel) space.
    // Virtual y grows upwards, actual y grows downwards; the actual origin is
    // the top-left corner of the drawable area. Scale is uniform and taken from
    // the horizontal axis, so Size should match the aspect of ActualSize.
    struct Viewport
    {
        Vector2 Center{0.0};
        Vector2 Size{2.0, 2.0};
        Vector2 ActualSize{1.0, 1.0};

        [[nodiscard]] double Scale() const
        {
            return ActualSize.x / Size.x;
        }

        [[nodiscard]] Vector2 ToActual(const Vector2& p) const
        {
            const double s = Scale();
            return Vector2((p.x - Center.x) * s + ActualSize.x * 0.5,
                           (Center.y - p.y) * s + ActualSize.y * 0.5);
        }

        [[nodiscard]] Vector2 ToVirtual(const Vector2& p) const
        {
            const double s = Scale();
            return Vector2((p.x - ActualSize.x * 0.5) / s + Center.x,
                           Center.y - (p.y - ActualSize.y * 0.5) / s);
        }

        [[nodiscard]] double ToActual(double length) const { return length * Scale(); }
        [[nodiscard]] double ToVirtual(double length) const { return length / Scale(); }

        [[nodiscard]] Line ToActual(const Line& line) const
        {
            Line result = line;
            result.Origin = ToActual(line.Origin);
            result.Direction = Vector2(line.Direction.x, -line.Direction.y);
            result.Length = ToActual(line.Length);
            return result;
        }

        [[nodiscard]] Circle ToActual(const Circle& circle) const
        {
            return Circle{ToActual(circle.Center), ToActual(circle.Radius)};
        }

        [[nodiscard]] AABB ActualAabb() const
        {
            return AABB::FromOriginSize(Vector2(0.0), ActualSize);
        }

        [[nodiscard]] AABB VirtualAabb() const
        {
            return AABB{Center - Size * 0.5, Center + Size * 0.5};
        }

        [[nodiscard]] bool HasSameActualSize(const Viewport& other) const
        {
            return ActualSize == other.ActualSize;
        }

        bool operator==(const Viewport&) const = default;
    };
}
