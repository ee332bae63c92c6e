module;

#include <limits>
#include <glm/glm.hpp>

export module Geometry:AABB;

import :Vector;

export namespace Geometry
{
    struct AABB
    {
        Vector2 Min = Vector2(std::numeric_limits<double>::max());
        Vector2 Max = Vector2(std::numeric_limits<double>::lowest());

        [[nodiscard]] static AABB FromOriginSize(const Vector2& origin, const Vector2& size)
        {
            return AABB{origin, origin + size};
        }

        [[nodiscard]] bool IsValid() const
        {
            return (Min.x <= Max.x) && (Min.y <= Max.y);
        }

        [[nodiscard]] Vector2 GetCenter() const
        {
            return (Min + Max) * 0.5;
        }

        [[nodiscard]] Vector2 GetSize() const
        {
            return Max - Min;
        }

        [[nodiscard]] double Width() const { return Max.x - Min.x; }
        [[nodiscard]] double Height() const { return Max.y - Min.y; }

        // Boundary inclusive.
        [[nodiscard]] bool Contains(const Vector2& p) const
        {
            return p.x >= Min.x && p.x <= Max.x && p.y >= Min.y && p.y <= Max.y;
        }

        bool operator==(const AABB&) const = default;
    };

    [[nodiscard]] bool Intersects(const AABB& a, const AABB& b)
    {
        return a.Min.x <= b.Max.x && a.Max.x >= b.Min.x &&
               a.Min.y <= b.Max.y && a.Max.y >= b.Min.y;
    }

    [[nodiscard]] Vector2 ClosestPoint(const AABB& box, const Vector2& p)
    {
        return glm::clamp(p, box.Min, box.Max);
    }

    [[nodiscard]] double SquaredDistance(const AABB& box, const Vector2& p)
    {
        const Vector2 delta = ClosestPoint(box, p) - p;
        return glm::dot(delta, delta);
    }
}
