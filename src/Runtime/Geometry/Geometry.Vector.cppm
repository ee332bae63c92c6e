module;

#include <cmath>
#include <optional>
#include <glm/glm.hpp>

export module Geometry:Vector;

export namespace Geometry
{
    // All construction geometry is double precision: inputs come from continuous
    // dragging and errors accumulate along long dependency chains.
    using Vector2 = glm::dvec2;

    // Default absolute tolerance for comparisons against zero.
    constexpr double kEpsilon = 1.0e-9;

    [[nodiscard]] double Cross(const Vector2& a, const Vector2& b)
    {
        return a.x * b.y - a.y * b.x;
    }

    // Rotates counter-clockwise by 90 degrees (virtual space, y up).
    [[nodiscard]] Vector2 Perpendicular(const Vector2& v)
    {
        return Vector2(-v.y, v.x);
    }

    [[nodiscard]] bool IsNearlyZero(double value, double epsilon = kEpsilon)
    {
        return std::abs(value) <= epsilon;
    }

    [[nodiscard]] bool IsNearlyZero(const Vector2& v, double epsilon = kEpsilon)
    {
        return glm::dot(v, v) <= epsilon * epsilon;
    }

    [[nodiscard]] bool IsFinite(const Vector2& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y);
    }

    [[nodiscard]] std::optional<Vector2> TryNormalize(const Vector2& v, double epsilon = kEpsilon)
    {
        const double len = glm::length(v);
        if (!(len > epsilon)) return std::nullopt;
        return v / len;
    }
}
