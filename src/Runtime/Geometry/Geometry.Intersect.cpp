module;

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>
#include <glm/glm.hpp>

module Geometry:Intersect.Impl;

import :Intersect;
import :Vector;
import :AABB;
import :Primitives;

namespace Geometry
{
    namespace
    {
        // One Liang-Barsky boundary test. p is the directional term, q the
        // signed distance of the origin from the boundary.
        [[nodiscard]] bool ClipBoundary(double p, double q, double& t0, double& t1)
        {
            if (p == 0.0) return q >= 0.0;

            const double r = q / p;
            if (p < 0.0)
            {
                if (r > t1) return false;
                if (r > t0) t0 = r;
            }
            else
            {
                if (r < t0) return false;
                if (r < t1) t1 = r;
            }
            return true;
        }
    }

    std::optional<Vector2> IntersectLines(const Line& a, const Line& b, double epsilon)
    {
        const double denom = Cross(a.Direction, b.Direction);
        if (IsNearlyZero(denom, epsilon)) return std::nullopt;

        const double s = Cross(b.Origin - a.Origin, b.Direction) / denom;
        return a.PointAt(s);
    }

    CircleIntersection IntersectCircleLine(const Circle& circle, const Line& line, double epsilon)
    {
        CircleIntersection result;

        const auto dir = TryNormalize(line.Direction, epsilon);
        if (!dir) return result;

        const double tClosest = glm::dot(circle.Center - line.Origin, *dir);
        const Vector2 closest = line.Origin + tClosest * *dir;
        const double dist = glm::length(closest - circle.Center);

        if (dist > circle.Radius + epsilon) return result;

        if (std::abs(dist - circle.Radius) <= epsilon)
        {
            result.Count = 1;
            result.Points[0] = closest;
            return result;
        }

        const double h = std::sqrt(std::max(0.0, circle.Radius * circle.Radius - dist * dist));
        result.Count = 2;
        result.Points[0] = closest - h * *dir;
        result.Points[1] = closest + h * *dir;
        return result;
    }

    CircleIntersection IntersectCircles(const Circle& a, const Circle& b, double epsilon)
    {
        CircleIntersection result;

        const Vector2 delta = b.Center - a.Center;
        const double d = glm::length(delta);

        // Concentric circles either coincide or never meet; neither gives a point.
        if (d <= epsilon) return result;
        if (d > a.Radius + b.Radius + epsilon) return result;
        if (d < std::abs(a.Radius - b.Radius) - epsilon) return result;

        const Vector2 axis = delta / d;
        const double along = (a.Radius * a.Radius - b.Radius * b.Radius + d * d) / (2.0 * d);
        const Vector2 mid = a.Center + along * axis;

        const bool externallyTangent = std::abs(d - (a.Radius + b.Radius)) <= epsilon;
        const bool internallyTangent = std::abs(d - std::abs(a.Radius - b.Radius)) <= epsilon;
        if (externallyTangent || internallyTangent)
        {
            result.Count = 1;
            result.Points[0] = mid;
            return result;
        }

        const double h = std::sqrt(std::max(0.0, a.Radius * a.Radius - along * along));
        const Vector2 normal = Perpendicular(axis);
        result.Count = 2;
        result.Points[0] = mid + h * normal;
        result.Points[1] = mid - h * normal;
        return result;
    }

    std::optional<std::pair<Vector2, Vector2>> ClipLine(const Line& line, const AABB& box)
    {
        if (!box.IsValid() || IsNearlyZero(line.Direction)) return std::nullopt;

        auto [t0, t1] = line.ParameterRange();
        const Vector2 d = line.Direction;
        const Vector2 o = line.Origin;

        if (!ClipBoundary(-d.x, o.x - box.Min.x, t0, t1)) return std::nullopt;
        if (!ClipBoundary(d.x, box.Max.x - o.x, t0, t1)) return std::nullopt;
        if (!ClipBoundary(-d.y, o.y - box.Min.y, t0, t1)) return std::nullopt;
        if (!ClipBoundary(d.y, box.Max.y - o.y, t0, t1)) return std::nullopt;

        if (t0 > t1 || !std::isfinite(t0) || !std::isfinite(t1)) return std::nullopt;

        return std::make_pair(line.PointAt(t0), line.PointAt(t1));
    }

    double ClosestParameter(const Line& line, const Vector2& p)
    {
        const double len2 = glm::dot(line.Direction, line.Direction);
        if (len2 <= 0.0) return 0.0;
        return glm::dot(p - line.Origin, line.Direction) / len2;
    }

    Vector2 ClosestPoint(const Line& line, const Vector2& p)
    {
        const auto [lo, hi] = line.ParameterRange();
        return line.PointAt(std::clamp(ClosestParameter(line, p), lo, hi));
    }

    std::optional<Vector2> ClosestPoint(const Circle& circle, const Vector2& p, double epsilon)
    {
        const auto dir = TryNormalize(p - circle.Center, epsilon);
        if (!dir) return std::nullopt;
        return circle.Center + circle.Radius * *dir;
    }

    double Distance(const Line& line, const Vector2& p)
    {
        return glm::length(ClosestPoint(line, p) - p);
    }

    double Distance(const Circle& circle, const Vector2& p)
    {
        return std::abs(glm::length(p - circle.Center) - circle.Radius);
    }
}
