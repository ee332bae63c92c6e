module;

#include <variant>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

module ECS:Components.Symbolic.Impl;

import :Components.Symbolic;

namespace ECS::Components::Symbolic
{
    namespace
    {
        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };

        [[nodiscard]] ReferenceList Pair(entt::entity a, entt::entity b)
        {
            ReferenceList list;
            list.Push(a);
            list.Push(b);
            return list;
        }
    }

    ReferenceList References(const SymbolicPoint& point)
    {
        return std::visit(Overloaded{
            [](const Fixed&) { return ReferenceList{}; },
            [](const Free&) { return ReferenceList{}; },
            [](const MidPoint& p) { return Pair(p.A, p.B); },
            [](const OnLine& p)
            {
                ReferenceList list;
                list.Push(p.Line);
                return list;
            },
            [](const LineLineIntersect& p) { return Pair(p.First, p.Second); },
            [](const OnCircle& p)
            {
                ReferenceList list;
                list.Push(p.Circle);
                return list;
            },
            [](const CircleLineIntersect& p) { return Pair(p.Circle, p.Line); },
            [](const CircleCircleIntersect& p) { return Pair(p.First, p.Second); },
        }, point);
    }

    ReferenceList References(const SymbolicLine& line)
    {
        return std::visit(Overloaded{
            [](const Straight& l) { return Pair(l.A, l.B); },
            [](const Ray& l) { return Pair(l.A, l.B); },
            [](const Segment& l) { return Pair(l.A, l.B); },
            [](const Parallel& l) { return Pair(l.Line, l.Point); },
            [](const Perpendicular& l) { return Pair(l.Line, l.Point); },
        }, line);
    }

    ReferenceList References(const SymbolicCircle& circle)
    {
        return std::visit([](const CenterRadius& c) { return Pair(c.Center, c.RadiusPoint); }, circle);
    }

    ReferenceList References(const Definition& definition)
    {
        return std::visit([](const auto& d) { return References(d); }, definition);
    }
}
