#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>
#include <entt/entity/registry.hpp>

#include <variant>
#include <vector>

import ECS;
import Runtime.ChangeQueue;

using namespace Runtime;
namespace Symbolic = ECS::Components::Symbolic;

TEST(ChangeQueue, DrainPreservesOrderAndEmpties)
{
    entt::registry reg;
    const auto a = reg.create();
    const auto b = reg.create();
    const Symbolic::Definition def = Symbolic::SymbolicPoint{Symbolic::Free{{1, 2}}};

    ChangeQueue queue;
    EXPECT_TRUE(queue.Empty());

    queue.Push(Events::Inserted{a, def});
    queue.Push(Events::Modified{a});
    queue.Push(Events::Removed{b, def});
    EXPECT_EQ(queue.Size(), 3u);

    const auto events = queue.Drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(queue.Empty());

    ASSERT_TRUE(std::holds_alternative<Events::Inserted>(events[0]));
    EXPECT_EQ(std::get<Events::Inserted>(events[0]).Entity, a);
    ASSERT_TRUE(std::holds_alternative<Events::Modified>(events[1]));
    EXPECT_EQ(std::get<Events::Modified>(events[1]).Entity, a);
    ASSERT_TRUE(std::holds_alternative<Events::Removed>(events[2]));
    EXPECT_EQ(std::get<Events::Removed>(events[2]).Entity, b);

    EXPECT_TRUE(queue.Drain().empty());
}
