// tests/test_scope_guard.cpp
#include "test_preamble.h"

#include "simpaths/scope_guard.hpp"

using simpaths::basics::make_scope_guard;

TEST(ScopeGuardTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        EXPECT_TRUE(static_cast<bool>(guard));
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, DismissCancels)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        guard.dismiss();
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    EXPECT_EQ(calls, 0);
}

TEST(ScopeGuardTest, RunsDuringUnwinding)
{
    int calls = 0;
    try
    {
        auto guard = make_scope_guard([&] { ++calls; });
        throw std::runtime_error("boom");
    }
    catch (const std::runtime_error &)
    {
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, MoveTransfersResponsibility)
{
    int calls = 0;
    {
        auto outer = make_scope_guard([&] { ++calls; });
        {
            auto inner = std::move(outer);
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, ThrowingCleanupIsContained)
{
    bool ran = false;
    EXPECT_NO_THROW({
        auto guard = make_scope_guard(
            [&]
            {
                ran = true;
                throw std::runtime_error("cleanup failed");
            });
    });
    EXPECT_TRUE(ran);
}
