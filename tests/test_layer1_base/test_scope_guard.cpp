// tests/test_layer1_base/test_scope_guard.cpp
/**
 * @file test_scope_guard.cpp
 * @brief Unit tests for ScopeGuard / make_scope_guard.
 */
#include <stdexcept>
#include <utility>

#include "ljdaq_base.hpp"
#include "gtest/gtest.h"

using ljdaq::utils::make_scope_guard;

TEST(ScopeGuardTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        EXPECT_TRUE(guard.active());
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, DismissCancelsCleanup)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        guard.dismiss();
        EXPECT_FALSE(guard.active());
    }
    EXPECT_EQ(calls, 0);
}

/// The cleanup runs when the scope is left by an exception.
TEST(ScopeGuardTest, RunsDuringUnwinding)
{
    int calls = 0;
    EXPECT_THROW(
        {
            auto guard = make_scope_guard([&] { ++calls; });
            throw std::runtime_error("boom");
        },
        std::runtime_error);
    EXPECT_EQ(calls, 1);
}

/// Moving transfers ownership of the cleanup; it still runs exactly once.
TEST(ScopeGuardTest, MoveTransfersOwnership)
{
    int calls = 0;
    {
        auto outer = make_scope_guard([&] { ++calls; });
        {
            auto inner = std::move(outer);
            EXPECT_FALSE(outer.active());
            EXPECT_TRUE(inner.active());
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}
