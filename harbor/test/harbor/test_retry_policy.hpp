#pragma once

#include <harbor/retry_policy.hpp>

#include <gtest/gtest.h>

#include <chrono>

namespace Harbor::Test
{
    using namespace std::chrono_literals;

    TEST(RetryPolicyTests, DelaysDoubleUpToTheCap)
    {
        RetryPolicy policy{RetryOptions{.maxAttempts = 5, .baseDelay = 2000ms, .maxDelay = 10000ms}};

        EXPECT_EQ(policy.nextDelay(), 2000ms);
        EXPECT_EQ(policy.nextDelay(), 4000ms);
        EXPECT_EQ(policy.nextDelay(), 8000ms);
        EXPECT_EQ(policy.nextDelay(), 10000ms);
        EXPECT_EQ(policy.nextDelay(), 10000ms);
        EXPECT_FALSE(policy.nextDelay());
        EXPECT_EQ(policy.attempts(), 5);
    }

    TEST(RetryPolicyTests, ResetRestoresTheBudget)
    {
        RetryPolicy policy{RetryOptions{.maxAttempts = 1, .baseDelay = 10ms, .maxDelay = 40ms}};
        ASSERT_TRUE(policy.nextDelay());
        ASSERT_FALSE(policy.nextDelay());

        policy.reset();
        EXPECT_EQ(policy.nextDelay(), 10ms);
    }

    TEST(RetryPolicyTests, CancelledPolicyGrantsNothingEvenAfterReset)
    {
        RetryPolicy policy{RetryOptions{.maxAttempts = 3, .baseDelay = 10ms, .maxDelay = 40ms}};
        policy.cancel();
        EXPECT_TRUE(policy.cancelled());
        EXPECT_FALSE(policy.nextDelay());

        policy.reset();
        EXPECT_FALSE(policy.nextDelay());
    }
}
