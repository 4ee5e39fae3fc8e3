#pragma once

#include <utility/keyed_mutex.hpp>
#include <utility/awaiter.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace Utility::Test
{
    class KeyedMutexTests : public ::testing::Test
    {
      protected:
        KeyedMutex<std::string> mutex_{};
    };

    TEST_F(KeyedMutexTests, EntryIsRemovedAfterUnlock)
    {
        {
            auto lock = mutex_.lock("a");
            EXPECT_TRUE(lock.ownsLock());
            EXPECT_EQ(mutex_.activeKeys(), 1);
        }
        EXPECT_EQ(mutex_.activeKeys(), 0);
    }

    TEST_F(KeyedMutexTests, SameThreadMayRelock)
    {
        auto outer = mutex_.lock("a");
        auto inner = mutex_.lock("a");
        EXPECT_TRUE(inner.ownsLock());
        inner.unlock();
        EXPECT_EQ(mutex_.activeKeys(), 1);
    }

    TEST_F(KeyedMutexTests, DifferentKeysDoNotBlockEachOther)
    {
        auto lockA = mutex_.lock("a");

        Awaiter awaiter{};
        std::thread other{[this, &awaiter]() {
            auto lockB = mutex_.lock("b");
            awaiter.arrive();
        }};

        EXPECT_TRUE(awaiter.waitFor(1s));
        other.join();
    }

    TEST_F(KeyedMutexTests, SameKeyIsSerialized)
    {
        std::atomic_int inside{0};
        std::atomic_int maxInside{0};
        std::vector<std::thread> threads{};
        for (int i = 0; i != 8; ++i)
        {
            threads.emplace_back([&]() {
                for (int j = 0; j != 100; ++j)
                {
                    auto lock = mutex_.lock("shared");
                    const auto now = ++inside;
                    int expected = maxInside.load();
                    while (now > expected && !maxInside.compare_exchange_weak(expected, now))
                    {
                    }
                    --inside;
                }
            });
        }
        for (auto& thread : threads)
            thread.join();

        EXPECT_EQ(maxInside.load(), 1);
        EXPECT_EQ(mutex_.activeKeys(), 0);
    }

    TEST_F(KeyedMutexTests, PairLockingInOppositeOrderDoesNotDeadlock)
    {
        Awaiter awaiter{2};
        std::thread first{[&]() {
            for (int i = 0; i != 200; ++i)
                auto locks = mutex_.lock("x", "y");
            awaiter.arrive();
        }};
        std::thread second{[&]() {
            for (int i = 0; i != 200; ++i)
                auto locks = mutex_.lock("y", "x");
            awaiter.arrive();
        }};

        EXPECT_TRUE(awaiter.waitFor(5s));
        first.join();
        second.join();
    }

    TEST_F(KeyedMutexTests, PairLockOfSameKeyHoldsOneLock)
    {
        auto [first, second] = mutex_.lock("same", "same");
        EXPECT_TRUE(first.ownsLock());
        EXPECT_FALSE(second.ownsLock());
    }
}
