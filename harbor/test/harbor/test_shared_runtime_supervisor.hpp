#pragma once

#include "common_fixture.hpp"

#include <harbor/shared_runtime_supervisor.hpp>

#include <future>

namespace Harbor::Test
{
    class SharedRuntimeSupervisorTests : public CommonFixture
    {
      protected:
        using StartResult = std::expected<unsigned short, HostError>;

        std::shared_ptr<SharedRuntimeSupervisor> makeSupervisor(RetryOptions retry)
        {
            return std::make_shared<SharedRuntimeSupervisor>(
                pool_.get_executor(),
                ledger_,
                sessionLocks_,
                SharedRuntimeSupervisorOptions{.workspacePath = "/shared/space", .retry = retry});
        }

        static StartResult start(SharedRuntimeSupervisor& supervisor, std::chrono::milliseconds timeout = 3s)
        {
            auto settled = std::make_shared<std::promise<StartResult>>();
            auto future = settled->get_future();
            supervisor.start([settled](StartResult const& result) {
                settled->set_value(result);
            });
            if (future.wait_for(timeout) != std::future_status::ready)
                return std::unexpected(makeError(HostErrorType::SpawnFailed, "test timed out"));
            return future.get();
        }

        static RetryOptions quickRetries(int maxAttempts)
        {
            return RetryOptions{.maxAttempts = maxAttempts, .baseDelay = 10ms, .maxDelay = 40ms};
        }
    };

    TEST_F(SharedRuntimeSupervisorTests, StartedRuntimeHoldsItsOwnClaim)
    {
        auto supervisor = makeSupervisor(quickRetries(3));
        const auto port = start(*supervisor);
        ASSERT_TRUE(port) << port.error().toString();

        EXPECT_EQ(supervisor->state(), SharedRuntimeState::Running);
        EXPECT_EQ(supervisor->port(), *port);
        EXPECT_TRUE(ledger_->find(supervisor->sessionId(), supervisor->owner()));
        EXPECT_TRUE(registry_->contains(makeProcessKey("/shared/space", supervisor->sessionId())));
        EXPECT_EQ(launcher_->spawns().size(), 1);

        supervisor->shutdown();
    }

    TEST_F(SharedRuntimeSupervisorTests, FailedStartsAreRetried)
    {
        launcher_->failNextSpawns(2);
        auto supervisor = makeSupervisor(quickRetries(3));

        const auto port = start(*supervisor);
        ASSERT_TRUE(port) << port.error().toString();
        EXPECT_EQ(supervisor->state(), SharedRuntimeState::Running);
        EXPECT_EQ(registry_->spawnCount(), 3);
        EXPECT_EQ(supervisor->failedAttempts(), 0);

        supervisor->shutdown();
    }

    TEST_F(SharedRuntimeSupervisorTests, GivesUpOnceRetriesAreUsedUp)
    {
        launcher_->failNextSpawns(10);
        auto supervisor = makeSupervisor(quickRetries(2));

        const auto result = start(*supervisor);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().type, HostErrorType::SpawnFailed);
        EXPECT_EQ(supervisor->state(), SharedRuntimeState::Failed);
        EXPECT_EQ(supervisor->failedAttempts(), 3);
        EXPECT_EQ(registry_->spawnCount(), 3);
        EXPECT_FALSE(ledger_->hasState(supervisor->sessionId()));
    }

    TEST_F(SharedRuntimeSupervisorTests, ShutdownCancelsAPendingRetry)
    {
        launcher_->failNextSpawns(10);
        auto supervisor = makeSupervisor(RetryOptions{.maxAttempts = 5, .baseDelay = 10s, .maxDelay = 10s});

        auto settled = std::make_shared<std::promise<StartResult>>();
        auto future = settled->get_future();
        supervisor->start([settled](StartResult const& result) {
            settled->set_value(result);
        });
        ASSERT_TRUE(eventually([&supervisor]() {
            return supervisor->failedAttempts() == 1;
        }));

        supervisor->shutdown();

        ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
        const auto result = future.get();
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().type, HostErrorType::ShuttingDown);
        EXPECT_EQ(supervisor->state(), SharedRuntimeState::Stopped);
        EXPECT_EQ(registry_->spawnCount(), 1);
    }

    TEST_F(SharedRuntimeSupervisorTests, ShutdownStopsTheRuntime)
    {
        auto supervisor = makeSupervisor(quickRetries(3));
        ASSERT_TRUE(start(*supervisor));

        supervisor->shutdown();

        EXPECT_FALSE(ledger_->hasState(supervisor->sessionId()));
        EXPECT_FALSE(supervisor->port());
        EXPECT_TRUE(eventually([this]() {
            return launcher_->aliveCount() == 0;
        }));

        const auto again = start(*supervisor);
        ASSERT_FALSE(again);
        EXPECT_EQ(again.error().type, HostErrorType::ShuttingDown);
    }

    TEST_F(SharedRuntimeSupervisorTests, StartingTwiceKeepsOneRuntime)
    {
        auto supervisor = makeSupervisor(quickRetries(3));
        ASSERT_TRUE(start(*supervisor));

        supervisor->start();

        EXPECT_EQ(supervisor->state(), SharedRuntimeState::Running);
        EXPECT_EQ(launcher_->spawns().size(), 1);
        EXPECT_EQ(ledger_->count(supervisor->sessionId()), 1);

        supervisor->shutdown();
    }
}
