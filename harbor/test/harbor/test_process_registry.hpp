#pragma once

#include "common_fixture.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <future>

namespace Harbor::Test
{
    class ProcessRegistryTests : public CommonFixture
    {};

    TEST_F(ProcessRegistryTests, ConcurrentAcquiresShareOneSpawn)
    {
        auto first = registry_->acquire(keyFor("s1"));
        auto second = registry_->acquire(keyFor("s1"));

        const auto firstResult = waitFor(first);
        const auto secondResult = waitFor(second);
        ASSERT_TRUE(firstResult) << firstResult.error().toString();
        ASSERT_TRUE(secondResult);
        EXPECT_EQ(firstResult->id, secondResult->id);
        EXPECT_EQ(firstResult->port, secondResult->port);
        EXPECT_EQ(launcher_->spawns().size(), 1);
        EXPECT_EQ(registry_->spawnCount(), 1);
        EXPECT_EQ(registry_->activeCount(), 1);
    }

    TEST_F(ProcessRegistryTests, DifferentKeysGetDifferentProcesses)
    {
        const auto first = waitFor(registry_->acquire(keyFor("s1")));
        const auto second = waitFor(registry_->acquire(keyFor("s2")));

        ASSERT_TRUE(first);
        ASSERT_TRUE(second);
        EXPECT_NE(first->pid, second->pid);
        EXPECT_NE(first->port, second->port);
    }

    TEST_F(ProcessRegistryTests, RuntimeIsStartedWithPortWorkspaceAndMarker)
    {
        const auto result = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_TRUE(result);

        const auto spawns = launcher_->spawns();
        ASSERT_EQ(spawns.size(), 1);
        EXPECT_EQ(spawns[0].command, "agent-runtime");
        EXPECT_EQ(
            spawns[0].arguments,
            (std::vector<std::string>{
                "serve", "--port", std::to_string(result->port), "--agent-dir", "/work/space", "--harbor-sidecar"}));
        EXPECT_EQ(spawns[0].label, "s1");
    }

    TEST_F(ProcessRegistryTests, OnReadyIsCalledWithTheResult)
    {
        std::promise<ProcessResult> promise;
        registry_->acquire(keyFor("s1"), [&promise](ProcessResult const& result) {
            promise.set_value(result);
        });

        auto future = promise.get_future();
        ASSERT_EQ(future.wait_for(3s), std::future_status::ready);
        EXPECT_TRUE(future.get());
    }

    TEST_F(ProcessRegistryTests, FailedSpawnIsPurgedSoTheNextAcquireRetries)
    {
        launcher_->failNextSpawns(1);

        const auto failed = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_FALSE(failed);
        EXPECT_EQ(failed.error().type, HostErrorType::SpawnFailed);
        EXPECT_FALSE(registry_->contains(keyFor("s1")));
        EXPECT_EQ(ports_->reservedCount(), 0);

        const auto retried = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_TRUE(retried);
        EXPECT_EQ(registry_->spawnCount(), 2);
    }

    TEST_F(ProcessRegistryTests, EarlyExitFailsWithExitCode)
    {
        launcher_->exitImmediately(true);

        const auto result = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().type, HostErrorType::SpawnFailed);
        EXPECT_EQ(result.error().exitCode, 1);
        EXPECT_EQ(ports_->reservedCount(), 0);
        EXPECT_EQ(registry_->activeCount(), 0);
    }

    TEST_F(ProcessRegistryTests, RuntimeThatNeverBecomesReadyIsStopped)
    {
        ON_CALL(*probe_, isReady(::testing::_, ::testing::_)).WillByDefault(::testing::Return(false));

        const auto result = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().type, HostErrorType::SpawnFailed);
        EXPECT_TRUE(eventually([this]() {
            return launcher_->aliveCount() == 0 && registry_->retiringCount() == 0;
        }));
        EXPECT_EQ(ports_->reservedCount(), 0);
    }

    TEST_F(ProcessRegistryTests, ReleasingTheLastClaimTerminatesTheRuntime)
    {
        auto claim = ledger_->claim(Ids::makeSessionId("s1"), keyFor("s1"), tab("t1"));
        ASSERT_TRUE(claim);
        const auto result = waitFor(claim->process);
        ASSERT_TRUE(result);

        EXPECT_TRUE(ledger_->release(*claim));
        EXPECT_TRUE(eventually([this]() {
            return launcher_->aliveCount() == 0 && registry_->retiringCount() == 0;
        }));
        EXPECT_EQ(ports_->reservedCount(), 0);
        EXPECT_EQ(launcher_->signalsSentTo(result->pid), std::vector<int>{SIGTERM});
    }

    TEST_F(ProcessRegistryTests, RuntimeIgnoringTermIsKilled)
    {
        launcher_->ignoreTerm(true);
        auto claim = ledger_->claim(Ids::makeSessionId("s1"), keyFor("s1"), tab("t1"));
        ASSERT_TRUE(claim);
        const auto result = waitFor(claim->process);
        ASSERT_TRUE(result);

        ledger_->release(*claim);
        EXPECT_TRUE(eventually([this]() {
            return launcher_->aliveCount() == 0 && registry_->retiringCount() == 0;
        }));
        const auto signals = launcher_->signalsSentTo(result->pid);
        ASSERT_EQ(signals.size(), 2);
        EXPECT_EQ(signals[0], SIGTERM);
        EXPECT_EQ(signals[1], SIGKILL);
    }

    TEST_F(ProcessRegistryTests, RuntimeReleasedWhileStartingIsStoppedOnceReady)
    {
        std::atomic_int probes{0};
        ON_CALL(*probe_, isReady(::testing::_, ::testing::_)).WillByDefault([&probes](unsigned short, std::chrono::milliseconds) {
            return ++probes > 3;
        });

        auto claim = ledger_->claim(Ids::makeSessionId("s1"), keyFor("s1"), tab("t1"));
        ASSERT_TRUE(claim);
        ledger_->release(*claim);

        waitFor(claim->process);
        EXPECT_TRUE(eventually([this]() {
            return launcher_->aliveCount() == 0 && registry_->retiringCount() == 0;
        }));
        EXPECT_EQ(registry_->activeCount(), 0);
    }

    TEST_F(ProcessRegistryTests, WaitingForReadinessLeavesThePoolFree)
    {
        boost::asio::thread_pool single{1};
        auto options = registryOptions();
        options.healthCheckAttempts = 10;
        options.healthCheckDelay = 200ms;
        auto registry = std::make_shared<ProcessRegistry>(single.get_executor(), launcher_, probe_, ports_, options);

        std::atomic_int probes{0};
        ON_CALL(*probe_, isReady(::testing::_, ::testing::_)).WillByDefault([&probes](unsigned short, std::chrono::milliseconds) {
            return ++probes > 3;
        });

        auto process = registry->acquire(keyFor("s1"));
        ASSERT_TRUE(eventually([&probes]() {
            return probes.load() >= 1;
        }));

        std::promise<void> ran;
        const auto posted = std::chrono::steady_clock::now();
        boost::asio::post(single, [&ran]() {
            ran.set_value();
        });
        ASSERT_EQ(ran.get_future().wait_for(3s), std::future_status::ready);
        EXPECT_LT(std::chrono::steady_clock::now() - posted, 150ms);

        EXPECT_TRUE(waitFor(process));
        registry->shutdown();
        EXPECT_TRUE(registry->awaitRetired(2s));
        single.join();
    }

    TEST_F(ProcessRegistryTests, DeadRuntimeIsReplacedOnNextAcquire)
    {
        const auto first = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_TRUE(first);

        launcher_->crash(first->pid);
        registry_->checkHealth();
        const auto snapshot = registry_->lookup(keyFor("s1"));
        ASSERT_TRUE(snapshot);
        EXPECT_EQ(snapshot->state, ProcessState::Unhealthy);

        const auto second = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_TRUE(second);
        EXPECT_NE(first->pid, second->pid);
        EXPECT_EQ(registry_->spawnCount(), 2);
    }

    TEST_F(ProcessRegistryTests, RekeyMovesTheRuntime)
    {
        const auto result = waitFor(registry_->acquire(keyFor("pending-t1")));
        ASSERT_TRUE(result);

        EXPECT_TRUE(registry_->rekey(keyFor("pending-t1"), keyFor("s1")));
        EXPECT_FALSE(registry_->contains(keyFor("pending-t1")));
        const auto snapshot = registry_->lookup(keyFor("s1"));
        ASSERT_TRUE(snapshot);
        EXPECT_EQ(snapshot->pid, result->pid);
        EXPECT_EQ(snapshot->id, result->id);
    }

    TEST_F(ProcessRegistryTests, RekeyOntoTakenKeyFails)
    {
        ASSERT_TRUE(waitFor(registry_->acquire(keyFor("a"))));
        ASSERT_TRUE(waitFor(registry_->acquire(keyFor("b"))));

        EXPECT_FALSE(registry_->rekey(keyFor("a"), keyFor("b")));
        EXPECT_FALSE(registry_->rekey(keyFor("unknown"), keyFor("c")));
        EXPECT_TRUE(registry_->contains(keyFor("a")));
    }

    TEST_F(ProcessRegistryTests, AcquireAfterShutdownFails)
    {
        registry_->shutdown();

        const auto result = waitFor(registry_->acquire(keyFor("s1")));
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().type, HostErrorType::ShuttingDown);
        EXPECT_TRUE(launcher_->spawns().empty());
    }

    TEST_F(ProcessRegistryTests, ShutdownTerminatesAllRuntimes)
    {
        ASSERT_TRUE(waitFor(registry_->acquire(keyFor("a"))));
        ASSERT_TRUE(waitFor(registry_->acquire(keyFor("b"))));

        registry_->shutdown();
        EXPECT_TRUE(registry_->awaitRetired(2s));
        EXPECT_EQ(launcher_->aliveCount(), 0);
        EXPECT_EQ(registry_->activeCount(), 0);
    }
}
