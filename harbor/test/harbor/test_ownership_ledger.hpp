#pragma once

#include "common_fixture.hpp"

#include <harbor/session_identity_migrator.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <latch>
#include <random>
#include <thread>
#include <vector>

namespace Harbor::Test
{
    class OwnershipLedgerTests : public CommonFixture
    {
      protected:
        void recordReleases()
        {
            ledger_->setReleaseBarrier([this](Claim const& claim) {
                std::scoped_lock lock{barrierGuard_};
                barrierCalls_.push_back(claim.owner);
                processAliveAtBarrier_.push_back(registry_->contains(claim.key));
            });
        }

        std::vector<Owner> barrierCalls()
        {
            std::scoped_lock lock{barrierGuard_};
            return barrierCalls_;
        }

      protected:
        std::mutex barrierGuard_{};
        std::vector<Owner> barrierCalls_{};
        std::vector<bool> processAliveAtBarrier_{};
        const Ids::SessionId session_{Ids::makeSessionId("s1")};
    };

    TEST_F(OwnershipLedgerTests, FirstClaimStartsAndLastReleaseStopsTheRuntime)
    {
        auto tabClaim = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        auto taskClaim = ledger_->claim(session_, keyFor("s1"), task("c1"));
        ASSERT_TRUE(tabClaim);
        ASSERT_TRUE(taskClaim);
        ASSERT_TRUE(waitFor(taskClaim->process));

        EXPECT_EQ(ledger_->count(session_), 2);
        EXPECT_EQ(registry_->spawnCount(), 1);

        EXPECT_FALSE(ledger_->release(*tabClaim));
        EXPECT_TRUE(registry_->contains(keyFor("s1")));
        EXPECT_EQ(ledger_->count(session_), 1);

        EXPECT_TRUE(ledger_->release(*taskClaim));
        EXPECT_FALSE(registry_->contains(keyFor("s1")));
        EXPECT_FALSE(ledger_->hasState(session_));
        EXPECT_TRUE(eventually([this]() {
            return launcher_->aliveCount() == 0;
        }));
    }

    TEST_F(OwnershipLedgerTests, ClaimingTwiceAsSameOwnerReturnsTheExistingClaim)
    {
        auto first = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        auto second = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        ASSERT_TRUE(first);
        ASSERT_TRUE(second);

        EXPECT_EQ(ledger_->count(session_), 1);
        EXPECT_EQ(first->owner, second->owner);
    }

    TEST_F(OwnershipLedgerTests, SecondTabIsRejectedWithTheHoldingTab)
    {
        ASSERT_TRUE(ledger_->claim(session_, keyFor("s1"), tab("t1")));

        auto second = ledger_->claim(session_, keyFor("s1"), tab("t2"));
        ASSERT_FALSE(second);
        EXPECT_EQ(second.error().type, HostErrorType::SingletonConflict);
        ASSERT_TRUE(second.error().conflictingOwner);
        EXPECT_EQ(*second.error().conflictingOwner, tab("t1"));
        EXPECT_EQ(ledger_->count(session_), 1);
    }

    TEST_F(OwnershipLedgerTests, TasksAndGuardiansMayShareASessionWithATab)
    {
        ASSERT_TRUE(ledger_->claim(session_, keyFor("s1"), tab("t1")));
        ASSERT_TRUE(ledger_->claim(session_, keyFor("s1"), task("c1")));
        ASSERT_TRUE(ledger_->claim(session_, keyFor("s1"), Owner{.kind = OwnerKind::BackgroundGuardian, .id = "g1"}));

        EXPECT_EQ(ledger_->count(session_), 3);
        EXPECT_EQ(ledger_->tabOwner(session_), tab("t1"));
    }

    TEST_F(OwnershipLedgerTests, SupersedeReplacesTheTabWithoutRestartingTheRuntime)
    {
        recordReleases();
        auto first = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        ASSERT_TRUE(first);
        ASSERT_TRUE(waitFor(first->process));

        auto second = ledger_->claim(session_, keyFor("s1"), tab("t2"), ClaimPolicy::Supersede);
        ASSERT_TRUE(second);

        EXPECT_EQ(ledger_->tabOwner(session_), tab("t2"));
        EXPECT_EQ(ledger_->count(session_), 1);
        EXPECT_EQ(registry_->spawnCount(), 1);
        EXPECT_EQ(barrierCalls(), std::vector<Owner>{tab("t1")});
        EXPECT_TRUE(registry_->contains(keyFor("s1")));
    }

    TEST_F(OwnershipLedgerTests, ClaimWithAnotherKeyIsRejected)
    {
        ASSERT_TRUE(ledger_->claim(session_, keyFor("s1", "/one"), tab("t1")));

        auto other = ledger_->claim(session_, keyFor("s1", "/two"), task("c1"));
        ASSERT_FALSE(other);
        EXPECT_EQ(other.error().type, HostErrorType::InvalidArgument);
    }

    TEST_F(OwnershipLedgerTests, HandoverNeverDropsTheSessionToZeroClaims)
    {
        recordReleases();
        auto tabClaim = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        ASSERT_TRUE(tabClaim);
        ASSERT_TRUE(waitFor(tabClaim->process));

        const Owner guardian{.kind = OwnerKind::BackgroundGuardian, .id = "g1"};
        auto handedOver = ledger_->handover(*tabClaim, guardian);
        ASSERT_TRUE(handedOver);

        EXPECT_EQ(handedOver->owner, guardian);
        EXPECT_EQ(ledger_->count(session_), 1);
        EXPECT_FALSE(ledger_->tabOwner(session_));
        EXPECT_TRUE(ledger_->claimsOf(tab("t1")).empty());
        EXPECT_TRUE(registry_->contains(keyFor("s1")));
        EXPECT_EQ(registry_->spawnCount(), 1);
        EXPECT_EQ(barrierCalls(), std::vector<Owner>{tab("t1")});
    }

    TEST_F(OwnershipLedgerTests, HandoverOfUnknownClaimFails)
    {
        const Claim unknown{.sessionId = session_, .owner = tab("t1"), .key = keyFor("s1")};
        auto result = ledger_->handover(unknown, task("c1"));
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().type, HostErrorType::NotFound);
    }

    TEST_F(OwnershipLedgerTests, BarrierRunsWhileTheRuntimeIsStillRegistered)
    {
        recordReleases();
        auto claim = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        ASSERT_TRUE(claim);
        ASSERT_TRUE(waitFor(claim->process));

        ASSERT_TRUE(ledger_->release(*claim));
        std::scoped_lock lock{barrierGuard_};
        ASSERT_EQ(processAliveAtBarrier_.size(), 1);
        EXPECT_TRUE(processAliveAtBarrier_.front());
    }

    TEST_F(OwnershipLedgerTests, ReleasingAnUnknownClaimDoesNothing)
    {
        auto claim = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        ASSERT_TRUE(claim);

        const Claim stranger{.sessionId = session_, .owner = tab("t9"), .key = keyFor("s1")};
        EXPECT_FALSE(ledger_->release(stranger));
        EXPECT_EQ(ledger_->count(session_), 1);

        ASSERT_TRUE(ledger_->release(*claim));
        EXPECT_FALSE(ledger_->release(*claim));
    }

    TEST_F(OwnershipLedgerTests, RekeyMovesAllClaimsToTheNewSession)
    {
        const auto placeholder = Ids::makeSessionId("pending-t1");
        ASSERT_TRUE(ledger_->claim(placeholder, keyFor("pending-t1"), tab("t1")));

        EXPECT_TRUE(ledger_->rekey(placeholder, session_, keyFor("s1")));
        EXPECT_FALSE(ledger_->hasState(placeholder));
        const auto claims = ledger_->claims(session_);
        ASSERT_EQ(claims.size(), 1);
        EXPECT_EQ(claims[0].sessionId, session_);
        EXPECT_EQ(claims[0].key, keyFor("s1"));
        EXPECT_EQ(ledger_->keyOf(session_), keyFor("s1"));
    }

    TEST_F(OwnershipLedgerTests, RekeyOntoAClaimedSessionFails)
    {
        const auto placeholder = Ids::makeSessionId("pending-t1");
        ASSERT_TRUE(ledger_->claim(placeholder, keyFor("pending-t1"), tab("t1")));
        ASSERT_TRUE(ledger_->claim(session_, keyFor("s1"), tab("t2")));

        EXPECT_FALSE(ledger_->rekey(placeholder, session_, keyFor("s1")));
        EXPECT_TRUE(ledger_->hasState(placeholder));
        EXPECT_EQ(ledger_->count(session_), 1);
    }

    TEST_F(OwnershipLedgerTests, RefreshReplacesADeadRuntime)
    {
        auto claim = ledger_->claim(session_, keyFor("s1"), tab("t1"));
        ASSERT_TRUE(claim);
        const auto first = waitFor(claim->process);
        ASSERT_TRUE(first);

        launcher_->crash(first->pid);
        registry_->checkHealth();

        const auto refreshed = ledger_->refresh(session_);
        ASSERT_TRUE(refreshed);
        const auto second = waitFor(*refreshed);
        ASSERT_TRUE(second);
        EXPECT_NE(first->pid, second->pid);
        EXPECT_EQ(ledger_->count(session_), 1);

        EXPECT_FALSE(ledger_->refresh(Ids::makeSessionId("unknown")));
    }

    TEST_F(OwnershipLedgerTests, ConcurrentClaimsAndReleasesBalanceOut)
    {
        constexpr int threadCount = 4;
        constexpr int iterations = 20;

        std::vector<std::thread> threads;
        for (int i = 0; i != threadCount; ++i)
        {
            threads.emplace_back([this, i]() {
                for (int j = 0; j != iterations; ++j)
                {
                    auto claim = ledger_->claim(session_, keyFor("s1"), task("c" + std::to_string(i)));
                    if (claim)
                        ledger_->release(*claim);
                }
            });
        }
        for (auto& thread : threads)
            thread.join();

        EXPECT_FALSE(ledger_->hasState(session_));
        EXPECT_TRUE(eventually([this]() {
            return registry_->activeCount() == 0 && registry_->retiringCount() == 0 && launcher_->aliveCount() == 0;
        }));
    }

    TEST_F(OwnershipLedgerTests, RacingTabsLeaveExactlyOneHolder)
    {
        constexpr int tabCount = 8;

        std::latch go{tabCount};
        std::atomic<int> winners{0};
        std::atomic<int> conflicts{0};
        std::vector<std::thread> threads;
        for (int i = 0; i != tabCount; ++i)
        {
            threads.emplace_back([this, i, &go, &winners, &conflicts]() {
                go.arrive_and_wait();
                auto claim = ledger_->claim(session_, keyFor("s1"), tab("t" + std::to_string(i)));
                if (claim)
                    ++winners;
                else if (claim.error().type == HostErrorType::SingletonConflict)
                    ++conflicts;
            });
        }
        for (auto& thread : threads)
            thread.join();

        EXPECT_EQ(winners, 1);
        EXPECT_EQ(conflicts, tabCount - 1);
        EXPECT_EQ(ledger_->count(session_), 1);
        ASSERT_TRUE(ledger_->tabOwner(session_));
        EXPECT_EQ(ledger_->claimsOf(*ledger_->tabOwner(session_)).size(), 1);
        EXPECT_EQ(registry_->spawnCount(), 1);
    }

    TEST_F(OwnershipLedgerTests, RandomOperationsKeepRuntimesAndClaimsInStep)
    {
        SessionIdentityMigrator migrator{registry_, ledger_, activations_, router_, sessionLocks_};
        const std::array<std::string, 6> sessions{"s0", "s1", "s2", "s3", "pending-0", "pending-1"};
        std::mt19937 random{20261019};
        std::vector<Claim> held;
        int guardianCount = 0;

        const auto pick = [&random](std::size_t size) {
            return std::uniform_int_distribution<std::size_t>{0, size - 1}(random);
        };

        const auto verify = [&](int step) {
            for (auto const& name : sessions)
            {
                const auto id = Ids::makeSessionId(name);
                const auto claims = ledger_->claims(id);
                const auto expected = std::count_if(held.begin(), held.end(), [&id](Claim const& claim) {
                    return claim.sessionId == id;
                });
                const auto tabs = std::count_if(claims.begin(), claims.end(), [](Claim const& claim) {
                    return claim.owner.kind == OwnerKind::Tab;
                });

                ASSERT_EQ(ledger_->hasState(id), registry_->contains(keyFor(name))) << name << " after step " << step;
                ASSERT_EQ(static_cast<std::ptrdiff_t>(claims.size()), expected) << name << " after step " << step;
                ASSERT_LE(tabs, 1) << name << " after step " << step;
            }
        };

        for (int step = 0; step != 300; ++step)
        {
            switch (pick(5))
            {
                case 0:
                case 1:
                {
                    const auto& name = sessions[pick(sessions.size())];
                    const auto id = Ids::makeSessionId(name);
                    const auto ownerId = std::to_string(pick(3));
                    const auto owner = pick(2) == 0 ? tab("t" + ownerId) : task("c" + ownerId);
                    const bool known = std::any_of(held.begin(), held.end(), [&](Claim const& claim) {
                        return claim.sessionId == id && claim.owner == owner;
                    });
                    auto claim = ledger_->claim(id, keyFor(name), owner);
                    if (claim && !known)
                        held.push_back(*claim);
                    break;
                }
                case 2:
                {
                    if (held.empty())
                        break;
                    const auto index = pick(held.size());
                    ledger_->release(held[index]);
                    held.erase(held.begin() + static_cast<std::ptrdiff_t>(index));
                    break;
                }
                case 3:
                {
                    if (held.empty())
                        break;
                    const auto index = pick(held.size());
                    const Owner guardian{.kind = OwnerKind::BackgroundGuardian, .id = "g" + std::to_string(guardianCount++)};
                    auto handedOver = ledger_->handover(held[index], guardian);
                    ASSERT_TRUE(handedOver) << handedOver.error().toString();
                    held[index] = *handedOver;
                    break;
                }
                default:
                {
                    const auto from = Ids::makeSessionId(sessions[4 + pick(2)]);
                    const auto& target = sessions[pick(4)];
                    const auto to = Ids::makeSessionId(target);
                    if (!migrator.rekey(from, to))
                        break;
                    for (auto& claim : held)
                    {
                        if (claim.sessionId == from)
                        {
                            claim.sessionId = to;
                            claim.key = keyFor(target);
                        }
                    }
                    break;
                }
            }
            verify(step);
            if (::testing::Test::HasFatalFailure())
                return;
        }

        for (auto const& claim : held)
            ledger_->release(claim);
        EXPECT_TRUE(eventually([this]() {
            return registry_->activeCount() == 0 && launcher_->aliveCount() == 0;
        }));
    }
}
