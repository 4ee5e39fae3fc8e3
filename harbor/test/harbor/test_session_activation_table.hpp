#pragma once

#include <harbor/session_activation_table.hpp>

#include <gtest/gtest.h>

namespace Harbor::Test
{
    class SessionActivationTableTests : public ::testing::Test
    {
      protected:
        LaunchDecision decide(
            std::string const& target,
            std::string const& callerTab,
            std::optional<std::string> const& current = std::nullopt,
            bool reachable = true)
        {
            return table_.decide(
                LaunchRequest{
                    .targetSession = Ids::makeSessionId(target),
                    .callerTab = Ids::makeTabId(callerTab),
                    .callerCurrentSession =
                        current ? std::optional<Ids::SessionId>{Ids::makeSessionId(*current)} : std::nullopt,
                },
                [reachable](SessionActivation const&) {
                    return reachable;
                });
        }

      protected:
        SessionActivationTable table_{};
        const Ids::SessionId s1_{Ids::makeSessionId("s1")};
        const Ids::SessionId s2_{Ids::makeSessionId("s2")};
    };

    TEST_F(SessionActivationTableTests, RowLivesAsLongAsAnOwnerIsSet)
    {
        table_.activate(s1_, "/work", 41000);
        table_.setHome(s1_, Ids::makeTabId("t1"));
        table_.setTask(s1_, Ids::makeTaskId("c1"));

        EXPECT_TRUE(table_.clearHome(s1_, Ids::makeTabId("t1")));
        ASSERT_TRUE(table_.contains(s1_));
        EXPECT_FALSE(table_.lookup(s1_)->homeOwner);

        EXPECT_TRUE(table_.clearTask(s1_, Ids::makeTaskId("c1")));
        EXPECT_FALSE(table_.contains(s1_));
    }

    TEST_F(SessionActivationTableTests, ClearingForAnotherOwnerIsIgnored)
    {
        table_.setHome(s1_, Ids::makeTabId("t1"));

        EXPECT_FALSE(table_.clearHome(s1_, Ids::makeTabId("t2")));
        EXPECT_FALSE(table_.clearTask(s1_, Ids::makeTaskId("c1")));
        EXPECT_EQ(table_.lookup(s1_)->homeOwner, Ids::makeTabId("t1"));
    }

    TEST_F(SessionActivationTableTests, ActivateKeepsOwnersAndUpdatesPort)
    {
        table_.setHome(s1_, Ids::makeTabId("t1"));
        table_.activate(s1_, "/work", 41000);
        table_.activate(s1_, "/work", 41001);

        const auto row = table_.lookup(s1_);
        ASSERT_TRUE(row);
        EXPECT_EQ(row->port, 41001);
        EXPECT_EQ(row->workspacePath, "/work");
        EXPECT_EQ(row->homeOwner, Ids::makeTabId("t1"));
    }

    TEST_F(SessionActivationTableTests, ReverseLookups)
    {
        table_.setHome(s1_, Ids::makeTabId("t1"));
        table_.setTask(s2_, Ids::makeTaskId("c1"));

        EXPECT_EQ(table_.sessionForTab(Ids::makeTabId("t1")), s1_);
        EXPECT_EQ(table_.sessionForTask(Ids::makeTaskId("c1")), s2_);
        EXPECT_FALSE(table_.sessionForTab(Ids::makeTabId("t2")));
    }

    TEST_F(SessionActivationTableTests, RekeyMovesTheRow)
    {
        const auto placeholder = Ids::makeSessionId("pending-t1");
        table_.activate(placeholder, "/work", 41000);
        table_.setHome(placeholder, Ids::makeTabId("t1"));

        EXPECT_TRUE(table_.rekey(placeholder, s1_));
        EXPECT_FALSE(table_.contains(placeholder));
        const auto row = table_.lookup(s1_);
        ASSERT_TRUE(row);
        EXPECT_EQ(row->sessionId, s1_);
        EXPECT_EQ(row->port, 41000);
    }

    TEST_F(SessionActivationTableTests, RekeyOntoExistingRowFails)
    {
        table_.setHome(s1_, Ids::makeTabId("t1"));
        table_.setHome(s2_, Ids::makeTabId("t2"));

        EXPECT_FALSE(table_.rekey(s1_, s2_));
        EXPECT_EQ(table_.lookup(s2_)->homeOwner, Ids::makeTabId("t2"));
        EXPECT_FALSE(table_.rekey(Ids::makeSessionId("unknown"), Ids::makeSessionId("other")));
    }

    TEST_F(SessionActivationTableTests, UnknownSessionIsANormalLaunch)
    {
        const auto decision = decide("s1", "t1");
        EXPECT_EQ(decision.outcome, LaunchOutcome::NormalLaunch);
    }

    TEST_F(SessionActivationTableTests, SessionOpenInReachableTabIsFocused)
    {
        table_.activate(s1_, "/work", 41000);
        table_.setHome(s1_, Ids::makeTabId("t1"));

        const auto decision = decide("s1", "t2");
        EXPECT_EQ(decision.outcome, LaunchOutcome::FocusExisting);
        EXPECT_EQ(decision.focusTab, Ids::makeTabId("t1"));
        EXPECT_EQ(decision.port, 41000);
    }

    TEST_F(SessionActivationTableTests, UnreachableHomeIsIgnored)
    {
        table_.setHome(s1_, Ids::makeTabId("t1"));

        const auto decision = decide("s1", "t2", std::nullopt, false);
        EXPECT_EQ(decision.outcome, LaunchOutcome::NormalLaunch);
    }

    TEST_F(SessionActivationTableTests, TaskOwnedSessionIsAttached)
    {
        table_.activate(s1_, "/work", 41000);
        table_.setTask(s1_, Ids::makeTaskId("c1"));

        const auto decision = decide("s1", "t1");
        EXPECT_EQ(decision.outcome, LaunchOutcome::AttachToTask);
        EXPECT_EQ(decision.taskOwner, Ids::makeTaskId("c1"));
        EXPECT_EQ(decision.port, 41000);
        EXPECT_FALSE(decision.requiresFreshOwner);
    }

    TEST_F(SessionActivationTableTests, BusyCallerAttachesFromAFreshTab)
    {
        table_.setTask(s1_, Ids::makeTaskId("c1"));
        table_.setHome(s2_, Ids::makeTabId("t1"));
        table_.setTask(s2_, Ids::makeTaskId("c2"));

        const auto decision = decide("s1", "t1", "s2", false);
        EXPECT_EQ(decision.outcome, LaunchOutcome::AttachToTask);
        EXPECT_TRUE(decision.requiresFreshOwner);
    }

    TEST_F(SessionActivationTableTests, BusyCallerOpensUnderAFreshClaim)
    {
        table_.setHome(s2_, Ids::makeTabId("t1"));
        table_.setTask(s2_, Ids::makeTaskId("c2"));

        const auto decision = decide("s1", "t1", "s2");
        EXPECT_EQ(decision.outcome, LaunchOutcome::OpenUnderFreshClaim);
    }

    TEST_F(SessionActivationTableTests, FocusWinsOverTaskOwnership)
    {
        table_.setHome(s1_, Ids::makeTabId("t1"));
        table_.setTask(s1_, Ids::makeTaskId("c1"));

        const auto decision = decide("s1", "t2");
        EXPECT_EQ(decision.outcome, LaunchOutcome::FocusExisting);
        EXPECT_EQ(decision.taskOwner, Ids::makeTaskId("c1"));
    }

    TEST_F(SessionActivationTableTests, CallerShowingTheTargetIsNotBusy)
    {
        table_.setTask(s1_, Ids::makeTaskId("c1"));

        const auto decision = decide("s1", "t1", "s1");
        EXPECT_EQ(decision.outcome, LaunchOutcome::AttachToTask);
        EXPECT_FALSE(decision.requiresFreshOwner);
    }
}
