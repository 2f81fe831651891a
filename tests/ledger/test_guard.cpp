// COMMONIP - Ledger Guard and Event Journal Tests
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <gtest/gtest.h>

#include <commonip/crypto/sha256.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/util/logging.h>
#include <commonip/util/time.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace commonip {
namespace ledger {
namespace {

// ============================================================================
// Event Journal
// ============================================================================

class EventJournalTest : public ::testing::Test {
protected:
    void SetUp() override { util::SetMockTime(1700000000); }
    void TearDown() override { util::DisableMockTime(); }

    EventJournal journal_;
};

TEST_F(EventJournalTest, RecordAssignsSequenceAndTime) {
    Address actor = AddressFromLabel("alice");
    journal_.Record(EventType::AssetRegistered, 1, 1, actor);
    util::AdvanceMockTime(10);
    journal_.Record(EventType::RevenueReceived, 1, 1, actor, 1000, "USD");

    auto events = journal_.GetEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].sequence, 1u);
    EXPECT_EQ(events[0].time, 1700000000);
    EXPECT_EQ(events[1].sequence, 2u);
    EXPECT_EQ(events[1].time, 1700000010);
    EXPECT_EQ(events[1].amount, 1000);
    EXPECT_EQ(events[1].detail, "USD");
}

TEST_F(EventJournalTest, Filters) {
    Address actor = AddressFromLabel("alice");
    journal_.Record(EventType::AssetRegistered, 1, 1, actor);
    journal_.Record(EventType::AssetRegistered, 2, 2, actor);
    journal_.Record(EventType::LicenseExecuted, 7, 2, actor);

    EXPECT_EQ(journal_.Size(), 3u);
    EXPECT_EQ(journal_.Count(EventType::AssetRegistered), 2u);
    EXPECT_EQ(journal_.GetEventsByType(EventType::LicenseExecuted).size(), 1u);
    EXPECT_EQ(journal_.GetEventsForAsset(2).size(), 2u);
    ASSERT_TRUE(journal_.Last().has_value());
    EXPECT_EQ(journal_.Last()->id, 7u);
}

TEST_F(EventJournalTest, EmptyJournal) {
    EXPECT_EQ(journal_.Size(), 0u);
    EXPECT_FALSE(journal_.Last().has_value());
}

TEST_F(EventJournalTest, EventToString) {
    LedgerEvent event;
    event.sequence = 3;
    event.type = EventType::ProposalVoted;
    event.id = 4;
    event.assetId = 1;
    event.amount = 600;
    EXPECT_EQ(event.ToString(), "#3 GovernanceVoteCast id=4 asset=1 amount=600");
    EXPECT_STREQ(EventTypeToString(EventType::ProposalCreated), "GovernanceProposalCreated");
}

// ============================================================================
// Ledger Guard
// ============================================================================

class LedgerGuardTest : public ::testing::Test {
protected:
    LedgerGuardTest()
        : admin_(AddressFromLabel("admin")), guard_(admin_, journal_) {}

    Address admin_;
    EventJournal journal_;
    LedgerGuard guard_;
};

TEST_F(LedgerGuardTest, ScopeMarksOperation) {
    EXPECT_FALSE(guard_.InCall());
    {
        auto scope = guard_.Enter("DistributeRevenue");
        ASSERT_TRUE(scope.Ok());
        EXPECT_TRUE(guard_.InCall());
        EXPECT_EQ(guard_.CurrentOperation(), "DistributeRevenue");
    }
    EXPECT_FALSE(guard_.InCall());
    EXPECT_EQ(guard_.CurrentOperation(), "");
}

TEST_F(LedgerGuardTest, NestedEnterIsRejected) {
    auto outer = guard_.Enter("ExecuteLicense");
    ASSERT_TRUE(outer.Ok());
    {
        auto inner = guard_.Enter("WithdrawPendingRevenue");
        EXPECT_FALSE(inner.Ok());
        EXPECT_EQ(inner.Status().code, ErrorCode::REENTRANT_CALL);
    }
    // The rejected inner scope must not clear the outer marker
    EXPECT_TRUE(guard_.InCall());
    EXPECT_EQ(guard_.CurrentOperation(), "ExecuteLicense");
}

TEST_F(LedgerGuardTest, MovedScopeKeepsOwnership) {
    auto first = guard_.Enter("Op");
    ASSERT_TRUE(first.Ok());
    {
        LedgerGuard::Scope moved(std::move(first));
        EXPECT_TRUE(guard_.InCall());
    }
    EXPECT_FALSE(guard_.InCall());
}

TEST_F(LedgerGuardTest, PauseAndUnpause) {
    Address stranger = AddressFromLabel("stranger");
    EXPECT_EQ(guard_.Pause(stranger).code, ErrorCode::NOT_ADMIN);
    EXPECT_EQ(guard_.Unpause(admin_).code, ErrorCode::NOT_PAUSED);

    ASSERT_TRUE(guard_.Pause(admin_).IsOk());
    EXPECT_TRUE(guard_.IsPaused());
    EXPECT_EQ(guard_.PauseReason(), "administrator");
    EXPECT_EQ(guard_.Enter("ReceiveRevenue").Status().code, ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(guard_.Pause(admin_).code, ErrorCode::SYSTEM_PAUSED);

    EXPECT_EQ(guard_.Unpause(stranger).code, ErrorCode::NOT_ADMIN);
    ASSERT_TRUE(guard_.Unpause(admin_).IsOk());
    EXPECT_FALSE(guard_.IsPaused());
    EXPECT_TRUE(guard_.Enter("ReceiveRevenue").Ok());

    EXPECT_EQ(journal_.Count(EventType::Paused), 1u);
    EXPECT_EQ(journal_.Count(EventType::Unpaused), 1u);
}

TEST_F(LedgerGuardTest, TripPauseFromOpenScope) {
    {
        auto scope = guard_.Enter("ExecuteEmergency");
        ASSERT_TRUE(scope.Ok());
        guard_.TripPause(admin_, "emergency proposal 1");
    }
    EXPECT_TRUE(guard_.IsPaused());
    EXPECT_EQ(guard_.PauseReason(), "emergency proposal 1");
    ASSERT_TRUE(journal_.Last().has_value());
    EXPECT_EQ(journal_.Last()->detail, "emergency proposal 1");
}

TEST_F(LedgerGuardTest, OtherThreadsWaitInsteadOfFailing) {
    std::atomic<bool> entered{false};
    Result otherResult = Result::Error(ErrorCode::INVALID_AMOUNT);
    std::thread other;
    {
        auto scope = guard_.Enter("Slow");
        ASSERT_TRUE(scope.Ok());
        other = std::thread([&]() {
            auto inner = guard_.Enter("Fast");
            otherResult = inner.Status();
            entered = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_FALSE(entered.load());
    }
    other.join();
    EXPECT_TRUE(entered.load());
    EXPECT_TRUE(otherResult.IsOk());
}

TEST(RejectTest, BuildsErrorResult) {
    Result r = Reject(util::LogCategory::LEDGER, "Op", ErrorCode::NOT_ADMIN, "detail");
    EXPECT_EQ(r.code, ErrorCode::NOT_ADMIN);
    EXPECT_EQ(r.reason, "Not administrator: detail");
}

} // anonymous namespace
} // namespace ledger
} // namespace commonip
