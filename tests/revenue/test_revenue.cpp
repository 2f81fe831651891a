// COMMONIP - Revenue Pool Tests
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <gtest/gtest.h>

#include <commonip/crypto/sha256.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/ownership/ownership.h>
#include <commonip/revenue/revenue.h>
#include <commonip/token/payment.h>
#include <commonip/util/time.h>

#include <memory>

namespace commonip {
namespace revenue {
namespace {

using ledger::EventType;

class RevenuePoolTest : public ::testing::Test {
protected:
    RevenuePoolTest()
        : admin_(AddressFromLabel("admin")),
          alice_(AddressFromLabel("alice")),
          bob_(AddressFromLabel("bob")),
          carol_(AddressFromLabel("carol")),
          payer_(AddressFromLabel("payer")),
          poolAddress_(AddressFromLabel("pool")),
          guard_(admin_, journal_),
          ownership_(guard_, journal_),
          usd_(std::make_shared<token::MemoryPaymentLedger>("USD")),
          pool_(guard_, journal_, ownership_, payments_, poolAddress_) {}

    void SetUp() override {
        util::SetMockTime(1700000000);
        payments_.Register(usd_);
        ASSERT_TRUE(ownership_.RegisterOwnership(admin_, ASSET, {alice_, bob_, carol_},
                                                 {60, 30, 10}, {600, 300, 100})
                        .IsOk());
        ASSERT_TRUE(usd_->Mint(payer_, 100000).IsOk());
        ASSERT_TRUE(usd_->Approve(payer_, poolAddress_, 100000).IsOk());
    }

    void TearDown() override { util::DisableMockTime(); }

    const CurrencyId& USD() const { return usd_->Id(); }

    static constexpr AssetId ASSET = 1;

    Address admin_;
    Address alice_;
    Address bob_;
    Address carol_;
    Address payer_;
    Address poolAddress_;
    ledger::EventJournal journal_;
    ledger::LedgerGuard guard_;
    ownership::OwnershipLedger ownership_;
    token::PaymentRegistry payments_;
    std::shared_ptr<token::MemoryPaymentLedger> usd_;
    RevenuePool pool_;
};

// ============================================================================
// Receive
// ============================================================================

TEST_F(RevenuePoolTest, ReceivePullsIntoPool) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());

    EXPECT_EQ(usd_->BalanceOf(poolAddress_), 1000);
    EXPECT_EQ(usd_->BalanceOf(payer_), 99000);
    auto account = pool_.GetAccount(ASSET, USD());
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->totalReceived, 1000);
    EXPECT_EQ(account->accumulated, 1000);
    EXPECT_EQ(account->totalDistributed, 0);

    auto last = journal_.Last();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->type, EventType::RevenueReceived);
    EXPECT_EQ(last->detail, "USD");
}

TEST_F(RevenuePoolTest, ReceiveRejections) {
    EXPECT_EQ(pool_.ReceiveRevenue(payer_, ASSET, USD(), 0).code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_.ReceiveRevenue(payer_, 2, USD(), 10).code, ErrorCode::NO_OWNERSHIP_RECORD);
    EXPECT_EQ(pool_.ReceiveRevenue(payer_, ASSET, AddressFromLabel("EUR"), 10).code,
              ErrorCode::UNKNOWN_CURRENCY);
    EXPECT_EQ(pool_.ReceiveRevenue(alice_, ASSET, USD(), 10).code,
              ErrorCode::INSUFFICIENT_ALLOWANCE);
    EXPECT_FALSE(pool_.GetAccount(ASSET, USD()).has_value());
    EXPECT_EQ(journal_.Count(EventType::RevenueReceived), 0u);
}

// ============================================================================
// Distribution
// ============================================================================

TEST_F(RevenuePoolTest, DistributeSplitsByPercentage) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 1000).IsOk());

    EXPECT_EQ(pool_.GetPending(ASSET, alice_, USD()), 600);
    EXPECT_EQ(pool_.GetPending(ASSET, bob_, USD()), 300);
    EXPECT_EQ(pool_.GetPending(ASSET, carol_, USD()), 100);

    auto account = pool_.GetAccount(ASSET, USD());
    EXPECT_EQ(account->accumulated, 0);
    EXPECT_EQ(account->totalDistributed, 1000);
    EXPECT_EQ(account->distributionCount, 1u);
    EXPECT_EQ(account->lastDistribution, 1700000000);
}

TEST_F(RevenuePoolTest, DistributeAfterShareTransfer) {
    ASSERT_TRUE(ownership_.TransferShare(alice_, ASSET, alice_, bob_, 10).IsOk());
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(bob_, ASSET, USD(), 1000).IsOk());

    EXPECT_EQ(pool_.GetPending(ASSET, alice_, USD()), 500);
    EXPECT_EQ(pool_.GetPending(ASSET, bob_, USD()), 400);
    EXPECT_EQ(pool_.GetPending(ASSET, carol_, USD()), 100);
}

TEST_F(RevenuePoolTest, DustStaysAccumulated) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1005).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 1005).IsOk());

    // 603 + 301 + 100 = 1004
    EXPECT_EQ(pool_.GetPending(ASSET, alice_, USD()), 603);
    EXPECT_EQ(pool_.GetPending(ASSET, bob_, USD()), 301);
    EXPECT_EQ(pool_.GetPending(ASSET, carol_, USD()), 100);
    auto account = pool_.GetAccount(ASSET, USD());
    EXPECT_EQ(account->accumulated, 1);
    EXPECT_EQ(account->totalDistributed, 1004);
    EXPECT_EQ(account->totalReceived, account->totalDistributed + account->accumulated);
}

TEST_F(RevenuePoolTest, DistributeRejections) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 500).IsOk());

    EXPECT_EQ(pool_.DistributeRevenue(payer_, ASSET, USD(), 100).code,
              ErrorCode::NOT_ASSET_OWNER);
    EXPECT_EQ(pool_.DistributeRevenue(alice_, ASSET, USD(), 0).code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_.DistributeRevenue(alice_, ASSET, USD(), 501).code,
              ErrorCode::INSUFFICIENT_ACCUMULATED);

    ASSERT_TRUE(pool_.SetMinimumDistribution(alice_, ASSET, USD(), 200).IsOk());
    EXPECT_EQ(pool_.GetMinimumDistribution(ASSET, USD()), 200);
    EXPECT_EQ(pool_.DistributeRevenue(alice_, ASSET, USD(), 199).code,
              ErrorCode::BELOW_MINIMUM_DISTRIBUTION);
    EXPECT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 200).IsOk());
    EXPECT_EQ(pool_.GetAccumulated(ASSET, USD()), 300);
}

TEST_F(RevenuePoolTest, DistributeAll) {
    // Nothing accumulated is a successful no-op
    ASSERT_TRUE(pool_.DistributeAllRevenue(alice_, ASSET, USD()).IsOk());
    EXPECT_EQ(journal_.Count(EventType::RevenueDistributed), 0u);

    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 700).IsOk());
    ASSERT_TRUE(pool_.DistributeAllRevenue(carol_, ASSET, USD()).IsOk());
    EXPECT_EQ(pool_.GetPending(ASSET, alice_, USD()), 420);
    EXPECT_EQ(pool_.GetAccumulated(ASSET, USD()), 0);
    EXPECT_EQ(pool_.DistributeAllRevenue(payer_, ASSET, USD()).code,
              ErrorCode::NOT_ASSET_OWNER);
}

TEST_F(RevenuePoolTest, SetMinimumRejections) {
    EXPECT_EQ(pool_.SetMinimumDistribution(payer_, ASSET, USD(), 10).code,
              ErrorCode::NOT_ASSET_OWNER);
    EXPECT_EQ(pool_.SetMinimumDistribution(alice_, ASSET, USD(), -1).code,
              ErrorCode::INVALID_AMOUNT);
    ASSERT_TRUE(pool_.SetMinimumDistribution(alice_, ASSET, USD(), 0).IsOk());
    EXPECT_EQ(journal_.Count(EventType::MinimumDistributionSet), 1u);
}

TEST_F(RevenuePoolTest, ComputeSharesListsEveryOwner) {
    ASSERT_TRUE(ownership_.TransferShare(carol_, ASSET, carol_, alice_, 10).IsOk());
    auto shares = pool_.ComputeShares(ASSET, 1000);
    ASSERT_EQ(shares.size(), 3u);
    EXPECT_EQ(shares[0].amount, 700);
    EXPECT_EQ(shares[1].amount, 300);
    EXPECT_EQ(shares[2].owner, carol_);
    EXPECT_EQ(shares[2].amount, 0);
}

// ============================================================================
// Withdrawal
// ============================================================================

TEST_F(RevenuePoolTest, WithdrawPaysOut) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 1000).IsOk());

    ASSERT_TRUE(pool_.WithdrawPendingRevenue(bob_, ASSET, USD()).IsOk());
    EXPECT_EQ(usd_->BalanceOf(bob_), 300);
    EXPECT_EQ(usd_->BalanceOf(poolAddress_), 700);

    PendingBalance balance = pool_.GetBalance(ASSET, bob_, USD());
    EXPECT_EQ(balance.pending, 0);
    EXPECT_EQ(balance.totalEarned, 300);
    EXPECT_EQ(balance.totalWithdrawn, 300);

    EXPECT_EQ(pool_.WithdrawPendingRevenue(bob_, ASSET, USD()).code,
              ErrorCode::NOTHING_TO_WITHDRAW);
}

TEST_F(RevenuePoolTest, WithdrawRejections) {
    EXPECT_EQ(pool_.WithdrawPendingRevenue(payer_, ASSET, USD()).code,
              ErrorCode::NOT_ASSET_OWNER);
    EXPECT_EQ(pool_.WithdrawPendingRevenue(alice_, ASSET, AddressFromLabel("EUR")).code,
              ErrorCode::UNKNOWN_CURRENCY);
    EXPECT_EQ(pool_.WithdrawPendingRevenue(alice_, ASSET, USD()).code,
              ErrorCode::NOTHING_TO_WITHDRAW);
}

TEST_F(RevenuePoolTest, FormerOwnerCanStillWithdraw) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(ownership_.TransferShare(carol_, ASSET, carol_, bob_, 10).IsOk());
    ASSERT_FALSE(ownership_.IsOwner(ASSET, carol_));

    ASSERT_TRUE(pool_.WithdrawPendingRevenue(carol_, ASSET, USD()).IsOk());
    EXPECT_EQ(usd_->BalanceOf(carol_), 100);
}

TEST_F(RevenuePoolTest, FailedPayoutRestoresBalance) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 1000).IsOk());

    // Drain the pool behind the ledger's back
    ASSERT_TRUE(usd_->Transfer(poolAddress_, payer_, 1000).IsOk());

    Result r = pool_.WithdrawPendingRevenue(alice_, ASSET, USD());
    EXPECT_EQ(r.code, ErrorCode::INSUFFICIENT_BALANCE);
    PendingBalance balance = pool_.GetBalance(ASSET, alice_, USD());
    EXPECT_EQ(balance.pending, 600);
    EXPECT_EQ(balance.totalWithdrawn, 0);
    EXPECT_EQ(journal_.Count(EventType::RevenueWithdrawn), 0u);
}

TEST_F(RevenuePoolTest, NestedCallFromPayoutIsRejected) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(pool_.DistributeRevenue(alice_, ASSET, USD(), 1000).IsOk());

    Result nested;
    bool fired = false;
    usd_->SetTransferHook([&](const Address&, const Address& to, Amount) {
        if (to == alice_ && !fired) {
            fired = true;
            nested = pool_.WithdrawPendingRevenue(alice_, ASSET, USD());
        }
    });

    ASSERT_TRUE(pool_.WithdrawPendingRevenue(alice_, ASSET, USD()).IsOk());
    ASSERT_TRUE(fired);
    EXPECT_EQ(nested.code, ErrorCode::REENTRANT_CALL);
    EXPECT_EQ(usd_->BalanceOf(alice_), 600);
    EXPECT_EQ(pool_.GetBalance(ASSET, alice_, USD()).totalWithdrawn, 600);
}

TEST_F(RevenuePoolTest, PausedPoolRejectsMutations) {
    ASSERT_TRUE(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1000).IsOk());
    ASSERT_TRUE(guard_.Pause(admin_).IsOk());
    EXPECT_EQ(pool_.ReceiveRevenue(payer_, ASSET, USD(), 1).code, ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(pool_.DistributeRevenue(alice_, ASSET, USD(), 1000).code,
              ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(pool_.WithdrawPendingRevenue(alice_, ASSET, USD()).code,
              ErrorCode::SYSTEM_PAUSED);
    // Queries still answer
    EXPECT_EQ(pool_.GetAccumulated(ASSET, USD()), 1000);
}

// ============================================================================
// Fee Routing
// ============================================================================

TEST_F(RevenuePoolTest, RouteFeeSplitsImmediately) {
    ASSERT_TRUE(pool_.SetMinimumDistribution(alice_, ASSET, USD(), 5000).IsOk());
    {
        auto scope = guard_.Enter("ExecuteLicense");
        ASSERT_TRUE(scope.Ok());
        ASSERT_TRUE(pool_.CheckRouteFee(ASSET, USD(), 1000).IsOk());
        ASSERT_TRUE(pool_.RouteFee(ASSET, USD(), 1000, payer_).IsOk());
    }
    EXPECT_EQ(pool_.GetPending(ASSET, alice_, USD()), 600);
    EXPECT_EQ(pool_.GetPending(ASSET, bob_, USD()), 300);
    EXPECT_EQ(pool_.GetPending(ASSET, carol_, USD()), 100);

    auto account = pool_.GetAccount(ASSET, USD());
    EXPECT_EQ(account->totalReceived, 1000);
    EXPECT_EQ(account->accumulated, 0);

    auto distributed = journal_.GetEventsByType(EventType::RevenueDistributed);
    ASSERT_EQ(distributed.size(), 1u);
    EXPECT_EQ(distributed[0].detail, "fee");
}

TEST_F(RevenuePoolTest, CheckRouteFeeRejections) {
    EXPECT_EQ(pool_.CheckRouteFee(ASSET, USD(), 0).code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_.CheckRouteFee(7, USD(), 10).code, ErrorCode::NO_OWNERSHIP_RECORD);
}

} // anonymous namespace
} // namespace revenue
} // namespace commonip
