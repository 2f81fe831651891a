// COMMONIP - Revenue Pool
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Per (asset, currency) revenue accounting. Funds are pulled into the pool
// address on each payment ledger, split pro-rata over the owner set into
// pending balances, and paid out on withdrawal.
//
// Distribution uses floor division per owner; the residue stays in
// `accumulated` and is included in later distributions.

#ifndef COMMONIP_REVENUE_REVENUE_H
#define COMMONIP_REVENUE_REVENUE_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/ownership/ownership.h>
#include <commonip/token/payment.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace commonip {
namespace revenue {

// ============================================================================
// Accounts
// ============================================================================

struct RevenueAccount {
    Amount totalReceived{0};
    Amount totalDistributed{0};

    /// totalReceived - totalDistributed
    Amount accumulated{0};

    /// Smallest owner-initiated distribution
    Amount minimumDistribution{0};

    uint64_t distributionCount{0};
    Timestamp lastDistribution{0};

    std::string ToString() const;
};

struct PendingBalance {
    Amount pending{0};
    Amount totalEarned{0};
    Amount totalWithdrawn{0};
};

/// One owner's credit in a distribution
struct ShareCredit {
    Address owner;
    Amount amount{0};
};

// ============================================================================
// Revenue Pool
// ============================================================================

class RevenuePool {
public:
    RevenuePool(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                const ownership::OwnershipLedger& owners, token::PaymentRegistry& payments,
                const Address& poolAddress);

    // === Mutations ===

    /// Pull `amount` from the caller into the pool
    Result ReceiveRevenue(const Address& caller, AssetId asset, const CurrencyId& currency,
                          Amount amount);

    /// Owner-initiated pro-rata split of accumulated funds
    Result DistributeRevenue(const Address& caller, AssetId asset, const CurrencyId& currency,
                             Amount amount);

    /// DistributeRevenue over the whole accumulated balance; no-op when empty
    Result DistributeAllRevenue(const Address& caller, AssetId asset,
                                const CurrencyId& currency);

    /// Pay out the caller's pending balance
    Result WithdrawPendingRevenue(const Address& caller, AssetId asset,
                                  const CurrencyId& currency);

    Result SetMinimumDistribution(const Address& caller, AssetId asset,
                                  const CurrencyId& currency, Amount amount);

    // === Internal (caller holds the guard scope) ===

    /**
     * Check that RouteFee would accept `amount`. Used before pulling funds
     * so that a routing failure cannot follow a completed transfer.
     */
    Result CheckRouteFee(AssetId asset, const CurrencyId& currency, Amount amount) const;

    /**
     * Credit funds already transferred into the pool and split them
     * immediately over the owner set. The minimum distribution floor does
     * not apply.
     */
    Result RouteFee(AssetId asset, const CurrencyId& currency, Amount amount,
                    const Address& actor);

    /// Governance revenue-policy execution
    Result SetMinimumInternal(AssetId asset, const CurrencyId& currency, Amount amount,
                              const Address& actor);

    // === Queries ===

    std::optional<RevenueAccount> GetAccount(AssetId asset, const CurrencyId& currency) const;
    Amount GetAccumulated(AssetId asset, const CurrencyId& currency) const;
    Amount GetMinimumDistribution(AssetId asset, const CurrencyId& currency) const;

    PendingBalance GetBalance(AssetId asset, const Address& owner,
                              const CurrencyId& currency) const;
    Amount GetPending(AssetId asset, const Address& owner, const CurrencyId& currency) const;

    /// Pro-rata shares of `amount` under the current owner set
    std::vector<ShareCredit> ComputeShares(AssetId asset, Amount amount) const;

    const Address& PoolAddress() const { return pool_; }

private:
    using AccountKey = std::pair<AssetId, CurrencyId>;
    using BalanceKey = std::tuple<AssetId, Address, CurrencyId>;

    struct StagedCredit {
        BalanceKey key;
        PendingBalance balance;
    };

    Result Distribute(const char* operation, const Address& caller, AssetId asset,
                      const CurrencyId& currency, Amount amount, bool allAccumulated);

    /// Compute post-distribution balances without writing them
    Result Stage(AssetId asset, const CurrencyId& currency, Amount amount,
                 std::vector<StagedCredit>& staged, Amount& distributed) const;

    /// Stage, check and apply one split
    Result ApplyDistribution(AssetId asset, const CurrencyId& currency, Amount amount,
                             const Address& actor, bool fee);

    ledger::LedgerGuard& guard_;
    ledger::EventJournal& journal_;
    const ownership::OwnershipLedger& owners_;
    token::PaymentRegistry& payments_;
    Address pool_;

    mutable std::recursive_mutex mutex_;
    std::map<AccountKey, RevenueAccount> accounts_;
    std::map<BalanceKey, PendingBalance> balances_;
};

} // namespace revenue
} // namespace commonip

#endif // COMMONIP_REVENUE_REVENUE_H
