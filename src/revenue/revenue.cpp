// COMMONIP - Revenue Pool Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/revenue/revenue.h>
#include <commonip/util/logging.h>
#include <commonip/util/time.h>

#include <sstream>

namespace commonip {
namespace revenue {

using ledger::EventType;
using ledger::Reject;

namespace {
const char* CATEGORY = util::LogCategory::REVENUE;
}

std::string RevenueAccount::ToString() const {
    std::ostringstream oss;
    oss << "RevenueAccount(received=" << totalReceived << ", distributed=" << totalDistributed
        << ", accumulated=" << accumulated << ", minimum=" << minimumDistribution
        << ", distributions=" << distributionCount << ")";
    return oss.str();
}

RevenuePool::RevenuePool(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                         const ownership::OwnershipLedger& owners,
                         token::PaymentRegistry& payments, const Address& poolAddress)
    : guard_(guard), journal_(journal), owners_(owners), payments_(payments),
      pool_(poolAddress) {}

// ============================================================================
// Receive
// ============================================================================

Result RevenuePool::ReceiveRevenue(const Address& caller, AssetId asset,
                                   const CurrencyId& currency, Amount amount) {
    auto scope = guard_.Enter("ReceiveRevenue");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (amount <= 0) {
        return Reject(CATEGORY, "ReceiveRevenue", ErrorCode::INVALID_AMOUNT);
    }
    if (!owners_.HasOwnership(asset)) {
        return Reject(CATEGORY, "ReceiveRevenue", ErrorCode::NO_OWNERSHIP_RECORD);
    }
    auto payment = payments_.Get(currency);
    if (!payment) {
        return Reject(CATEGORY, "ReceiveRevenue", ErrorCode::UNKNOWN_CURRENCY,
                      currency.ToShortHex());
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RevenueAccount current;
    auto it = accounts_.find({asset, currency});
    if (it != accounts_.end()) {
        current = it->second;
    }
    Amount newReceived = 0;
    Amount newAccumulated = 0;
    if (!CheckedAdd(current.totalReceived, amount, newReceived) ||
        !CheckedAdd(current.accumulated, amount, newAccumulated)) {
        return Reject(CATEGORY, "ReceiveRevenue", ErrorCode::AMOUNT_OVERFLOW);
    }

    Result pulled = payment->TransferFrom(pool_, caller, pool_, amount);
    if (!pulled.IsOk()) {
        LOG_DEBUG(CATEGORY) << "ReceiveRevenue transfer failed: " << pulled.reason;
        return pulled;
    }

    RevenueAccount& account = accounts_[{asset, currency}];
    account.totalReceived = newReceived;
    account.accumulated = newAccumulated;

    journal_.Record(EventType::RevenueReceived, asset, asset, caller, amount,
                    payment->Symbol());
    LOG_INFO(CATEGORY) << "Asset " << asset << " received " << amount << " "
                       << payment->Symbol() << " from " << caller.ToShortHex();
    return Result::Success();
}

// ============================================================================
// Distribution
// ============================================================================

std::vector<ShareCredit> RevenuePool::ComputeShares(AssetId asset, Amount amount) const {
    std::vector<ShareCredit> shares;
    for (const auto& entry : owners_.GetOwners(asset)) {
        ShareCredit credit;
        credit.owner = entry.owner;
        credit.amount = MulDivFloor(amount, entry.percentage, PERCENT_TOTAL);
        shares.push_back(credit);
    }
    return shares;
}

Result RevenuePool::Stage(AssetId asset, const CurrencyId& currency, Amount amount,
                          std::vector<StagedCredit>& staged, Amount& distributed) const {
    staged.clear();
    distributed = 0;
    for (const auto& credit : ComputeShares(asset, amount)) {
        if (credit.amount == 0) {
            continue;
        }
        BalanceKey key{asset, credit.owner, currency};
        PendingBalance balance;
        auto it = balances_.find(key);
        if (it != balances_.end()) {
            balance = it->second;
        }
        if (!CheckedAdd(balance.pending, credit.amount, balance.pending) ||
            !CheckedAdd(balance.totalEarned, credit.amount, balance.totalEarned)) {
            return Result::Error(ErrorCode::AMOUNT_OVERFLOW, credit.owner.ToShortHex());
        }
        distributed += credit.amount;
        staged.push_back({key, balance});
    }

    auto accountIt = accounts_.find({asset, currency});
    Amount totalDistributed = accountIt == accounts_.end() ? 0 : accountIt->second.totalDistributed;
    Amount check = 0;
    if (!CheckedAdd(totalDistributed, distributed, check)) {
        return Result::Error(ErrorCode::AMOUNT_OVERFLOW, "total distributed");
    }
    return Result::Success();
}

Result RevenuePool::ApplyDistribution(AssetId asset, const CurrencyId& currency, Amount amount,
                                      const Address& actor, bool fee) {
    std::vector<StagedCredit> staged;
    Amount distributed = 0;
    Result status = Stage(asset, currency, amount, staged, distributed);
    if (!status.IsOk()) {
        return status;
    }

    for (const auto& credit : staged) {
        balances_[credit.key] = credit.balance;
    }
    RevenueAccount& account = accounts_[{asset, currency}];
    account.accumulated -= distributed;
    account.totalDistributed += distributed;
    account.distributionCount++;
    account.lastDistribution = util::GetTime();

    journal_.Record(EventType::RevenueDistributed, asset, asset, actor, distributed,
                    fee ? "fee" : "");
    LOG_INFO(CATEGORY) << "Asset " << asset << " distributed " << distributed << " of "
                       << amount << " over " << staged.size() << " owners"
                       << (fee ? " (fee)" : "");
    return Result::Success();
}

Result RevenuePool::Distribute(const char* operation, const Address& caller, AssetId asset,
                               const CurrencyId& currency, Amount amount, bool allAccumulated) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, operation, ErrorCode::NOT_ASSET_OWNER);
    }
    auto it = accounts_.find({asset, currency});
    if (allAccumulated) {
        amount = it == accounts_.end() ? 0 : it->second.accumulated;
        if (amount == 0) {
            LOG_DEBUG(CATEGORY) << operation << ": nothing accumulated for asset " << asset;
            return Result::Success();
        }
    } else if (amount <= 0) {
        return Reject(CATEGORY, operation, ErrorCode::INVALID_AMOUNT);
    }
    if (it == accounts_.end() || amount > it->second.accumulated) {
        return Reject(CATEGORY, operation, ErrorCode::INSUFFICIENT_ACCUMULATED);
    }
    if (amount < it->second.minimumDistribution) {
        return Reject(CATEGORY, operation, ErrorCode::BELOW_MINIMUM_DISTRIBUTION,
                      std::to_string(amount) + " < " +
                          std::to_string(it->second.minimumDistribution));
    }

    Result applied = ApplyDistribution(asset, currency, amount, caller, false);
    if (!applied.IsOk()) {
        return Reject(CATEGORY, operation, applied.code);
    }
    return applied;
}

Result RevenuePool::DistributeRevenue(const Address& caller, AssetId asset,
                                      const CurrencyId& currency, Amount amount) {
    auto scope = guard_.Enter("DistributeRevenue");
    if (!scope.Ok()) {
        return scope.Status();
    }
    return Distribute("DistributeRevenue", caller, asset, currency, amount, false);
}

Result RevenuePool::DistributeAllRevenue(const Address& caller, AssetId asset,
                                         const CurrencyId& currency) {
    auto scope = guard_.Enter("DistributeAllRevenue");
    if (!scope.Ok()) {
        return scope.Status();
    }
    return Distribute("DistributeAllRevenue", caller, asset, currency, 0, true);
}

// ============================================================================
// Withdrawal
// ============================================================================

Result RevenuePool::WithdrawPendingRevenue(const Address& caller, AssetId asset,
                                           const CurrencyId& currency) {
    auto scope = guard_.Enter("WithdrawPendingRevenue");
    if (!scope.Ok()) {
        return scope.Status();
    }

    auto entry = owners_.GetEntry(asset, caller);
    if (!entry || !entry->isMember) {
        return Reject(CATEGORY, "WithdrawPendingRevenue", ErrorCode::NOT_ASSET_OWNER);
    }
    auto payment = payments_.Get(currency);
    if (!payment) {
        return Reject(CATEGORY, "WithdrawPendingRevenue", ErrorCode::UNKNOWN_CURRENCY);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find({asset, caller, currency});
    if (it == balances_.end() || it->second.pending == 0) {
        return Reject(CATEGORY, "WithdrawPendingRevenue", ErrorCode::NOTHING_TO_WITHDRAW);
    }

    PendingBalance before = it->second;
    Amount amount = before.pending;
    it->second.pending = 0;
    it->second.totalWithdrawn += amount;

    Result paid = payment->Transfer(pool_, caller, amount);
    if (!paid.IsOk()) {
        it->second = before;
        LOG_WARN(CATEGORY) << "Payout of " << amount << " to " << caller.ToShortHex()
                           << " failed, withdrawal rolled back: " << paid.reason;
        return paid;
    }

    journal_.Record(EventType::RevenueWithdrawn, asset, asset, caller, amount,
                    payment->Symbol());
    LOG_INFO(CATEGORY) << caller.ToShortHex() << " withdrew " << amount << " "
                       << payment->Symbol() << " from asset " << asset;
    return Result::Success();
}

// ============================================================================
// Minimum Distribution
// ============================================================================

Result RevenuePool::SetMinimumDistribution(const Address& caller, AssetId asset,
                                           const CurrencyId& currency, Amount amount) {
    auto scope = guard_.Enter("SetMinimumDistribution");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "SetMinimumDistribution", ErrorCode::NOT_ASSET_OWNER);
    }
    if (amount < 0) {
        return Reject(CATEGORY, "SetMinimumDistribution", ErrorCode::INVALID_AMOUNT);
    }
    return SetMinimumInternal(asset, currency, amount, caller);
}

Result RevenuePool::SetMinimumInternal(AssetId asset, const CurrencyId& currency,
                                       Amount amount, const Address& actor) {
    if (amount < 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    accounts_[{asset, currency}].minimumDistribution = amount;

    journal_.Record(EventType::MinimumDistributionSet, asset, asset, actor, amount);
    LOG_INFO(CATEGORY) << "Asset " << asset << " minimum distribution set to " << amount;
    return Result::Success();
}

// ============================================================================
// Fee Routing
// ============================================================================

Result RevenuePool::CheckRouteFee(AssetId asset, const CurrencyId& currency,
                                  Amount amount) const {
    if (amount <= 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    if (!owners_.HasOwnership(asset)) {
        return Result::Error(ErrorCode::NO_OWNERSHIP_RECORD);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RevenueAccount current;
    auto it = accounts_.find({asset, currency});
    if (it != accounts_.end()) {
        current = it->second;
    }
    Amount check = 0;
    if (!CheckedAdd(current.totalReceived, amount, check) ||
        !CheckedAdd(current.accumulated, amount, check)) {
        return Result::Error(ErrorCode::AMOUNT_OVERFLOW);
    }
    std::vector<StagedCredit> staged;
    Amount distributed = 0;
    return Stage(asset, currency, amount, staged, distributed);
}

Result RevenuePool::RouteFee(AssetId asset, const CurrencyId& currency, Amount amount,
                             const Address& actor) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Result check = CheckRouteFee(asset, currency, amount);
    if (!check.IsOk()) {
        return check;
    }

    RevenueAccount& account = accounts_[{asset, currency}];
    account.totalReceived += amount;
    account.accumulated += amount;
    journal_.Record(EventType::RevenueReceived, asset, asset, actor, amount, "fee");

    return ApplyDistribution(asset, currency, amount, actor, true);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<RevenueAccount> RevenuePool::GetAccount(AssetId asset,
                                                      const CurrencyId& currency) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = accounts_.find({asset, currency});
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount RevenuePool::GetAccumulated(AssetId asset, const CurrencyId& currency) const {
    auto account = GetAccount(asset, currency);
    return account ? account->accumulated : 0;
}

Amount RevenuePool::GetMinimumDistribution(AssetId asset, const CurrencyId& currency) const {
    auto account = GetAccount(asset, currency);
    return account ? account->minimumDistribution : 0;
}

PendingBalance RevenuePool::GetBalance(AssetId asset, const Address& owner,
                                       const CurrencyId& currency) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find({asset, owner, currency});
    return it == balances_.end() ? PendingBalance{} : it->second;
}

Amount RevenuePool::GetPending(AssetId asset, const Address& owner,
                               const CurrencyId& currency) const {
    return GetBalance(asset, owner, currency).pending;
}

} // namespace revenue
} // namespace commonip
