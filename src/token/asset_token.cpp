// COMMONIP - Asset Token Ledger Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/token/asset_token.h>

namespace commonip {
namespace token {

Result MemoryAssetTokenLedger::Mint(const Address& recipient, AssetId asset, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount <= 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    if (recipient.IsNull()) {
        return Result::Error(ErrorCode::NULL_ADDRESS, "mint recipient");
    }

    auto key = std::make_pair(asset, recipient);
    Amount newBalance = 0;
    Amount newSupply = 0;
    if (!CheckedAdd(balances_[key], amount, newBalance) ||
        !CheckedAdd(supply_[asset], amount, newSupply)) {
        return Result::Error(ErrorCode::AMOUNT_OVERFLOW, "asset supply");
    }
    balances_[key] = newBalance;
    supply_[asset] = newSupply;
    return Result::Success();
}

Result MemoryAssetTokenLedger::Burn(const Address& holder, AssetId asset, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount <= 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    auto it = balances_.find(std::make_pair(asset, holder));
    if (it == balances_.end() || it->second < amount) {
        return Result::Error(ErrorCode::INSUFFICIENT_BALANCE, "asset burn");
    }
    it->second -= amount;
    supply_[asset] -= amount;
    return Result::Success();
}

Amount MemoryAssetTokenLedger::BalanceOf(const Address& holder, AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(std::make_pair(asset, holder));
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryAssetTokenLedger::TotalSupply(AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = supply_.find(asset);
    return it == supply_.end() ? 0 : it->second;
}

} // namespace token
} // namespace commonip
