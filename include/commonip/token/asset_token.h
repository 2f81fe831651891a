// COMMONIP - Asset Token Ledger
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#ifndef COMMONIP_TOKEN_ASSET_TOKEN_H
#define COMMONIP_TOKEN_ASSET_TOKEN_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>

#include <map>
#include <mutex>
#include <utility>

namespace commonip {
namespace token {

/**
 * Per-asset fungible supply. The ledger mints at registration and on
 * explicit supply increases; holder balances are otherwise read-only here.
 * Burn only undoes mints of a call that did not complete.
 */
class IAssetTokenLedger {
public:
    virtual ~IAssetTokenLedger() = default;

    virtual Result Mint(const Address& recipient, AssetId asset, Amount amount) = 0;

    virtual Result Burn(const Address& holder, AssetId asset, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& holder, AssetId asset) const = 0;

    virtual Amount TotalSupply(AssetId asset) const = 0;
};

/// Map-backed asset token ledger
class MemoryAssetTokenLedger : public IAssetTokenLedger {
public:
    Result Mint(const Address& recipient, AssetId asset, Amount amount) override;
    Result Burn(const Address& holder, AssetId asset, Amount amount) override;
    Amount BalanceOf(const Address& holder, AssetId asset) const override;
    Amount TotalSupply(AssetId asset) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<AssetId, Address>, Amount> balances_;
    std::map<AssetId, Amount> supply_;
};

} // namespace token
} // namespace commonip

#endif // COMMONIP_TOKEN_ASSET_TOKEN_H
