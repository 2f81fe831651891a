// COMMONIP - Collective Ledger
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Aggregate owning one instance of every component and wiring them by
// reference. Components are declared in dependency order; destruction runs
// in reverse.

#ifndef COMMONIP_LEDGER_LEDGER_H
#define COMMONIP_LEDGER_LEDGER_H

#include <commonip/asset/asset.h>
#include <commonip/core/types.h>
#include <commonip/governance/governance.h>
#include <commonip/governance/settings.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/ledger/options.h>
#include <commonip/license/license.h>
#include <commonip/ownership/ownership.h>
#include <commonip/revenue/revenue.h>
#include <commonip/token/asset_token.h>
#include <commonip/token/payment.h>

#include <memory>

namespace commonip {
namespace ledger {

class CollectiveLedger {
public:
    /// Uses the in-memory asset token ledger
    CollectiveLedger(const Address& admin, const LedgerOptions& options = LedgerOptions{});

    /// Mint through an external asset token ledger
    CollectiveLedger(const Address& admin, std::shared_ptr<token::IAssetTokenLedger> assetTokens,
                     const LedgerOptions& options = LedgerOptions{});

    CollectiveLedger(const CollectiveLedger&) = delete;
    CollectiveLedger& operator=(const CollectiveLedger&) = delete;

    LedgerGuard& Guard() { return guard_; }
    EventJournal& Journal() { return journal_; }
    const EventJournal& Journal() const { return journal_; }

    token::PaymentRegistry& Payments() { return payments_; }
    token::IAssetTokenLedger& AssetTokens() { return *assetTokens_; }

    ownership::OwnershipLedger& Ownership() { return ownership_; }
    asset::AssetRegistry& Assets() { return assets_; }
    governance::SettingsRegistry& Settings() { return settings_; }
    revenue::RevenuePool& Revenue() { return revenue_; }
    license::LicenseRegistry& Licenses() { return licenses_; }
    governance::GovernanceEngine& Governance() { return governance_; }

    const LedgerOptions& Options() const { return options_; }
    const Address& PoolAddress() const { return revenue_.PoolAddress(); }

    /// Register a payment ledger; its Id() becomes the currency id
    void AddCurrency(std::shared_ptr<token::IPaymentLedger> ledger);

private:
    LedgerOptions options_;

    EventJournal journal_;
    LedgerGuard guard_;
    token::PaymentRegistry payments_;
    std::shared_ptr<token::IAssetTokenLedger> assetTokens_;

    ownership::OwnershipLedger ownership_;
    asset::AssetRegistry assets_;
    governance::SettingsRegistry settings_;
    revenue::RevenuePool revenue_;
    license::LicenseRegistry licenses_;
    governance::GovernanceEngine governance_;
};

} // namespace ledger
} // namespace commonip

#endif // COMMONIP_LEDGER_LEDGER_H
