// COMMONIP - Collective Ledger Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/ledger/ledger.h>
#include <commonip/util/logging.h>

namespace commonip {
namespace ledger {

CollectiveLedger::CollectiveLedger(const Address& admin, const LedgerOptions& options)
    : CollectiveLedger(admin, std::make_shared<token::MemoryAssetTokenLedger>(), options) {}

CollectiveLedger::CollectiveLedger(const Address& admin,
                                   std::shared_ptr<token::IAssetTokenLedger> assetTokens,
                                   const LedgerOptions& options)
    : options_(options),
      guard_(admin, journal_),
      assetTokens_(std::move(assetTokens)),
      ownership_(guard_, journal_),
      assets_(guard_, journal_, ownership_, *assetTokens_, options_.initialSupply),
      settings_(options_.governance),
      revenue_(guard_, journal_, ownership_, payments_, options_.ResolvePoolAddress()),
      licenses_(guard_, journal_, ownership_, revenue_, payments_, settings_, options_.license),
      governance_(guard_, journal_, ownership_, assets_, revenue_, licenses_, settings_) {
    LOG_INFO(util::LogCategory::LEDGER) << "Collective ledger ready, admin "
                                        << admin.ToShortHex() << ", pool "
                                        << revenue_.PoolAddress().ToShortHex();
}

void CollectiveLedger::AddCurrency(std::shared_ptr<token::IPaymentLedger> ledger) {
    LOG_INFO(util::LogCategory::LEDGER) << "Currency " << ledger->Symbol() << " registered as "
                                        << ledger->Id().ToShortHex();
    payments_.Register(std::move(ledger));
}

} // namespace ledger
} // namespace commonip
