// COMMONIP - Payment Token Ledgers
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Fungible payment tokens are external collaborators. The ledger only needs
// allowance-based pulls into its pool and plain transfers out of it.

#ifndef COMMONIP_TOKEN_PAYMENT_H
#define COMMONIP_TOKEN_PAYMENT_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace commonip {
namespace token {

// ============================================================================
// Payment Ledger Interface
// ============================================================================

/**
 * Allowance/transfer primitives of one payment currency.
 */
class IPaymentLedger {
public:
    virtual ~IPaymentLedger() = default;

    /// Move `amount` from `from` to `to`, spending `spender`'s allowance
    virtual Result TransferFrom(const Address& spender, const Address& from,
                                const Address& to, Amount amount) = 0;

    /// Move `amount` held by `from` to `to`
    virtual Result Transfer(const Address& from, const Address& to, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& holder) const = 0;

    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;

    /// Address identifying this currency
    virtual const CurrencyId& Id() const = 0;

    virtual const std::string& Symbol() const = 0;
};

// ============================================================================
// In-Memory Payment Ledger
// ============================================================================

/**
 * Self-contained payment ledger with ERC-20 style allowances. Used by
 * embedders without an external token system and by the test suite.
 */
class MemoryPaymentLedger : public IPaymentLedger {
public:
    /// Invoked after every successful transfer, outside the ledger lock
    using TransferHook = std::function<void(const Address& from, const Address& to, Amount amount)>;

    explicit MemoryPaymentLedger(const std::string& symbol);

    Result TransferFrom(const Address& spender, const Address& from,
                        const Address& to, Amount amount) override;
    Result Transfer(const Address& from, const Address& to, Amount amount) override;
    Amount BalanceOf(const Address& holder) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;
    const CurrencyId& Id() const override { return id_; }
    const std::string& Symbol() const override { return symbol_; }

    /// Create new units out of thin air
    Result Mint(const Address& holder, Amount amount);

    /// Set `spender`'s allowance over `owner`'s balance
    Result Approve(const Address& owner, const Address& spender, Amount amount);

    void SetTransferHook(TransferHook hook);

    Amount TotalSupply() const;

private:
    Result MoveLocked(const Address& from, const Address& to, Amount amount);
    void FireHook(const Address& from, const Address& to, Amount amount);

    std::string symbol_;
    CurrencyId id_;
    mutable std::mutex mutex_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};
    TransferHook hook_;
};

// ============================================================================
// Payment Registry
// ============================================================================

/**
 * Currency id -> payment ledger lookup.
 */
class PaymentRegistry {
public:
    /// Register a ledger under its own id; replaces an existing entry
    void Register(std::shared_ptr<IPaymentLedger> ledger);

    /// Nullptr when the currency is unknown
    std::shared_ptr<IPaymentLedger> Get(const CurrencyId& currency) const;

    bool Has(const CurrencyId& currency) const;

    std::vector<CurrencyId> GetCurrencies() const;

private:
    mutable std::mutex mutex_;
    std::map<CurrencyId, std::shared_ptr<IPaymentLedger>> ledgers_;
};

} // namespace token
} // namespace commonip

#endif // COMMONIP_TOKEN_PAYMENT_H
