// COMMONIP - Payment Token Ledgers Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/token/payment.h>
#include <commonip/crypto/sha256.h>
#include <commonip/util/logging.h>

namespace commonip {
namespace token {

// ============================================================================
// MemoryPaymentLedger
// ============================================================================

MemoryPaymentLedger::MemoryPaymentLedger(const std::string& symbol)
    : symbol_(symbol)
    , id_(AddressFromLabel("commonip.currency." + symbol)) {}

Result MemoryPaymentLedger::MoveLocked(const Address& from, const Address& to, Amount amount) {
    if (amount <= 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    if (to.IsNull()) {
        return Result::Error(ErrorCode::NULL_ADDRESS, "transfer recipient");
    }
    Amount& fromBalance = balances_[from];
    if (fromBalance < amount) {
        return Result::Error(ErrorCode::INSUFFICIENT_BALANCE, symbol_);
    }
    if (from == to) {
        return Result::Success();
    }
    Amount newTo = 0;
    if (!CheckedAdd(balances_[to], amount, newTo)) {
        return Result::Error(ErrorCode::AMOUNT_OVERFLOW, symbol_);
    }
    fromBalance -= amount;
    balances_[to] = newTo;
    return Result::Success();
}

void MemoryPaymentLedger::FireHook(const Address& from, const Address& to, Amount amount) {
    TransferHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = hook_;
    }
    if (hook) {
        hook(from, to, amount);
    }
}

Result MemoryPaymentLedger::TransferFrom(const Address& spender, const Address& from,
                                         const Address& to, Amount amount) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::make_pair(from, spender);
        Amount allowed = 0;
        auto it = allowances_.find(key);
        if (it != allowances_.end()) {
            allowed = it->second;
        }
        if (amount > 0 && allowed < amount) {
            return Result::Error(ErrorCode::INSUFFICIENT_ALLOWANCE, symbol_);
        }
        Result moved = MoveLocked(from, to, amount);
        if (!moved.IsOk()) {
            return moved;
        }
        allowances_[key] = allowed - amount;
    }
    LOG_TRACE(util::LogCategory::TOKEN) << symbol_ << " pulled " << amount
                                        << " from " << from.ToShortHex();
    FireHook(from, to, amount);
    return Result::Success();
}

Result MemoryPaymentLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Result moved = MoveLocked(from, to, amount);
        if (!moved.IsOk()) {
            return moved;
        }
    }
    LOG_TRACE(util::LogCategory::TOKEN) << symbol_ << " sent " << amount
                                        << " to " << to.ToShortHex();
    FireHook(from, to, amount);
    return Result::Success();
}

Amount MemoryPaymentLedger::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryPaymentLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find(std::make_pair(owner, spender));
    return it == allowances_.end() ? 0 : it->second;
}

Result MemoryPaymentLedger::Mint(const Address& holder, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount <= 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    if (holder.IsNull()) {
        return Result::Error(ErrorCode::NULL_ADDRESS, "mint recipient");
    }
    Amount newSupply = 0;
    Amount newBalance = 0;
    if (!CheckedAdd(totalSupply_, amount, newSupply) ||
        !CheckedAdd(balances_[holder], amount, newBalance)) {
        return Result::Error(ErrorCode::AMOUNT_OVERFLOW, symbol_);
    }
    totalSupply_ = newSupply;
    balances_[holder] = newBalance;
    return Result::Success();
}

Result MemoryPaymentLedger::Approve(const Address& owner, const Address& spender, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT);
    }
    allowances_[std::make_pair(owner, spender)] = amount;
    return Result::Success();
}

void MemoryPaymentLedger::SetTransferHook(TransferHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

Amount MemoryPaymentLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

// ============================================================================
// PaymentRegistry
// ============================================================================

void PaymentRegistry::Register(std::shared_ptr<IPaymentLedger> ledger) {
    if (!ledger) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    CurrencyId id = ledger->Id();
    LOG_DEBUG(util::LogCategory::TOKEN) << "Registered currency " << ledger->Symbol()
                                        << " (" << id.ToShortHex() << ")";
    ledgers_[id] = std::move(ledger);
}

std::shared_ptr<IPaymentLedger> PaymentRegistry::Get(const CurrencyId& currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ledgers_.find(currency);
    return it == ledgers_.end() ? nullptr : it->second;
}

bool PaymentRegistry::Has(const CurrencyId& currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledgers_.count(currency) != 0;
}

std::vector<CurrencyId> PaymentRegistry::GetCurrencies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CurrencyId> result;
    result.reserve(ledgers_.size());
    for (const auto& [id, ledger] : ledgers_) {
        result.push_back(id);
    }
    return result;
}

} // namespace token
} // namespace commonip
