// COMMONIP - Ledger Guard Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/ledger/guard.h>
#include <commonip/util/logging.h>

namespace commonip {
namespace ledger {

// ============================================================================
// Scope
// ============================================================================

LedgerGuard::Scope::Scope(LedgerGuard* owner, std::unique_lock<std::recursive_mutex> lock,
                          Result status)
    : lock_(std::move(lock)), owner_(owner), status_(std::move(status)) {}

LedgerGuard::Scope::Scope(Scope&& other) noexcept
    : lock_(std::move(other.lock_)), owner_(other.owner_), status_(std::move(other.status_)) {
    other.owner_ = nullptr;
}

LedgerGuard::Scope::~Scope() {
    if (owner_) {
        owner_->inCall_ = false;
        owner_->operation_.clear();
    }
}

// ============================================================================
// LedgerGuard
// ============================================================================

LedgerGuard::LedgerGuard(const Address& admin, EventJournal& journal)
    : journal_(journal), admin_(admin) {}

LedgerGuard::Scope LedgerGuard::Acquire(const char* operation, bool checkPause) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    if (inCall_) {
        LOG_WARN(util::LogCategory::LEDGER) << "Rejected nested call " << operation
                                            << " during " << operation_;
        return Scope(nullptr, std::move(lock),
                     Result::Error(ErrorCode::REENTRANT_CALL, operation_));
    }
    if (checkPause && paused_) {
        LOG_DEBUG(util::LogCategory::LEDGER) << operation << " rejected: ledger paused";
        return Scope(nullptr, std::move(lock), Result::Error(ErrorCode::SYSTEM_PAUSED));
    }

    inCall_ = true;
    operation_ = operation;
    return Scope(this, std::move(lock), Result::Success());
}

LedgerGuard::Scope LedgerGuard::Enter(const char* operation) {
    return Acquire(operation, true);
}

Result LedgerGuard::Pause(const Address& caller, const std::string& reason) {
    auto scope = Acquire("Pause", true);
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!IsAdmin(caller)) {
        return Reject(util::LogCategory::LEDGER, "Pause", ErrorCode::NOT_ADMIN);
    }
    TripPause(caller, reason.empty() ? "administrator" : reason);
    return Result::Success();
}

Result LedgerGuard::Unpause(const Address& caller) {
    auto scope = Acquire("Unpause", false);
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!IsAdmin(caller)) {
        return Reject(util::LogCategory::LEDGER, "Unpause", ErrorCode::NOT_ADMIN);
    }
    if (!paused_) {
        return Reject(util::LogCategory::LEDGER, "Unpause", ErrorCode::NOT_PAUSED);
    }

    paused_ = false;
    pauseReason_.clear();
    journal_.Record(EventType::Unpaused, 0, 0, caller);
    LOG_WARN(util::LogCategory::LEDGER) << "Ledger unpaused by " << caller.ToShortHex();
    return Result::Success();
}

void LedgerGuard::TripPause(const Address& actor, const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    paused_ = true;
    pauseReason_ = reason;
    journal_.Record(EventType::Paused, 0, 0, actor, 0, reason);
    LOG_WARN(util::LogCategory::LEDGER) << "Ledger paused: " << reason;
}

bool LedgerGuard::IsPaused() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return paused_;
}

bool LedgerGuard::InCall() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return inCall_;
}

std::string LedgerGuard::PauseReason() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pauseReason_;
}

std::string LedgerGuard::CurrentOperation() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return operation_;
}

// ============================================================================
// Helpers
// ============================================================================

Result Reject(const char* category, const char* operation, ErrorCode code,
              const std::string& detail) {
    Result result = Result::Error(code, detail);
    LOG_DEBUG(category) << operation << " rejected: " << ErrorCodeName(code)
                        << (detail.empty() ? "" : " (" + detail + ")");
    return result;
}

} // namespace ledger
} // namespace commonip
