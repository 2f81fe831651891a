// COMMONIP - Ledger Guard
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Pre-call checks shared by every mutating entry point:
// - the global pause flag
// - a single in-flight marker that rejects nested calls
// - the administrator identity for pause control
//
// Each public mutating operation opens a Scope first and returns
// scope.Status() when the scope is not Ok(). Internal routines invoked by
// an operation that already holds the scope do not enter again.

#ifndef COMMONIP_LEDGER_GUARD_H
#define COMMONIP_LEDGER_GUARD_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/ledger/events.h>

#include <mutex>
#include <string>

namespace commonip {
namespace ledger {

class LedgerGuard {
public:
    /**
     * Held for the duration of one operation. Serializes operations across
     * threads; a second Enter() from the same thread while a scope is open
     * fails with REENTRANT_CALL.
     */
    class Scope {
    public:
        Scope(Scope&& other) noexcept;
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope& operator=(Scope&&) = delete;

        bool Ok() const { return status_.IsOk(); }
        const Result& Status() const { return status_; }

    private:
        friend class LedgerGuard;
        Scope(LedgerGuard* owner, std::unique_lock<std::recursive_mutex> lock, Result status);

        std::unique_lock<std::recursive_mutex> lock_;
        LedgerGuard* owner_;  // Set when this scope holds the in-flight marker
        Result status_;
    };

    LedgerGuard(const Address& admin, EventJournal& journal);

    /// Open a scope for a mutating operation: pause check, then reentrancy
    Scope Enter(const char* operation);

    /// Administrator pause
    Result Pause(const Address& caller, const std::string& reason = "");

    /// Administrator unpause; the only mutating call allowed while paused
    Result Unpause(const Address& caller);

    /// Set the pause flag from inside an open scope (emergency execution)
    void TripPause(const Address& actor, const std::string& reason);

    bool IsPaused() const;
    bool InCall() const;
    std::string PauseReason() const;
    std::string CurrentOperation() const;

    const Address& Admin() const { return admin_; }
    bool IsAdmin(const Address& caller) const { return caller == admin_; }

private:
    Scope Acquire(const char* operation, bool checkPause);

    mutable std::recursive_mutex mutex_;
    EventJournal& journal_;
    Address admin_;
    bool paused_{false};
    bool inCall_{false};
    std::string operation_;
    std::string pauseReason_;
};

/// Log a rejected operation at Debug level and build its Result
Result Reject(const char* category, const char* operation, ErrorCode code,
              const std::string& detail = "");

} // namespace ledger
} // namespace commonip

#endif // COMMONIP_LEDGER_GUARD_H
