// COMMONIP - Error Codes and Operation Results
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Every mutating ledger operation returns a Result. A failed Result carries
// one fine-grained ErrorCode; each code belongs to exactly one ErrorKind.

#ifndef COMMONIP_CORE_ERROR_H
#define COMMONIP_CORE_ERROR_H

#include <cstdint>
#include <optional>
#include <string>

namespace commonip {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    OK,
    Validation,         // Malformed input
    Authorization,      // Caller lacks the required role
    State,              // Operation invalid for the current state
    InsufficientFunds,  // Balance, allowance or pool too low
    Reentrancy          // Nested call during another mutating call
};

const char* ErrorKindToString(ErrorKind kind);

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    OK = 0,

    // Validation
    LENGTH_MISMATCH,
    EMPTY_OWNER_LIST,
    PERCENTAGE_SUM_INVALID,
    PERCENTAGE_OUT_OF_RANGE,
    DUPLICATE_OWNER,
    NULL_ADDRESS,
    INVALID_AMOUNT,
    AMOUNT_OVERFLOW,
    WEIGHT_OVERFLOW,
    ROYALTY_RATE_OUT_OF_RANGE,
    QUORUM_OUT_OF_RANGE,
    EMERGENCY_QUORUM_TOO_HIGH,
    EXECUTION_DELAY_TOO_SHORT,
    INVALID_DURATION,
    BELOW_MINIMUM_DISTRIBUTION,
    INVALID_PAYLOAD,
    SELF_TRANSFER,
    UNKNOWN_CURRENCY,

    // Authorization
    NOT_ASSET_OWNER,
    NOT_LICENSEE,
    NOT_PROPOSER,
    NOT_ADMIN,
    NOT_SHARE_HOLDER,
    NO_GOVERNANCE_RIGHTS,

    // State
    SYSTEM_PAUSED,
    NOT_PAUSED,
    ASSET_NOT_FOUND,
    NO_OWNERSHIP_RECORD,
    LICENSE_NOT_FOUND,
    APPROVAL_NOT_REQUIRED,
    APPROVAL_ALREADY_RESOLVED,
    LICENSE_NOT_APPROVED,
    LICENSE_ALREADY_ACTIVE,
    LICENSE_NOT_ACTIVE,
    LICENSE_EXPIRED,
    LICENSE_REVOKED,
    LICENSE_NOT_SUSPENDED,
    SUSPENSION_NOT_ELAPSED,
    LICENSE_ASSET_MISMATCH,
    USAGE_LIMIT_REACHED,
    ROYALTIES_NOT_STARTED,
    PROPOSAL_NOT_FOUND,
    PROPOSAL_ALREADY_EXECUTED,
    PROPOSAL_CANCELLED,
    ALREADY_VOTED,
    VOTING_CLOSED,
    VOTING_NOT_ENDED,
    EXECUTION_WINDOW_CLOSED,
    QUORUM_NOT_REACHED,
    MAJORITY_NOT_REACHED,
    CATEGORY_MISMATCH,

    // Insufficient funds
    INSUFFICIENT_SHARE,
    INSUFFICIENT_ACCUMULATED,
    NOTHING_TO_WITHDRAW,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_ALLOWANCE,

    // Reentrancy
    REENTRANT_CALL
};

/// Stable human-readable message for a code
const char* ErrorCodeToString(ErrorCode code);

/// Symbolic name of a code ("NOT_ASSET_OWNER")
const char* ErrorCodeName(ErrorCode code);

/// Parse a symbolic name back to its code
std::optional<ErrorCode> ParseErrorCode(const std::string& name);

/// Kind a code belongs to
ErrorKind KindOf(ErrorCode code);

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Outcome of a ledger operation. On success `id` holds the identifier the
 * operation created (asset, license or proposal), or zero.
 */
struct Result {
    ErrorCode code{ErrorCode::OK};
    std::string reason;
    uint64_t id{0};

    bool IsOk() const { return code == ErrorCode::OK; }
    ErrorKind Kind() const { return KindOf(code); }

    static Result Success(uint64_t createdId = 0) {
        Result r;
        r.id = createdId;
        return r;
    }

    static Result Error(ErrorCode errorCode, const std::string& detail = "") {
        Result r;
        r.code = errorCode;
        r.reason = ErrorCodeToString(errorCode);
        if (!detail.empty()) {
            r.reason += ": " + detail;
        }
        return r;
    }

    std::string ToString() const;
};

} // namespace commonip

#endif // COMMONIP_CORE_ERROR_H
