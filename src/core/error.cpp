// COMMONIP - Error Codes Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include "commonip/core/error.h"

namespace commonip {

namespace {

struct CodeInfo {
    ErrorCode code;
    const char* name;
    const char* message;
    ErrorKind kind;
};

// Order matches the ErrorCode enumeration.
const CodeInfo CODE_TABLE[] = {
    {ErrorCode::OK, "OK", "OK", ErrorKind::OK},

    {ErrorCode::LENGTH_MISMATCH, "LENGTH_MISMATCH", "Array length mismatch", ErrorKind::Validation},
    {ErrorCode::EMPTY_OWNER_LIST, "EMPTY_OWNER_LIST", "No owners", ErrorKind::Validation},
    {ErrorCode::PERCENTAGE_SUM_INVALID, "PERCENTAGE_SUM_INVALID", "Percentages must sum to 100", ErrorKind::Validation},
    {ErrorCode::PERCENTAGE_OUT_OF_RANGE, "PERCENTAGE_OUT_OF_RANGE", "Percentage out of range", ErrorKind::Validation},
    {ErrorCode::DUPLICATE_OWNER, "DUPLICATE_OWNER", "Duplicate owner", ErrorKind::Validation},
    {ErrorCode::NULL_ADDRESS, "NULL_ADDRESS", "Zero address", ErrorKind::Validation},
    {ErrorCode::INVALID_AMOUNT, "INVALID_AMOUNT", "Amount>0", ErrorKind::Validation},
    {ErrorCode::AMOUNT_OVERFLOW, "AMOUNT_OVERFLOW", "Amount overflow", ErrorKind::Validation},
    {ErrorCode::WEIGHT_OVERFLOW, "WEIGHT_OVERFLOW", "Governance weight overflow", ErrorKind::Validation},
    {ErrorCode::ROYALTY_RATE_OUT_OF_RANGE, "ROYALTY_RATE_OUT_OF_RANGE", "Royalty rate above 100%", ErrorKind::Validation},
    {ErrorCode::QUORUM_OUT_OF_RANGE, "QUORUM_OUT_OF_RANGE", "Quorum out of range", ErrorKind::Validation},
    {ErrorCode::EMERGENCY_QUORUM_TOO_HIGH, "EMERGENCY_QUORUM_TOO_HIGH", "Emergency quorum above default quorum", ErrorKind::Validation},
    {ErrorCode::EXECUTION_DELAY_TOO_SHORT, "EXECUTION_DELAY_TOO_SHORT", "Execution delay below one hour", ErrorKind::Validation},
    {ErrorCode::INVALID_DURATION, "INVALID_DURATION", "Invalid duration", ErrorKind::Validation},
    {ErrorCode::BELOW_MINIMUM_DISTRIBUTION, "BELOW_MINIMUM_DISTRIBUTION", "Below minimum distribution", ErrorKind::Validation},
    {ErrorCode::INVALID_PAYLOAD, "INVALID_PAYLOAD", "Payload does not match category", ErrorKind::Validation},
    {ErrorCode::SELF_TRANSFER, "SELF_TRANSFER", "Source and destination are equal", ErrorKind::Validation},
    {ErrorCode::UNKNOWN_CURRENCY, "UNKNOWN_CURRENCY", "Unknown currency", ErrorKind::Validation},

    {ErrorCode::NOT_ASSET_OWNER, "NOT_ASSET_OWNER", "Not asset owner", ErrorKind::Authorization},
    {ErrorCode::NOT_LICENSEE, "NOT_LICENSEE", "Not licensee", ErrorKind::Authorization},
    {ErrorCode::NOT_PROPOSER, "NOT_PROPOSER", "Not proposer", ErrorKind::Authorization},
    {ErrorCode::NOT_ADMIN, "NOT_ADMIN", "Not administrator", ErrorKind::Authorization},
    {ErrorCode::NOT_SHARE_HOLDER, "NOT_SHARE_HOLDER", "Caller is not the share holder", ErrorKind::Authorization},
    {ErrorCode::NO_GOVERNANCE_RIGHTS, "NO_GOVERNANCE_RIGHTS", "No governance rights", ErrorKind::Authorization},

    {ErrorCode::SYSTEM_PAUSED, "SYSTEM_PAUSED", "Ledger paused", ErrorKind::State},
    {ErrorCode::NOT_PAUSED, "NOT_PAUSED", "Ledger not paused", ErrorKind::State},
    {ErrorCode::ASSET_NOT_FOUND, "ASSET_NOT_FOUND", "Asset not found", ErrorKind::State},
    {ErrorCode::NO_OWNERSHIP_RECORD, "NO_OWNERSHIP_RECORD", "Asset has no ownership record", ErrorKind::State},
    {ErrorCode::LICENSE_NOT_FOUND, "LICENSE_NOT_FOUND", "License not found", ErrorKind::State},
    {ErrorCode::APPROVAL_NOT_REQUIRED, "APPROVAL_NOT_REQUIRED", "Approval not required", ErrorKind::State},
    {ErrorCode::APPROVAL_ALREADY_RESOLVED, "APPROVAL_ALREADY_RESOLVED", "Approval already resolved", ErrorKind::State},
    {ErrorCode::LICENSE_NOT_APPROVED, "LICENSE_NOT_APPROVED", "Not approved", ErrorKind::State},
    {ErrorCode::LICENSE_ALREADY_ACTIVE, "LICENSE_ALREADY_ACTIVE", "License already active", ErrorKind::State},
    {ErrorCode::LICENSE_NOT_ACTIVE, "LICENSE_NOT_ACTIVE", "License not active", ErrorKind::State},
    {ErrorCode::LICENSE_EXPIRED, "LICENSE_EXPIRED", "License expired", ErrorKind::State},
    {ErrorCode::LICENSE_REVOKED, "LICENSE_REVOKED", "License revoked", ErrorKind::State},
    {ErrorCode::LICENSE_NOT_SUSPENDED, "LICENSE_NOT_SUSPENDED", "License not suspended", ErrorKind::State},
    {ErrorCode::SUSPENSION_NOT_ELAPSED, "SUSPENSION_NOT_ELAPSED", "Suspension period not elapsed", ErrorKind::State},
    {ErrorCode::LICENSE_ASSET_MISMATCH, "LICENSE_ASSET_MISMATCH", "License belongs to another asset", ErrorKind::State},
    {ErrorCode::USAGE_LIMIT_REACHED, "USAGE_LIMIT_REACHED", "Usage limit reached", ErrorKind::State},
    {ErrorCode::ROYALTIES_NOT_STARTED, "ROYALTIES_NOT_STARTED", "License never activated", ErrorKind::State},
    {ErrorCode::PROPOSAL_NOT_FOUND, "PROPOSAL_NOT_FOUND", "Proposal not found", ErrorKind::State},
    {ErrorCode::PROPOSAL_ALREADY_EXECUTED, "PROPOSAL_ALREADY_EXECUTED", "Proposal already executed", ErrorKind::State},
    {ErrorCode::PROPOSAL_CANCELLED, "PROPOSAL_CANCELLED", "Proposal cancelled", ErrorKind::State},
    {ErrorCode::ALREADY_VOTED, "ALREADY_VOTED", "Already voted", ErrorKind::State},
    {ErrorCode::VOTING_CLOSED, "VOTING_CLOSED", "Voting period ended", ErrorKind::State},
    {ErrorCode::VOTING_NOT_ENDED, "VOTING_NOT_ENDED", "Voting period not ended", ErrorKind::State},
    {ErrorCode::EXECUTION_WINDOW_CLOSED, "EXECUTION_WINDOW_CLOSED", "Execution window closed", ErrorKind::State},
    {ErrorCode::QUORUM_NOT_REACHED, "QUORUM_NOT_REACHED", "Quorum not reached", ErrorKind::State},
    {ErrorCode::MAJORITY_NOT_REACHED, "MAJORITY_NOT_REACHED", "Majority not reached", ErrorKind::State},
    {ErrorCode::CATEGORY_MISMATCH, "CATEGORY_MISMATCH", "Wrong proposal category", ErrorKind::State},

    {ErrorCode::INSUFFICIENT_SHARE, "INSUFFICIENT_SHARE", "Insufficient ownership share", ErrorKind::InsufficientFunds},
    {ErrorCode::INSUFFICIENT_ACCUMULATED, "INSUFFICIENT_ACCUMULATED", "Insufficient accumulated revenue", ErrorKind::InsufficientFunds},
    {ErrorCode::NOTHING_TO_WITHDRAW, "NOTHING_TO_WITHDRAW", "Nothing to withdraw", ErrorKind::InsufficientFunds},
    {ErrorCode::INSUFFICIENT_BALANCE, "INSUFFICIENT_BALANCE", "Insufficient balance", ErrorKind::InsufficientFunds},
    {ErrorCode::INSUFFICIENT_ALLOWANCE, "INSUFFICIENT_ALLOWANCE", "Insufficient allowance", ErrorKind::InsufficientFunds},

    {ErrorCode::REENTRANT_CALL, "REENTRANT_CALL", "Reentrant call", ErrorKind::Reentrancy},
};

constexpr size_t CODE_COUNT = sizeof(CODE_TABLE) / sizeof(CODE_TABLE[0]);

const CodeInfo* Lookup(ErrorCode code) {
    size_t idx = static_cast<size_t>(code);
    if (idx < CODE_COUNT && CODE_TABLE[idx].code == code) {
        return &CODE_TABLE[idx];
    }
    return nullptr;
}

} // namespace

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OK: return "OK";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Authorization: return "AuthorizationError";
        case ErrorKind::State: return "StateError";
        case ErrorKind::InsufficientFunds: return "InsufficientFundsError";
        case ErrorKind::Reentrancy: return "ReentrancyError";
        default: return "Unknown";
    }
}

const char* ErrorCodeToString(ErrorCode code) {
    const CodeInfo* info = Lookup(code);
    return info ? info->message : "Unknown error";
}

const char* ErrorCodeName(ErrorCode code) {
    const CodeInfo* info = Lookup(code);
    return info ? info->name : "UNKNOWN";
}

std::optional<ErrorCode> ParseErrorCode(const std::string& name) {
    for (const auto& info : CODE_TABLE) {
        if (name == info.name) {
            return info.code;
        }
    }
    return std::nullopt;
}

ErrorKind KindOf(ErrorCode code) {
    const CodeInfo* info = Lookup(code);
    return info ? info->kind : ErrorKind::State;
}

std::string Result::ToString() const {
    if (IsOk()) {
        return id != 0 ? "OK (id=" + std::to_string(id) + ")" : "OK";
    }
    return std::string(ErrorKindToString(Kind())) + "/" + ErrorCodeName(code) +
           ": " + reason;
}

} // namespace commonip
