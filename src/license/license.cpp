// COMMONIP - License Registry Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/license/license.h>
#include <commonip/crypto/sha256.h>
#include <commonip/util/logging.h>

#include <algorithm>
#include <limits>
#include <sstream>

namespace commonip {
namespace license {

using ledger::EventType;
using ledger::Reject;

namespace {
const char* CATEGORY = util::LogCategory::LICENSE;
}

// ============================================================================
// Enum Helpers
// ============================================================================

const char* LicenseTypeToString(LicenseType type) {
    switch (type) {
        case LicenseType::NonExclusive: return "NonExclusive";
        case LicenseType::Exclusive: return "Exclusive";
        case LicenseType::SoleExclusive: return "SoleExclusive";
        default: return "Unknown";
    }
}

std::optional<LicenseType> ParseLicenseType(const std::string& str) {
    if (str == "NonExclusive" || str == "nonexclusive") return LicenseType::NonExclusive;
    if (str == "Exclusive" || str == "exclusive") return LicenseType::Exclusive;
    if (str == "SoleExclusive" || str == "soleexclusive") return LicenseType::SoleExclusive;
    return std::nullopt;
}

bool IsExclusiveType(LicenseType type) {
    return type == LicenseType::Exclusive || type == LicenseType::SoleExclusive;
}

const char* LicenseStatusToString(LicenseStatus status) {
    switch (status) {
        case LicenseStatus::NotFound: return "NotFound";
        case LicenseStatus::PendingApproval: return "PendingApproval";
        case LicenseStatus::Revoked: return "Revoked";
        case LicenseStatus::Inactive: return "Inactive";
        case LicenseStatus::Suspended: return "Suspended";
        case LicenseStatus::SuspensionExpired: return "SuspensionExpired";
        case LicenseStatus::Expired: return "Expired";
        case LicenseStatus::Active: return "Active";
        default: return "Unknown";
    }
}

std::optional<LicenseStatus> ParseLicenseStatus(const std::string& str) {
    static const LicenseStatus all[] = {
        LicenseStatus::NotFound, LicenseStatus::PendingApproval, LicenseStatus::Revoked,
        LicenseStatus::Inactive, LicenseStatus::Suspended, LicenseStatus::SuspensionExpired,
        LicenseStatus::Expired, LicenseStatus::Active};
    for (LicenseStatus status : all) {
        if (str == LicenseStatusToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::string License::ToString() const {
    std::ostringstream oss;
    oss << "License(id=" << id << ", asset=" << asset << ", " << LicenseTypeToString(type)
        << ", licensee=" << licensee.ToShortHex() << ", fee=" << fee
        << ", royalty=" << royaltyBps << "bps";
    if (endTime != 0) {
        oss << ", ends " << util::FormatISO8601(endTime);
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

LicenseRegistry::LicenseRegistry(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                                 const ownership::OwnershipLedger& owners,
                                 revenue::RevenuePool& pool, token::PaymentRegistry& payments,
                                 const governance::SettingsRegistry& settings,
                                 const LicenseOptions& options)
    : guard_(guard), journal_(journal), owners_(owners), pool_(pool), payments_(payments),
      settings_(settings), options_(options) {}

License* LicenseRegistry::FindLicense(LicenseId id) {
    auto it = licenses_.find(id);
    return it == licenses_.end() ? nullptr : &it->second;
}

const License* LicenseRegistry::FindLicense(LicenseId id) const {
    auto it = licenses_.find(id);
    return it == licenses_.end() ? nullptr : &it->second;
}

Result LicenseRegistry::ValidateOffer(const LicenseOffer& offer) const {
    if (offer.licensee.IsNull()) {
        return Result::Error(ErrorCode::NULL_ADDRESS, "licensee");
    }
    if (offer.royaltyBps > BPS_DENOMINATOR ||
        offer.terms.commercialRevenueShareBps > BPS_DENOMINATOR) {
        return Result::Error(ErrorCode::ROYALTY_RATE_OUT_OF_RANGE);
    }
    if (offer.fee < 0) {
        return Result::Error(ErrorCode::INVALID_AMOUNT, "fee");
    }
    if (offer.durationSeconds < 0 || offer.terms.terminationNoticePeriod < 0) {
        return Result::Error(ErrorCode::INVALID_DURATION);
    }
    Timestamp endTime = 0;
    if (!CheckedDeadline(util::GetTime(), offer.durationSeconds, endTime)) {
        return Result::Error(ErrorCode::INVALID_DURATION, "license end out of range");
    }
    if ((offer.fee > 0 || offer.royaltyBps > 0) && !payments_.Has(offer.currency)) {
        return Result::Error(ErrorCode::UNKNOWN_CURRENCY, offer.currency.ToShortHex());
    }
    return Result::Success();
}

LicenseId LicenseRegistry::CreateLicenseLocked(AssetId asset, const Address& licensor,
                                               const LicenseOffer& offer, bool preApproved) {
    Timestamp now = util::GetTime();

    License license;
    license.id = nextLicenseId_++;
    license.asset = asset;
    license.licensor = licensor;
    license.licensee = offer.licensee;
    license.type = offer.type;
    license.usageRights = offer.usageRights;
    license.territory = offer.territory;
    license.fee = offer.fee;
    license.royaltyBps = offer.royaltyBps;
    license.startTime = now;
    if (offer.durationSeconds > 0 &&
        !CheckedDeadline(now, offer.durationSeconds, license.endTime)) {
        license.endTime = std::numeric_limits<Timestamp>::max();
    }
    license.currency = offer.currency;
    license.termsUri = offer.termsUri;
    license.termsHash = SHA256Hash(offer.termsUri);
    license.terms = offer.terms;
    license.terms.usageCount = 0;
    license.requiresApproval =
        IsExclusiveType(offer.type) || offer.fee > options_.approvalFeeThreshold;
    license.approved = preApproved || !license.requiresApproval;

    LicenseId id = license.id;
    licenses_.emplace(id, std::move(license));
    return id;
}

// ============================================================================
// Offer and Approval
// ============================================================================

Result LicenseRegistry::CreateOffer(const Address& caller, AssetId asset,
                                    const LicenseOffer& offer) {
    auto scope = guard_.Enter("CreateOffer");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!owners_.HasOwnership(asset)) {
        return Reject(CATEGORY, "CreateOffer", ErrorCode::NO_OWNERSHIP_RECORD);
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "CreateOffer", ErrorCode::NOT_ASSET_OWNER);
    }
    Result valid = ValidateOffer(offer);
    if (!valid.IsOk()) {
        LOG_DEBUG(CATEGORY) << "CreateOffer rejected: " << valid.reason;
        return valid;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    LicenseId id = CreateLicenseLocked(asset, caller, offer, false);
    const License& license = licenses_.at(id);

    journal_.Record(EventType::LicenseOfferCreated, id, asset, caller, offer.fee,
                    LicenseTypeToString(offer.type));
    LOG_INFO(CATEGORY) << "Offered " << license.ToString()
                       << (license.requiresApproval ? " pending approval" : "");
    return Result::Success(id);
}

Result LicenseRegistry::Approve(const Address& caller, LicenseId id, bool approve) {
    auto scope = guard_.Enter("Approve");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "Approve", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (!license->requiresApproval) {
        return Reject(CATEGORY, "Approve", ErrorCode::APPROVAL_NOT_REQUIRED);
    }
    if (license->approved || license->rejected) {
        return Reject(CATEGORY, "Approve", ErrorCode::APPROVAL_ALREADY_RESOLVED);
    }
    if (!owners_.IsOwner(license->asset, caller)) {
        return Reject(CATEGORY, "Approve", ErrorCode::NOT_ASSET_OWNER);
    }

    if (approve) {
        license->approved = true;
        journal_.Record(EventType::LicenseApproved, id, license->asset, caller);
    } else {
        license->rejected = true;
        journal_.Record(EventType::LicenseRejected, id, license->asset, caller);
    }
    LOG_INFO(CATEGORY) << "License " << id << (approve ? " approved" : " rejected") << " by "
                       << caller.ToShortHex();
    return Result::Success(id);
}

// ============================================================================
// Activation
// ============================================================================

Result LicenseRegistry::CollectAndRoute(const char* operation, const License& license,
                                        const Address& payer, Amount amount) {
    auto payment = payments_.Get(license.currency);
    if (!payment) {
        return Reject(CATEGORY, operation, ErrorCode::UNKNOWN_CURRENCY);
    }
    Result check = pool_.CheckRouteFee(license.asset, license.currency, amount);
    if (!check.IsOk()) {
        return Reject(CATEGORY, operation, check.code, check.reason);
    }

    const Address& poolAddress = pool_.PoolAddress();
    Result pulled = payment->TransferFrom(poolAddress, payer, poolAddress, amount);
    if (!pulled.IsOk()) {
        LOG_DEBUG(CATEGORY) << operation << " payment failed: " << pulled.reason;
        return pulled;
    }

    Result routed = pool_.RouteFee(license.asset, license.currency, amount, payer);
    if (!routed.IsOk()) {
        Result refund = payment->Transfer(poolAddress, payer, amount);
        if (!refund.IsOk()) {
            LOG_ERROR(CATEGORY) << operation << ": refund of " << amount << " to "
                                << payer.ToShortHex() << " failed: " << refund.reason;
        }
        return routed;
    }
    return Result::Success();
}

Result LicenseRegistry::Execute(const Address& caller, LicenseId id) {
    auto scope = guard_.Enter("Execute");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "Execute", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (!license->approved) {
        return Reject(CATEGORY, "Execute", ErrorCode::LICENSE_NOT_APPROVED);
    }
    if (caller != license->licensee) {
        return Reject(CATEGORY, "Execute", ErrorCode::NOT_LICENSEE);
    }
    if (license->active || license->suspended) {
        return Reject(CATEGORY, "Execute", ErrorCode::LICENSE_ALREADY_ACTIVE);
    }
    if (license->revoked) {
        return Reject(CATEGORY, "Execute", ErrorCode::LICENSE_REVOKED);
    }
    Timestamp now = util::GetTime();
    if (license->IsExpired(now)) {
        return Reject(CATEGORY, "Execute", ErrorCode::LICENSE_EXPIRED);
    }

    if (license->fee > 0) {
        Result paid = CollectAndRoute("Execute", *license, caller, license->fee);
        if (!paid.IsOk()) {
            return paid;
        }
    }

    license->active = true;
    license->executed = true;

    RoyaltySchedule schedule;
    schedule.paymentInterval = options_.royaltyInterval;
    schedule.nextDue = now + options_.royaltyInterval;
    schedule.holder = license->licensee;
    schedules_[id] = schedule;

    journal_.Record(EventType::LicenseExecuted, id, license->asset, caller, license->fee);
    LOG_INFO(CATEGORY) << "License " << id << " active for " << caller.ToShortHex()
                       << " (fee " << license->fee << ")";
    return Result::Success(id);
}

// ============================================================================
// Revocation, Suspension, Reactivation
// ============================================================================

Result LicenseRegistry::Revoke(const Address& caller, LicenseId id, const std::string& reason) {
    auto scope = guard_.Enter("Revoke");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "Revoke", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (!owners_.IsOwner(license->asset, caller)) {
        return Reject(CATEGORY, "Revoke", ErrorCode::NOT_ASSET_OWNER);
    }
    if (!license->active) {
        return Reject(CATEGORY, "Revoke", ErrorCode::LICENSE_NOT_ACTIVE);
    }

    license->active = false;
    license->revoked = true;
    license->revocationReason = reason;

    journal_.Record(EventType::LicenseRevoked, id, license->asset, caller, 0, reason);
    LOG_INFO(CATEGORY) << "License " << id << " revoked: " << reason;
    return Result::Success(id);
}

bool LicenseRegistry::SuspensionEnd(int64_t durationSeconds, Timestamp& end) {
    return durationSeconds > 0 && CheckedDeadline(util::GetTime(), durationSeconds, end);
}

void LicenseRegistry::SuspendLocked(License& license, Timestamp end, int64_t durationSeconds,
                                    const Address& actor, const char* origin) {
    license.active = false;
    license.suspended = true;
    license.suspensionEnd = end;

    journal_.Record(EventType::LicenseSuspended, license.id, license.asset, actor,
                    durationSeconds, origin);
    LOG_INFO(CATEGORY) << "License " << license.id << " suspended for "
                       << util::FormatDuration(durationSeconds) << " (" << origin << ")";
}

Result LicenseRegistry::Suspend(const Address& caller, LicenseId id, int64_t durationSeconds) {
    auto scope = guard_.Enter("Suspend");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "Suspend", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (!owners_.IsOwner(license->asset, caller)) {
        return Reject(CATEGORY, "Suspend", ErrorCode::NOT_ASSET_OWNER);
    }
    if (!license->active) {
        return Reject(CATEGORY, "Suspend", ErrorCode::LICENSE_NOT_ACTIVE);
    }
    Timestamp end = 0;
    if (!SuspensionEnd(durationSeconds, end)) {
        return Reject(CATEGORY, "Suspend", ErrorCode::INVALID_DURATION);
    }

    SuspendLocked(*license, end, durationSeconds, caller, "owner");
    return Result::Success(id);
}

Result LicenseRegistry::ReactivateLocked(const char* operation, License& license,
                                         const Address& actor) {
    if (license.IsExpired(util::GetTime())) {
        return Reject(CATEGORY, operation, ErrorCode::LICENSE_EXPIRED);
    }
    license.suspended = false;
    license.active = true;
    license.suspensionEnd = 0;

    journal_.Record(EventType::LicenseReactivated, license.id, license.asset, actor, 0,
                    operation);
    LOG_INFO(CATEGORY) << "License " << license.id << " reactivated by "
                       << actor.ToShortHex();
    return Result::Success(license.id);
}

Result LicenseRegistry::CheckAndReactivate(const Address& caller, LicenseId id) {
    auto scope = guard_.Enter("CheckAndReactivate");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "CheckAndReactivate", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (!license->suspended) {
        return Reject(CATEGORY, "CheckAndReactivate", ErrorCode::LICENSE_NOT_SUSPENDED);
    }
    if (util::GetTime() < license->suspensionEnd) {
        return Reject(CATEGORY, "CheckAndReactivate", ErrorCode::SUSPENSION_NOT_ELAPSED,
                      "ends " + util::FormatISO8601(license->suspensionEnd));
    }
    return ReactivateLocked("CheckAndReactivate", *license, caller);
}

Result LicenseRegistry::ManualReactivate(const Address& caller, LicenseId id) {
    auto scope = guard_.Enter("ManualReactivate");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "ManualReactivate", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (!owners_.IsOwner(license->asset, caller)) {
        return Reject(CATEGORY, "ManualReactivate", ErrorCode::NOT_ASSET_OWNER);
    }
    if (!license->suspended) {
        return Reject(CATEGORY, "ManualReactivate", ErrorCode::LICENSE_NOT_SUSPENDED);
    }
    return ReactivateLocked("ManualReactivate", *license, caller);
}

// ============================================================================
// Transfer
// ============================================================================

Result LicenseRegistry::Transfer(const Address& caller, LicenseId id,
                                 const Address& newLicensee) {
    auto scope = guard_.Enter("TransferLicense");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "TransferLicense", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (caller != license->licensee) {
        return Reject(CATEGORY, "TransferLicense", ErrorCode::NOT_LICENSEE);
    }
    if (!license->active) {
        return Reject(CATEGORY, "TransferLicense", ErrorCode::LICENSE_NOT_ACTIVE);
    }
    if (license->IsExpired(util::GetTime())) {
        return Reject(CATEGORY, "TransferLicense", ErrorCode::LICENSE_EXPIRED);
    }
    if (newLicensee.IsNull()) {
        return Reject(CATEGORY, "TransferLicense", ErrorCode::NULL_ADDRESS);
    }
    if (newLicensee == license->licensee) {
        return Reject(CATEGORY, "TransferLicense", ErrorCode::SELF_TRANSFER);
    }

    license->licensee = newLicensee;
    auto scheduleIt = schedules_.find(id);
    if (scheduleIt != schedules_.end()) {
        scheduleIt->second.holder = newLicensee;
    }

    journal_.Record(EventType::LicenseTransferred, id, license->asset, caller, 0,
                    "to " + newLicensee.ToShortHex());
    LOG_INFO(CATEGORY) << "License " << id << " transferred " << caller.ToShortHex() << " -> "
                       << newLicensee.ToShortHex();
    return Result::Success(id);
}

// ============================================================================
// Usage and Royalties
// ============================================================================

Result LicenseRegistry::ReportUsage(const Address& caller, LicenseId id, Amount revenueAmount,
                                    uint64_t usageCount) {
    auto scope = guard_.Enter("ReportUsage");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (caller != license->licensee) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::NOT_LICENSEE);
    }
    if (!license->active) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::LICENSE_NOT_ACTIVE);
    }
    if (license->IsExpired(util::GetTime())) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::LICENSE_EXPIRED);
    }
    if (revenueAmount < 0) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::INVALID_AMOUNT);
    }

    LicenseTerms& terms = license->terms;
    if (terms.usageLimit > 0 &&
        (usageCount > terms.usageLimit || terms.usageCount > terms.usageLimit - usageCount)) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::USAGE_LIMIT_REACHED,
                      std::to_string(terms.usageCount) + "/" + std::to_string(terms.usageLimit));
    }
    RoyaltySchedule& schedule = schedules_[id];
    Amount newReported = 0;
    if (!CheckedAdd(schedule.totalReported, revenueAmount, newReported)) {
        return Reject(CATEGORY, "ReportUsage", ErrorCode::AMOUNT_OVERFLOW);
    }

    terms.usageCount += usageCount;
    schedule.totalReported = newReported;

    journal_.Record(EventType::UsageReported, id, license->asset, caller, revenueAmount,
                    "uses " + std::to_string(usageCount));
    LOG_DEBUG(CATEGORY) << "License " << id << " reported " << revenueAmount << " revenue, "
                        << usageCount << " uses";
    return Result::Success(id);
}

Result LicenseRegistry::PayRoyalties(const Address& caller, LicenseId id, Amount amount) {
    auto scope = guard_.Enter("PayRoyalties");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Reject(CATEGORY, "PayRoyalties", ErrorCode::LICENSE_NOT_FOUND);
    }
    if (caller != license->licensee) {
        return Reject(CATEGORY, "PayRoyalties", ErrorCode::NOT_LICENSEE);
    }
    if (amount <= 0) {
        return Reject(CATEGORY, "PayRoyalties", ErrorCode::INVALID_AMOUNT);
    }
    auto scheduleIt = schedules_.find(id);
    if (!license->executed || scheduleIt == schedules_.end()) {
        return Reject(CATEGORY, "PayRoyalties", ErrorCode::ROYALTIES_NOT_STARTED);
    }
    if (license->revoked) {
        return Reject(CATEGORY, "PayRoyalties", ErrorCode::LICENSE_REVOKED);
    }
    RoyaltySchedule& schedule = scheduleIt->second;
    Amount newPaid = 0;
    if (!CheckedAdd(schedule.totalPaid, amount, newPaid)) {
        return Reject(CATEGORY, "PayRoyalties", ErrorCode::AMOUNT_OVERFLOW);
    }

    Result paid = CollectAndRoute("PayRoyalties", *license, caller, amount);
    if (!paid.IsOk()) {
        return paid;
    }

    Timestamp now = util::GetTime();
    schedule.totalPaid = newPaid;
    schedule.nextDue += schedule.paymentInterval;
    schedule.lastPayment = now;

    journal_.Record(EventType::RoyaltiesPaid, id, license->asset, caller, amount);
    LOG_INFO(CATEGORY) << "License " << id << " paid " << amount << " royalties, next due "
                       << util::FormatISO8601(schedule.nextDue);
    return Result::Success(id);
}

Amount LicenseRegistry::DueRoyalties(LicenseId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const License* license = FindLicense(id);
    auto scheduleIt = schedules_.find(id);
    if (!license || scheduleIt == schedules_.end()) {
        return 0;
    }
    const RoyaltySchedule& schedule = scheduleIt->second;
    Amount owed = MulDivFloor(schedule.totalReported, license->royaltyBps, BPS_DENOMINATOR);
    return std::max<Amount>(0, owed - schedule.totalPaid);
}

// ============================================================================
// Status
// ============================================================================

LicenseStatus LicenseRegistry::GetStatus(LicenseId id) const {
    return GetStatusAt(id, util::GetTime());
}

LicenseStatus LicenseRegistry::GetStatusAt(LicenseId id, Timestamp now) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const License* license = FindLicense(id);
    if (!license) {
        return LicenseStatus::NotFound;
    }
    if (license->requiresApproval && !license->approved) {
        return LicenseStatus::PendingApproval;
    }
    if (license->revoked) {
        return LicenseStatus::Revoked;
    }
    if (!license->active && !license->suspended) {
        return LicenseStatus::Inactive;
    }
    if (license->suspended) {
        return now >= license->suspensionEnd ? LicenseStatus::SuspensionExpired
                                             : LicenseStatus::Suspended;
    }
    if (license->IsExpired(now)) {
        return LicenseStatus::Expired;
    }
    return LicenseStatus::Active;
}

// ============================================================================
// License Proposals
// ============================================================================

Result LicenseRegistry::ProposeLicenseTerms(const Address& caller, AssetId asset,
                                            const LicenseOffer& blueprint,
                                            const std::string& description) {
    auto scope = guard_.Enter("ProposeLicenseTerms");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "ProposeLicenseTerms", ErrorCode::NOT_ASSET_OWNER);
    }
    Result valid = ValidateOffer(blueprint);
    if (!valid.IsOk()) {
        LOG_DEBUG(CATEGORY) << "ProposeLicenseTerms rejected: " << valid.reason;
        return valid;
    }

    governance::GovernanceSettings settings = settings_.Get(asset);
    Timestamp now = util::GetTime();
    Timestamp votingDeadline = 0;
    Timestamp executionDeadline = 0;
    if (!CheckedDeadline(now, options_.proposalVotingDuration, votingDeadline) ||
        !CheckedDeadline(votingDeadline, options_.proposalExecutionWindow,
                         executionDeadline)) {
        return Reject(CATEGORY, "ProposeLicenseTerms", ErrorCode::INVALID_DURATION,
                      "deadline out of range");
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    LicenseProposal proposal;
    proposal.id = nextProposalId_++;
    proposal.asset = asset;
    proposal.proposer = caller;
    proposal.blueprint = blueprint;
    proposal.description = description;
    proposal.descriptionHash = SHA256Hash(description);
    proposal.totalVotingWeight = owners_.GetTotalGovernanceWeight(asset);
    proposal.quorum = ScaleWeight(proposal.totalVotingWeight, settings.licenseQuorumBps,
                                  BPS_DENOMINATOR);
    proposal.votingDeadline = votingDeadline;
    proposal.executionDeadline = executionDeadline;

    uint64_t id = proposal.id;
    journal_.Record(EventType::LicenseProposalCreated, id, asset, caller, 0, description);
    LOG_INFO(CATEGORY) << "License proposal " << id << " on asset " << asset << " (quorum "
                       << proposal.quorum << " of " << proposal.totalVotingWeight << ")";
    proposals_.emplace(id, std::move(proposal));
    return Result::Success(id);
}

Result LicenseRegistry::VoteOnLicenseProposal(const Address& caller, uint64_t proposalId,
                                              bool inFavor) {
    auto scope = guard_.Enter("VoteOnLicenseProposal");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::PROPOSAL_NOT_FOUND);
    }
    LicenseProposal& proposal = it->second;
    if (!owners_.IsOwner(proposal.asset, caller)) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::NOT_ASSET_OWNER);
    }
    if (proposal.executed) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::PROPOSAL_ALREADY_EXECUTED);
    }
    if (proposal.voters.count(caller)) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::ALREADY_VOTED);
    }
    if (util::GetTime() >= proposal.votingDeadline) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::VOTING_CLOSED);
    }
    Weight weight = owners_.GetGovernanceWeight(proposal.asset, caller);
    if (weight == 0) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::NO_GOVERNANCE_RIGHTS);
    }
    Weight& tally = inFavor ? proposal.votesFor : proposal.votesAgainst;
    Weight newTally = 0;
    if (!CheckedAdd(tally, weight, newTally)) {
        return Reject(CATEGORY, "VoteOnLicenseProposal", ErrorCode::WEIGHT_OVERFLOW);
    }

    tally = newTally;
    proposal.voters.insert(caller);

    journal_.Record(EventType::LicenseProposalVoted, proposalId, proposal.asset, caller,
                    static_cast<Amount>(weight), inFavor ? "for" : "against");
    LOG_DEBUG(CATEGORY) << "License proposal " << proposalId << ": " << caller.ToShortHex()
                        << (inFavor ? " for " : " against ") << "with " << weight;
    return Result::Success(proposalId);
}

Result LicenseRegistry::ExecuteLicenseProposal(const Address& caller, uint64_t proposalId) {
    auto scope = guard_.Enter("ExecuteLicenseProposal");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", ErrorCode::PROPOSAL_NOT_FOUND);
    }
    LicenseProposal& proposal = it->second;
    if (proposal.executed) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", ErrorCode::PROPOSAL_ALREADY_EXECUTED);
    }
    Timestamp now = util::GetTime();
    if (now <= proposal.votingDeadline) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", ErrorCode::VOTING_NOT_ENDED);
    }
    if (now > proposal.executionDeadline) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", ErrorCode::EXECUTION_WINDOW_CLOSED);
    }
    if (proposal.votesFor < proposal.quorum &&
        proposal.votesAgainst < proposal.quorum - proposal.votesFor) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", ErrorCode::QUORUM_NOT_REACHED);
    }
    if (proposal.votesFor <= proposal.votesAgainst) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", ErrorCode::MAJORITY_NOT_REACHED);
    }
    Result valid = ValidateOffer(proposal.blueprint);
    if (!valid.IsOk()) {
        return Reject(CATEGORY, "ExecuteLicenseProposal", valid.code, valid.reason);
    }

    LicenseId licenseId =
        CreateLicenseLocked(proposal.asset, proposal.proposer, proposal.blueprint, true);
    proposal.executed = true;
    proposal.resultingLicense = licenseId;

    journal_.Record(EventType::LicenseOfferCreated, licenseId, proposal.asset,
                    proposal.proposer, proposal.blueprint.fee,
                    LicenseTypeToString(proposal.blueprint.type));
    journal_.Record(EventType::LicenseProposalExecuted, proposalId, proposal.asset, caller,
                    static_cast<Amount>(licenseId));
    LOG_INFO(CATEGORY) << "License proposal " << proposalId << " passed ("
                       << proposal.votesFor << " for, " << proposal.votesAgainst
                       << " against), created license " << licenseId;
    return Result::Success(licenseId);
}

// ============================================================================
// Governance Suspension
// ============================================================================

Result LicenseRegistry::SuspendByGovernance(LicenseId id, AssetId asset,
                                            int64_t durationSeconds, const Address& actor) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    License* license = FindLicense(id);
    if (!license) {
        return Result::Error(ErrorCode::LICENSE_NOT_FOUND);
    }
    if (license->asset != asset) {
        return Result::Error(ErrorCode::LICENSE_ASSET_MISMATCH);
    }
    if (!license->active) {
        return Result::Error(ErrorCode::LICENSE_NOT_ACTIVE);
    }
    Timestamp end = 0;
    if (!SuspensionEnd(durationSeconds, end)) {
        return Result::Error(ErrorCode::INVALID_DURATION);
    }
    SuspendLocked(*license, end, durationSeconds, actor, "governance");
    return Result::Success(id);
}

Result LicenseRegistry::SuspendAllForAsset(AssetId asset, int64_t durationSeconds,
                                           const Address& actor, size_t& count) {
    count = 0;
    Timestamp end = 0;
    if (!SuspensionEnd(durationSeconds, end)) {
        return Result::Error(ErrorCode::INVALID_DURATION);
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (auto& [id, license] : licenses_) {
        if (license.asset == asset && license.active) {
            SuspendLocked(license, end, durationSeconds, actor, "governance");
            ++count;
        }
    }
    return Result::Success();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<License> LicenseRegistry::GetLicense(LicenseId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const License* license = FindLicense(id);
    if (!license) {
        return std::nullopt;
    }
    return *license;
}

std::optional<LicenseTerms> LicenseRegistry::GetTerms(LicenseId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const License* license = FindLicense(id);
    if (!license) {
        return std::nullopt;
    }
    return license->terms;
}

std::optional<RoyaltySchedule> LicenseRegistry::GetRoyaltySchedule(LicenseId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<LicenseId> LicenseRegistry::GetLicensesForAsset(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<LicenseId> result;
    for (const auto& [id, license] : licenses_) {
        if (license.asset == asset) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<LicenseId> LicenseRegistry::GetLicensesByLicensee(const Address& licensee) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<LicenseId> result;
    for (const auto& [id, license] : licenses_) {
        if (license.licensee == licensee) {
            result.push_back(id);
        }
    }
    return result;
}

std::optional<LicenseProposal> LicenseRegistry::GetLicenseProposal(uint64_t proposalId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LicenseRegistry::HasVotedOnLicenseProposal(uint64_t proposalId,
                                                const Address& voter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(proposalId);
    return it != proposals_.end() && it->second.voters.count(voter) > 0;
}

size_t LicenseRegistry::GetLicenseCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return licenses_.size();
}

} // namespace license
} // namespace commonip
