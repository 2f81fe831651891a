// COMMONIP - License Registry
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// License lifecycle over collectively-owned assets:
//
//   PendingApproval -> Approved (inactive) -> Active
//   Active -> Suspended -> SuspensionExpired -> Active
//   Active -> Expired (derived from the end time)
//   Active -> Revoked (terminal)
//
// Fees and royalties are pulled from the licensee into the pool address and
// split over the owner set through RevenuePool::RouteFee. A smaller
// proposal/vote/execute cycle lets owners create licenses collectively.

#ifndef COMMONIP_LICENSE_LICENSE_H
#define COMMONIP_LICENSE_LICENSE_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/governance/settings.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/ownership/ownership.h>
#include <commonip/revenue/revenue.h>
#include <commonip/token/payment.h>
#include <commonip/util/time.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace commonip {
namespace license {

// ============================================================================
// Constants
// ============================================================================

/// Offers with a fee above this need owner approval
constexpr Amount DEFAULT_APPROVAL_FEE_THRESHOLD = 500;

/// Royalty payment interval - 30 days
constexpr int64_t DEFAULT_ROYALTY_INTERVAL = 30 * util::SECONDS_PER_DAY;

/// License proposal voting window - 7 days
constexpr int64_t DEFAULT_PROPOSAL_VOTING_DURATION = util::SECONDS_PER_WEEK;

/// License proposal execution window after voting ends - 24 hours
constexpr int64_t DEFAULT_PROPOSAL_EXECUTION_WINDOW = 24 * util::SECONDS_PER_HOUR;

// ============================================================================
// Enums
// ============================================================================

enum class LicenseType {
    NonExclusive,
    Exclusive,
    SoleExclusive
};

const char* LicenseTypeToString(LicenseType type);
std::optional<LicenseType> ParseLicenseType(const std::string& str);

/// Exclusive grants always go through owner approval
bool IsExclusiveType(LicenseType type);

enum class LicenseStatus {
    NotFound,
    PendingApproval,
    Revoked,
    Inactive,
    Suspended,
    SuspensionExpired,
    Expired,
    Active
};

const char* LicenseStatusToString(LicenseStatus status);
std::optional<LicenseStatus> ParseLicenseStatus(const std::string& str);

// ============================================================================
// Records
// ============================================================================

struct LicenseTerms {
    /// 0 = unlimited
    uint64_t usageLimit{0};
    uint64_t usageCount{0};

    bool attributionRequired{false};
    bool modificationAllowed{false};

    /// Share of commercial revenue owed beyond royalties, informational
    uint32_t commercialRevenueShareBps{0};

    int64_t terminationNoticePeriod{0};
};

struct RoyaltySchedule {
    Amount totalReported{0};
    Amount totalPaid{0};
    int64_t paymentInterval{DEFAULT_ROYALTY_INTERVAL};
    Timestamp nextDue{0};

    /// Current licensee
    Address holder;

    Timestamp lastPayment{0};
};

/// Everything needed to create a license; also the license-proposal blueprint
struct LicenseOffer {
    Address licensee;
    LicenseType type{LicenseType::NonExclusive};
    std::string usageRights;
    std::string territory;
    Amount fee{0};
    uint32_t royaltyBps{0};

    /// 0 = perpetual
    int64_t durationSeconds{0};

    CurrencyId currency;
    LicenseTerms terms;
    std::string termsUri;
};

struct License {
    LicenseId id{NULL_ID};
    AssetId asset{NULL_ID};
    Address licensor;
    Address licensee;
    LicenseType type{LicenseType::NonExclusive};
    std::string usageRights;
    std::string territory;
    Amount fee{0};
    uint32_t royaltyBps{0};
    Timestamp startTime{0};

    /// 0 = perpetual
    Timestamp endTime{0};

    CurrencyId currency;
    std::string termsUri;
    Hash256 termsHash;
    LicenseTerms terms;

    bool requiresApproval{false};
    bool approved{false};
    bool rejected{false};
    bool active{false};

    /// Set on first activation, never cleared
    bool executed{false};

    bool suspended{false};
    bool revoked{false};
    Timestamp suspensionEnd{0};
    std::string revocationReason;

    bool IsExpired(Timestamp now) const { return endTime != 0 && now > endTime; }

    std::string ToString() const;
};

struct LicenseProposal {
    uint64_t id{NULL_ID};
    AssetId asset{NULL_ID};
    Address proposer;
    LicenseOffer blueprint;
    std::string description;
    Hash256 descriptionHash;

    Weight votesFor{0};
    Weight votesAgainst{0};
    Weight totalVotingWeight{0};
    Weight quorum{0};

    Timestamp votingDeadline{0};
    Timestamp executionDeadline{0};

    bool executed{false};
    LicenseId resultingLicense{NULL_ID};

    std::set<Address> voters;
};

struct LicenseOptions {
    Amount approvalFeeThreshold{DEFAULT_APPROVAL_FEE_THRESHOLD};
    int64_t royaltyInterval{DEFAULT_ROYALTY_INTERVAL};
    int64_t proposalVotingDuration{DEFAULT_PROPOSAL_VOTING_DURATION};
    int64_t proposalExecutionWindow{DEFAULT_PROPOSAL_EXECUTION_WINDOW};
};

// ============================================================================
// License Registry
// ============================================================================

class LicenseRegistry {
public:
    LicenseRegistry(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                    const ownership::OwnershipLedger& owners, revenue::RevenuePool& pool,
                    token::PaymentRegistry& payments,
                    const governance::SettingsRegistry& settings,
                    const LicenseOptions& options = LicenseOptions{});

    // === Lifecycle ===

    /**
     * Offer a license over an asset. Exclusive types and fees above the
     * approval threshold need a second owner decision; everything else is
     * approved on creation. Result id is the new license id.
     */
    Result CreateOffer(const Address& caller, AssetId asset, const LicenseOffer& offer);

    /// Resolve a pending approval; `approve == false` rejects for good
    Result Approve(const Address& caller, LicenseId id, bool approve);

    /// Licensee accepts: pays the fee and activates
    Result Execute(const Address& caller, LicenseId id);

    Result Revoke(const Address& caller, LicenseId id, const std::string& reason);
    Result Suspend(const Address& caller, LicenseId id, int64_t durationSeconds);

    /// Anyone, once the suspension window has elapsed
    Result CheckAndReactivate(const Address& caller, LicenseId id);

    /// Owners, at any time during a suspension
    Result ManualReactivate(const Address& caller, LicenseId id);

    Result Transfer(const Address& caller, LicenseId id, const Address& newLicensee);

    // === Usage and Royalties ===

    Result ReportUsage(const Address& caller, LicenseId id, Amount revenueAmount,
                       uint64_t usageCount);
    Result PayRoyalties(const Address& caller, LicenseId id, Amount amount);

    /// max(0, floor(totalReported * royaltyBps / 10000) - totalPaid)
    Amount DueRoyalties(LicenseId id) const;

    // === Status ===

    LicenseStatus GetStatus(LicenseId id) const;
    LicenseStatus GetStatusAt(LicenseId id, Timestamp now) const;

    // === License Proposals ===

    Result ProposeLicenseTerms(const Address& caller, AssetId asset,
                               const LicenseOffer& blueprint, const std::string& description);
    Result VoteOnLicenseProposal(const Address& caller, uint64_t proposalId, bool inFavor);

    /// Permissionless; result id is the created license id
    Result ExecuteLicenseProposal(const Address& caller, uint64_t proposalId);

    // === Governance (no owner check, caller holds the guard scope) ===

    Result SuspendByGovernance(LicenseId id, AssetId asset, int64_t durationSeconds,
                               const Address& actor);

    /// Suspend every active license of the asset; `count` receives the number
    Result SuspendAllForAsset(AssetId asset, int64_t durationSeconds, const Address& actor,
                             size_t& count);

    // === Queries ===

    std::optional<License> GetLicense(LicenseId id) const;
    std::optional<LicenseTerms> GetTerms(LicenseId id) const;
    std::optional<RoyaltySchedule> GetRoyaltySchedule(LicenseId id) const;
    std::vector<LicenseId> GetLicensesForAsset(AssetId asset) const;
    std::vector<LicenseId> GetLicensesByLicensee(const Address& licensee) const;
    std::optional<LicenseProposal> GetLicenseProposal(uint64_t proposalId) const;
    bool HasVotedOnLicenseProposal(uint64_t proposalId, const Address& voter) const;
    size_t GetLicenseCount() const;

    const LicenseOptions& Options() const { return options_; }

private:
    Result ValidateOffer(const LicenseOffer& offer) const;

    /// Insert a new license; returns its id
    LicenseId CreateLicenseLocked(AssetId asset, const Address& licensor,
                                  const LicenseOffer& offer, bool preApproved);

    /// Pull `amount` from `payer` and route it; refunds if routing fails
    Result CollectAndRoute(const char* operation, const License& license,
                           const Address& payer, Amount amount);

    /// Positive duration whose end fits in a timestamp
    static bool SuspensionEnd(int64_t durationSeconds, Timestamp& end);
    void SuspendLocked(License& license, Timestamp end, int64_t durationSeconds,
                       const Address& actor, const char* origin);
    Result ReactivateLocked(const char* operation, License& license, const Address& actor);

    License* FindLicense(LicenseId id);
    const License* FindLicense(LicenseId id) const;

    ledger::LedgerGuard& guard_;
    ledger::EventJournal& journal_;
    const ownership::OwnershipLedger& owners_;
    revenue::RevenuePool& pool_;
    token::PaymentRegistry& payments_;
    const governance::SettingsRegistry& settings_;
    LicenseOptions options_;

    mutable std::recursive_mutex mutex_;
    std::map<LicenseId, License> licenses_;
    std::map<LicenseId, RoyaltySchedule> schedules_;
    std::map<uint64_t, LicenseProposal> proposals_;
    LicenseId nextLicenseId_{1};
    uint64_t nextProposalId_{1};
};

} // namespace license
} // namespace commonip

#endif // COMMONIP_LICENSE_LICENSE_H
