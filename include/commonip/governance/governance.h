// COMMONIP - Governance Engine
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Weighted, time-boxed proposals over a single asset. A proposal passes when
// votesFor + votesAgainst reaches the quorum and votesFor > votesAgainst; it
// can then be executed by anyone inside (votingDeadline, executionDeadline].
//
// The quorum denominator is the total governance weight at creation, while
// each vote counts the voter's weight at the moment of voting.

#ifndef COMMONIP_GOVERNANCE_GOVERNANCE_H
#define COMMONIP_GOVERNANCE_GOVERNANCE_H

#include <commonip/asset/asset.h>
#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/governance/settings.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/license/license.h>
#include <commonip/ownership/ownership.h>
#include <commonip/revenue/revenue.h>

#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace commonip {
namespace governance {

// ============================================================================
// Payloads
// ============================================================================

enum class EmergencyActionType {
    SuspendLicense,
    SuspendAllLicenses,
    Pause
};

const char* EmergencyActionTypeToString(EmergencyActionType type);
std::optional<EmergencyActionType> ParseEmergencyActionType(const std::string& str);

/// Unset fields are left alone
struct AssetManagementChange {
    std::optional<std::string> metadataUri;
    std::optional<std::string> complianceStatus;
};

struct RevenuePolicyChange {
    CurrencyId currency;
    Amount minimumDistribution{0};
};

struct EmergencyAction {
    EmergencyActionType type{EmergencyActionType::Pause};

    /// SuspendLicense only
    LicenseId licenseId{NULL_ID};

    /// Suspension length for both suspend actions
    int64_t suspensionDuration{0};

    std::string reason;
};

using ProposalPayload = std::variant<AssetManagementChange, RevenuePolicyChange, EmergencyAction>;

/// Category a payload alternative belongs to
ProposalCategory PayloadCategory(const ProposalPayload& payload);

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    ProposalId id{NULL_ID};
    AssetId asset{NULL_ID};
    Address proposer;
    ProposalCategory category{ProposalCategory::AssetManagement};
    ProposalPayload payload;

    std::string description;
    Hash256 descriptionHash;

    Weight votesFor{0};
    Weight votesAgainst{0};

    /// Sum of owner weights when the proposal was created
    Weight totalVotingWeight{0};

    /// floor(totalVotingWeight * categoryQuorumBps / 10000)
    Weight quorum{0};

    Timestamp createdAt{0};
    Timestamp votingDeadline{0};
    Timestamp executionDeadline{0};

    bool executed{false};
    bool cancelled{false};

    std::set<Address> voters;

    /// Saturates; an owner set replaced mid-vote can push the sum past the weight range
    Weight TotalVotes() const {
        Weight total = 0;
        return CheckedAdd(votesFor, votesAgainst, total) ? total
                                                         : std::numeric_limits<Weight>::max();
    }
    bool HasQuorum() const { return TotalVotes() >= quorum; }
    bool HasMajority() const { return votesFor > votesAgainst; }

    std::string ToString() const;
};

// ============================================================================
// Governance Engine
// ============================================================================

class GovernanceEngine {
public:
    GovernanceEngine(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                     const ownership::OwnershipLedger& owners, asset::AssetRegistry& assets,
                     revenue::RevenuePool& pool, license::LicenseRegistry& licenses,
                     SettingsRegistry& settings);

    // === Proposals ===

    /**
     * Open a proposal. `votingDuration` 0 selects the category default from
     * the asset's settings. Result id is the proposal id.
     */
    Result CreateProposal(const Address& caller, AssetId asset, ProposalCategory category,
                          const ProposalPayload& payload, int64_t votingDuration,
                          const std::string& description);

    Result Vote(const Address& caller, ProposalId id, bool inFavor);

    /// Proposer only, while voting is open
    Result CancelProposal(const Address& caller, ProposalId id);

    bool CanExecute(ProposalId id) const;

    /// Reason CanExecute would return false, or success
    Result CheckExecutable(ProposalId id) const;

    // === Execution (permissionless) ===

    Result ExecuteAssetManagement(const Address& caller, ProposalId id,
                                  asset::AssetChangeReport* report = nullptr);
    Result ExecuteRevenuePolicy(const Address& caller, ProposalId id);
    Result ExecuteEmergency(const Address& caller, ProposalId id);

    // === Settings ===

    /// Owner-gated
    Result SetGovernanceSettings(const Address& caller, AssetId asset,
                                 const GovernanceSettings& settings);
    GovernanceSettings GetGovernanceSettings(AssetId asset) const;

    // === Queries ===

    std::optional<Proposal> GetProposal(ProposalId id) const;

    /// Not executed, not cancelled and not past the execution deadline
    std::vector<Proposal> GetActiveProposalsForAsset(AssetId asset) const;

    bool HasVoted(ProposalId id, const Address& voter) const;
    size_t GetProposalCount() const;

private:
    static Result ValidatePayload(const ProposalPayload& payload);
    static Result CheckExecutableAt(const Proposal& proposal, Timestamp now);

    /// Lookup, category match and window checks shared by the execute calls
    Result PrepareExecution(const char* operation, ProposalId id, ProposalCategory category,
                            Proposal*& proposal);
    void MarkExecuted(Proposal& proposal, const Address& caller, const std::string& detail);

    ledger::LedgerGuard& guard_;
    ledger::EventJournal& journal_;
    const ownership::OwnershipLedger& owners_;
    asset::AssetRegistry& assets_;
    revenue::RevenuePool& pool_;
    license::LicenseRegistry& licenses_;
    SettingsRegistry& settings_;

    mutable std::recursive_mutex mutex_;
    std::map<ProposalId, Proposal> proposals_;
    ProposalId nextId_{1};
};

} // namespace governance
} // namespace commonip

#endif // COMMONIP_GOVERNANCE_GOVERNANCE_H
