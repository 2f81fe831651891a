// COMMONIP - Governance Engine Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/governance/governance.h>
#include <commonip/crypto/sha256.h>
#include <commonip/util/logging.h>
#include <commonip/util/time.h>

#include <sstream>

namespace commonip {
namespace governance {

using ledger::EventType;
using ledger::Reject;

namespace {
const char* CATEGORY = util::LogCategory::GOVERNANCE;
}

// ============================================================================
// Enum Helpers
// ============================================================================

const char* EmergencyActionTypeToString(EmergencyActionType type) {
    switch (type) {
        case EmergencyActionType::SuspendLicense: return "SuspendLicense";
        case EmergencyActionType::SuspendAllLicenses: return "SuspendAllLicenses";
        case EmergencyActionType::Pause: return "Pause";
        default: return "Unknown";
    }
}

std::optional<EmergencyActionType> ParseEmergencyActionType(const std::string& str) {
    if (str == "SuspendLicense" || str == "suspendlicense") return EmergencyActionType::SuspendLicense;
    if (str == "SuspendAllLicenses" || str == "suspendalllicenses") return EmergencyActionType::SuspendAllLicenses;
    if (str == "Pause" || str == "pause") return EmergencyActionType::Pause;
    return std::nullopt;
}

ProposalCategory PayloadCategory(const ProposalPayload& payload) {
    if (std::holds_alternative<RevenuePolicyChange>(payload)) {
        return ProposalCategory::RevenuePolicy;
    }
    if (std::holds_alternative<EmergencyAction>(payload)) {
        return ProposalCategory::Emergency;
    }
    return ProposalCategory::AssetManagement;
}

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal(id=" << id << ", asset=" << asset << ", "
        << ProposalCategoryToString(category) << ", for=" << votesFor
        << ", against=" << votesAgainst << ", quorum=" << quorum << "/" << totalVotingWeight;
    if (executed) oss << ", executed";
    if (cancelled) oss << ", cancelled";
    oss << ")";
    return oss.str();
}

// ============================================================================
// GovernanceEngine
// ============================================================================

GovernanceEngine::GovernanceEngine(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                                   const ownership::OwnershipLedger& owners,
                                   asset::AssetRegistry& assets, revenue::RevenuePool& pool,
                                   license::LicenseRegistry& licenses,
                                   SettingsRegistry& settings)
    : guard_(guard), journal_(journal), owners_(owners), assets_(assets), pool_(pool),
      licenses_(licenses), settings_(settings) {}

Result GovernanceEngine::ValidatePayload(const ProposalPayload& payload) {
    if (const auto* change = std::get_if<AssetManagementChange>(&payload)) {
        if (!change->metadataUri && !change->complianceStatus) {
            return Result::Error(ErrorCode::INVALID_PAYLOAD, "no asset field to change");
        }
    } else if (const auto* policy = std::get_if<RevenuePolicyChange>(&payload)) {
        if (policy->minimumDistribution < 0) {
            return Result::Error(ErrorCode::INVALID_PAYLOAD, "negative minimum distribution");
        }
    } else if (const auto* action = std::get_if<EmergencyAction>(&payload)) {
        if (action->type == EmergencyActionType::SuspendLicense &&
            action->licenseId == NULL_ID) {
            return Result::Error(ErrorCode::INVALID_PAYLOAD, "missing license id");
        }
        if (action->type != EmergencyActionType::Pause && action->suspensionDuration <= 0) {
            return Result::Error(ErrorCode::INVALID_DURATION, "suspension duration");
        }
    }
    return Result::Success();
}

Result GovernanceEngine::CreateProposal(const Address& caller, AssetId asset,
                                        ProposalCategory category,
                                        const ProposalPayload& payload,
                                        int64_t votingDuration,
                                        const std::string& description) {
    auto scope = guard_.Enter("CreateProposal");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "CreateProposal", ErrorCode::NOT_ASSET_OWNER);
    }
    if (PayloadCategory(payload) != category) {
        return Reject(CATEGORY, "CreateProposal", ErrorCode::INVALID_PAYLOAD,
                      std::string("payload does not match ") +
                          ProposalCategoryToString(category));
    }
    Result valid = ValidatePayload(payload);
    if (!valid.IsOk()) {
        LOG_DEBUG(CATEGORY) << "CreateProposal rejected: " << valid.reason;
        return valid;
    }
    if (votingDuration < 0) {
        return Reject(CATEGORY, "CreateProposal", ErrorCode::INVALID_DURATION);
    }

    GovernanceSettings settings = settings_.Get(asset);
    Timestamp now = util::GetTime();
    Timestamp votingDeadline = 0;
    Timestamp executionDeadline = 0;
    if (!CheckedDeadline(now,
                         votingDuration > 0 ? votingDuration
                                            : settings.VotingDurationFor(category),
                         votingDeadline) ||
        !CheckedDeadline(votingDeadline, settings.executionDelay, executionDeadline)) {
        return Reject(CATEGORY, "CreateProposal", ErrorCode::INVALID_DURATION,
                      "deadline out of range");
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Proposal proposal;
    proposal.id = nextId_++;
    proposal.asset = asset;
    proposal.proposer = caller;
    proposal.category = category;
    proposal.payload = payload;
    proposal.description = description;
    proposal.descriptionHash = SHA256Hash(description);
    proposal.totalVotingWeight = owners_.GetTotalGovernanceWeight(asset);
    proposal.quorum = ScaleWeight(proposal.totalVotingWeight, settings.QuorumBpsFor(category),
                                  BPS_DENOMINATOR);
    proposal.createdAt = now;
    proposal.votingDeadline = votingDeadline;
    proposal.executionDeadline = executionDeadline;

    ProposalId id = proposal.id;
    journal_.Record(EventType::ProposalCreated, id, asset, caller, 0,
                    ProposalCategoryToString(category));
    LOG_INFO(CATEGORY) << "Created " << proposal.ToString() << ", voting until "
                       << util::FormatISO8601(proposal.votingDeadline);
    proposals_.emplace(id, std::move(proposal));
    return Result::Success(id);
}

Result GovernanceEngine::Vote(const Address& caller, ProposalId id, bool inFavor) {
    auto scope = guard_.Enter("Vote");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Reject(CATEGORY, "Vote", ErrorCode::PROPOSAL_NOT_FOUND);
    }
    Proposal& proposal = it->second;
    if (!owners_.IsOwner(proposal.asset, caller)) {
        return Reject(CATEGORY, "Vote", ErrorCode::NOT_ASSET_OWNER);
    }
    if (proposal.executed) {
        return Reject(CATEGORY, "Vote", ErrorCode::PROPOSAL_ALREADY_EXECUTED);
    }
    if (proposal.cancelled) {
        return Reject(CATEGORY, "Vote", ErrorCode::PROPOSAL_CANCELLED);
    }
    if (proposal.voters.count(caller)) {
        return Reject(CATEGORY, "Vote", ErrorCode::ALREADY_VOTED);
    }
    if (util::GetTime() >= proposal.votingDeadline) {
        return Reject(CATEGORY, "Vote", ErrorCode::VOTING_CLOSED);
    }
    Weight weight = owners_.GetGovernanceWeight(proposal.asset, caller);
    if (weight == 0) {
        return Reject(CATEGORY, "Vote", ErrorCode::NO_GOVERNANCE_RIGHTS);
    }
    Weight& tally = inFavor ? proposal.votesFor : proposal.votesAgainst;
    Weight newTally = 0;
    if (!CheckedAdd(tally, weight, newTally)) {
        return Reject(CATEGORY, "Vote", ErrorCode::WEIGHT_OVERFLOW);
    }

    tally = newTally;
    proposal.voters.insert(caller);

    journal_.Record(EventType::ProposalVoted, id, proposal.asset, caller,
                    static_cast<Amount>(weight), inFavor ? "for" : "against");
    LOG_DEBUG(CATEGORY) << "Proposal " << id << ": " << caller.ToShortHex()
                        << (inFavor ? " for " : " against ") << "with weight " << weight;
    return Result::Success(id);
}

Result GovernanceEngine::CancelProposal(const Address& caller, ProposalId id) {
    auto scope = guard_.Enter("CancelProposal");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Reject(CATEGORY, "CancelProposal", ErrorCode::PROPOSAL_NOT_FOUND);
    }
    Proposal& proposal = it->second;
    if (caller != proposal.proposer) {
        return Reject(CATEGORY, "CancelProposal", ErrorCode::NOT_PROPOSER);
    }
    if (proposal.executed) {
        return Reject(CATEGORY, "CancelProposal", ErrorCode::PROPOSAL_ALREADY_EXECUTED);
    }
    if (proposal.cancelled) {
        return Reject(CATEGORY, "CancelProposal", ErrorCode::PROPOSAL_CANCELLED);
    }
    if (util::GetTime() >= proposal.votingDeadline) {
        return Reject(CATEGORY, "CancelProposal", ErrorCode::VOTING_CLOSED);
    }

    proposal.cancelled = true;
    journal_.Record(EventType::ProposalCancelled, id, proposal.asset, caller);
    LOG_INFO(CATEGORY) << "Proposal " << id << " cancelled by its proposer";
    return Result::Success(id);
}

// ============================================================================
// Execution Checks
// ============================================================================

Result GovernanceEngine::CheckExecutableAt(const Proposal& proposal, Timestamp now) {
    if (proposal.executed) {
        return Result::Error(ErrorCode::PROPOSAL_ALREADY_EXECUTED);
    }
    if (proposal.cancelled) {
        return Result::Error(ErrorCode::PROPOSAL_CANCELLED);
    }
    if (now <= proposal.votingDeadline) {
        return Result::Error(ErrorCode::VOTING_NOT_ENDED);
    }
    if (now > proposal.executionDeadline) {
        return Result::Error(ErrorCode::EXECUTION_WINDOW_CLOSED);
    }
    if (!proposal.HasQuorum()) {
        return Result::Error(ErrorCode::QUORUM_NOT_REACHED,
                             std::to_string(proposal.TotalVotes()) + " < " +
                                 std::to_string(proposal.quorum));
    }
    if (!proposal.HasMajority()) {
        return Result::Error(ErrorCode::MAJORITY_NOT_REACHED);
    }
    return Result::Success(proposal.id);
}

Result GovernanceEngine::CheckExecutable(ProposalId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Result::Error(ErrorCode::PROPOSAL_NOT_FOUND);
    }
    return CheckExecutableAt(it->second, util::GetTime());
}

bool GovernanceEngine::CanExecute(ProposalId id) const {
    return CheckExecutable(id).IsOk();
}

Result GovernanceEngine::PrepareExecution(const char* operation, ProposalId id,
                                          ProposalCategory category, Proposal*& proposal) {
    proposal = nullptr;
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return Reject(CATEGORY, operation, ErrorCode::PROPOSAL_NOT_FOUND);
    }
    if (it->second.category != category) {
        return Reject(CATEGORY, operation, ErrorCode::CATEGORY_MISMATCH,
                      ProposalCategoryToString(it->second.category));
    }
    Result ready = CheckExecutableAt(it->second, util::GetTime());
    if (!ready.IsOk()) {
        return Reject(CATEGORY, operation, ready.code);
    }
    proposal = &it->second;
    return Result::Success(id);
}

void GovernanceEngine::MarkExecuted(Proposal& proposal, const Address& caller,
                                    const std::string& detail) {
    proposal.executed = true;
    journal_.Record(EventType::ProposalExecuted, proposal.id, proposal.asset, caller, 0, detail);
}

// ============================================================================
// Execution
// ============================================================================

Result GovernanceEngine::ExecuteAssetManagement(const Address& caller, ProposalId id,
                                                asset::AssetChangeReport* report) {
    auto scope = guard_.Enter("ExecuteAssetManagement");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Proposal* proposal = nullptr;
    Result ready = PrepareExecution("ExecuteAssetManagement", id,
                                    ProposalCategory::AssetManagement, proposal);
    if (!ready.IsOk()) {
        return ready;
    }
    if (!assets_.HasAsset(proposal->asset)) {
        return Reject(CATEGORY, "ExecuteAssetManagement", ErrorCode::ASSET_NOT_FOUND);
    }

    const auto& change = std::get<AssetManagementChange>(proposal->payload);
    asset::AssetChangeReport changes;
    if (change.metadataUri) {
        Result applied = assets_.SetMetadataInternal(proposal->asset, *change.metadataUri,
                                                     caller, changes.metadataChanged);
        if (!applied.IsOk()) {
            return applied;
        }
    }
    if (change.complianceStatus) {
        Result applied = assets_.SetComplianceInternal(proposal->asset, *change.complianceStatus,
                                                       caller, changes.complianceChanged);
        if (!applied.IsOk()) {
            return applied;
        }
    }

    std::string detail = std::string(changes.metadataChanged ? "metadata " : "") +
                         (changes.complianceChanged ? "compliance" : "");
    MarkExecuted(*proposal, caller, detail);
    LOG_INFO(CATEGORY) << "Executed asset management proposal " << id << " (metadata "
                       << (changes.metadataChanged ? "changed" : "unchanged") << ", compliance "
                       << (changes.complianceChanged ? "changed" : "unchanged") << ")";
    if (report) {
        *report = changes;
    }
    return Result::Success(id);
}

Result GovernanceEngine::ExecuteRevenuePolicy(const Address& caller, ProposalId id) {
    auto scope = guard_.Enter("ExecuteRevenuePolicy");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Proposal* proposal = nullptr;
    Result ready = PrepareExecution("ExecuteRevenuePolicy", id, ProposalCategory::RevenuePolicy,
                                    proposal);
    if (!ready.IsOk()) {
        return ready;
    }

    const auto& policy = std::get<RevenuePolicyChange>(proposal->payload);
    Result applied = pool_.SetMinimumInternal(proposal->asset, policy.currency,
                                              policy.minimumDistribution, caller);
    if (!applied.IsOk()) {
        return applied;
    }

    MarkExecuted(*proposal, caller, "minimum " + std::to_string(policy.minimumDistribution));
    LOG_INFO(CATEGORY) << "Executed revenue policy proposal " << id << ": minimum distribution "
                       << policy.minimumDistribution;
    return Result::Success(id);
}

Result GovernanceEngine::ExecuteEmergency(const Address& caller, ProposalId id) {
    auto scope = guard_.Enter("ExecuteEmergency");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Proposal* proposal = nullptr;
    Result ready = PrepareExecution("ExecuteEmergency", id, ProposalCategory::Emergency, proposal);
    if (!ready.IsOk()) {
        return ready;
    }

    const auto& action = std::get<EmergencyAction>(proposal->payload);
    std::string detail = EmergencyActionTypeToString(action.type);

    switch (action.type) {
        case EmergencyActionType::SuspendLicense: {
            Result suspended = licenses_.SuspendByGovernance(
                action.licenseId, proposal->asset, action.suspensionDuration, caller);
            if (!suspended.IsOk()) {
                return Reject(CATEGORY, "ExecuteEmergency", suspended.code);
            }
            detail += " " + std::to_string(action.licenseId);
            break;
        }
        case EmergencyActionType::SuspendAllLicenses: {
            size_t count = 0;
            Result suspended = licenses_.SuspendAllForAsset(proposal->asset,
                                                            action.suspensionDuration,
                                                            caller, count);
            if (!suspended.IsOk()) {
                return Reject(CATEGORY, "ExecuteEmergency", suspended.code);
            }
            detail += " (" + std::to_string(count) + " licenses)";
            break;
        }
        case EmergencyActionType::Pause:
            guard_.TripPause(caller, action.reason.empty()
                                         ? "emergency proposal " + std::to_string(id)
                                         : action.reason);
            break;
    }

    MarkExecuted(*proposal, caller, detail);
    LOG_WARN(CATEGORY) << "Executed emergency proposal " << id << " on asset "
                       << proposal->asset << ": " << detail;
    return Result::Success(id);
}

// ============================================================================
// Settings
// ============================================================================

Result GovernanceEngine::SetGovernanceSettings(const Address& caller, AssetId asset,
                                               const GovernanceSettings& settings) {
    auto scope = guard_.Enter("SetGovernanceSettings");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "SetGovernanceSettings", ErrorCode::NOT_ASSET_OWNER);
    }
    Result stored = settings_.Set(asset, settings);
    if (!stored.IsOk()) {
        LOG_DEBUG(CATEGORY) << "SetGovernanceSettings rejected: " << stored.reason;
        return stored;
    }

    journal_.Record(EventType::GovernanceSettingsChanged, asset, asset, caller);
    LOG_INFO(CATEGORY) << "Asset " << asset << " settings: " << settings.ToString();
    return Result::Success(asset);
}

GovernanceSettings GovernanceEngine::GetGovernanceSettings(AssetId asset) const {
    return settings_.Get(asset);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Proposal> GovernanceEngine::GetProposal(ProposalId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Proposal> GovernanceEngine::GetActiveProposalsForAsset(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Timestamp now = util::GetTime();
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : proposals_) {
        if (proposal.asset == asset && !proposal.executed && !proposal.cancelled &&
            now <= proposal.executionDeadline) {
            result.push_back(proposal);
        }
    }
    return result;
}

bool GovernanceEngine::HasVoted(ProposalId id, const Address& voter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = proposals_.find(id);
    return it != proposals_.end() && it->second.voters.count(voter) > 0;
}

size_t GovernanceEngine::GetProposalCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return proposals_.size();
}

} // namespace governance
} // namespace commonip
