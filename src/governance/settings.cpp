// COMMONIP - Governance Settings Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/governance/settings.h>

#include <sstream>

namespace commonip {
namespace governance {

const char* ProposalCategoryToString(ProposalCategory category) {
    switch (category) {
        case ProposalCategory::AssetManagement: return "AssetManagement";
        case ProposalCategory::RevenuePolicy: return "RevenuePolicy";
        case ProposalCategory::Emergency: return "Emergency";
        default: return "Unknown";
    }
}

std::optional<ProposalCategory> ParseProposalCategory(const std::string& str) {
    if (str == "AssetManagement" || str == "assetmanagement") return ProposalCategory::AssetManagement;
    if (str == "RevenuePolicy" || str == "revenuepolicy") return ProposalCategory::RevenuePolicy;
    if (str == "Emergency" || str == "emergency") return ProposalCategory::Emergency;
    return std::nullopt;
}

// ============================================================================
// GovernanceSettings
// ============================================================================

namespace {

bool QuorumInRange(uint32_t bps) {
    return bps >= 1 && bps <= static_cast<uint32_t>(BPS_DENOMINATOR);
}

} // anonymous namespace

Result GovernanceSettings::Validate() const {
    if (!QuorumInRange(defaultQuorumBps)) {
        return Result::Error(ErrorCode::QUORUM_OUT_OF_RANGE, "default");
    }
    if (!QuorumInRange(emergencyQuorumBps)) {
        return Result::Error(ErrorCode::QUORUM_OUT_OF_RANGE, "emergency");
    }
    if (!QuorumInRange(licenseQuorumBps)) {
        return Result::Error(ErrorCode::QUORUM_OUT_OF_RANGE, "license");
    }
    if (!QuorumInRange(assetQuorumBps)) {
        return Result::Error(ErrorCode::QUORUM_OUT_OF_RANGE, "asset management");
    }
    if (!QuorumInRange(revenueQuorumBps)) {
        return Result::Error(ErrorCode::QUORUM_OUT_OF_RANGE, "revenue policy");
    }
    if (emergencyQuorumBps > defaultQuorumBps) {
        return Result::Error(ErrorCode::EMERGENCY_QUORUM_TOO_HIGH);
    }
    if (votingDuration <= 0 || emergencyVotingDuration <= 0) {
        return Result::Error(ErrorCode::INVALID_DURATION, "voting duration");
    }
    if (executionDelay < MIN_EXECUTION_DELAY) {
        return Result::Error(ErrorCode::EXECUTION_DELAY_TOO_SHORT);
    }
    return Result::Success();
}

uint32_t GovernanceSettings::QuorumBpsFor(ProposalCategory category) const {
    switch (category) {
        case ProposalCategory::AssetManagement: return assetQuorumBps;
        case ProposalCategory::RevenuePolicy: return revenueQuorumBps;
        case ProposalCategory::Emergency: return emergencyQuorumBps;
    }
    // Unreachable for a valid category
    return defaultQuorumBps;
}

int64_t GovernanceSettings::VotingDurationFor(ProposalCategory category) const {
    return category == ProposalCategory::Emergency ? emergencyVotingDuration : votingDuration;
}

bool GovernanceSettings::operator==(const GovernanceSettings& other) const {
    return defaultQuorumBps == other.defaultQuorumBps &&
           emergencyQuorumBps == other.emergencyQuorumBps &&
           licenseQuorumBps == other.licenseQuorumBps &&
           assetQuorumBps == other.assetQuorumBps &&
           revenueQuorumBps == other.revenueQuorumBps &&
           votingDuration == other.votingDuration &&
           emergencyVotingDuration == other.emergencyVotingDuration &&
           executionDelay == other.executionDelay;
}

std::string GovernanceSettings::ToString() const {
    std::ostringstream oss;
    oss << "GovernanceSettings(quorum=" << defaultQuorumBps
        << " emergency=" << emergencyQuorumBps
        << " license=" << licenseQuorumBps
        << " asset=" << assetQuorumBps
        << " revenue=" << revenueQuorumBps
        << " voting=" << util::FormatDuration(votingDuration)
        << " emergencyVoting=" << util::FormatDuration(emergencyVotingDuration)
        << " delay=" << util::FormatDuration(executionDelay) << ")";
    return oss.str();
}

// ============================================================================
// SettingsRegistry
// ============================================================================

SettingsRegistry::SettingsRegistry(const GovernanceSettings& defaults)
    : defaults_(defaults) {}

GovernanceSettings SettingsRegistry::Get(AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = overrides_.find(asset);
    return it == overrides_.end() ? defaults_ : it->second;
}

bool SettingsRegistry::HasOverride(AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overrides_.count(asset) > 0;
}

Result SettingsRegistry::Set(AssetId asset, const GovernanceSettings& settings) {
    Result valid = settings.Validate();
    if (!valid.IsOk()) {
        return valid;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[asset] = settings;
    return Result::Success();
}

} // namespace governance
} // namespace commonip
