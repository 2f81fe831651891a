// COMMONIP - Governance Settings
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Per-asset quorum fractions and voting windows. Read by the Governance
// Engine and by the license-proposal flow of the License Registry.

#ifndef COMMONIP_GOVERNANCE_SETTINGS_H
#define COMMONIP_GOVERNANCE_SETTINGS_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/util/time.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace commonip {
namespace governance {

// ============================================================================
// Defaults
// ============================================================================

/// Default quorum (basis points of the weight snapshot)
constexpr uint32_t DEFAULT_QUORUM_BPS = 5000;

/// Emergency proposals pass on a lower quorum
constexpr uint32_t DEFAULT_EMERGENCY_QUORUM_BPS = 3000;

/// Quorum for license proposals
constexpr uint32_t DEFAULT_LICENSE_QUORUM_BPS = 4000;

constexpr uint32_t DEFAULT_ASSET_QUORUM_BPS = 5000;
constexpr uint32_t DEFAULT_REVENUE_QUORUM_BPS = 5000;

/// Voting window - 3 days
constexpr int64_t DEFAULT_VOTING_DURATION = 3 * util::SECONDS_PER_DAY;

/// Emergency voting window - 1 day
constexpr int64_t DEFAULT_EMERGENCY_VOTING_DURATION = util::SECONDS_PER_DAY;

/// Time between the voting deadline and the execution deadline - 1 day
constexpr int64_t DEFAULT_EXECUTION_DELAY = util::SECONDS_PER_DAY;

/// Lower bound on the execution delay
constexpr int64_t MIN_EXECUTION_DELAY = util::SECONDS_PER_HOUR;

// ============================================================================
// Proposal Category
// ============================================================================

enum class ProposalCategory {
    AssetManagement,
    RevenuePolicy,
    Emergency
};

const char* ProposalCategoryToString(ProposalCategory category);
std::optional<ProposalCategory> ParseProposalCategory(const std::string& str);

// ============================================================================
// Governance Settings
// ============================================================================

struct GovernanceSettings {
    /// Ceiling for emergencyQuorumBps; proposals use their category quorum
    uint32_t defaultQuorumBps{DEFAULT_QUORUM_BPS};
    uint32_t emergencyQuorumBps{DEFAULT_EMERGENCY_QUORUM_BPS};
    uint32_t licenseQuorumBps{DEFAULT_LICENSE_QUORUM_BPS};
    uint32_t assetQuorumBps{DEFAULT_ASSET_QUORUM_BPS};
    uint32_t revenueQuorumBps{DEFAULT_REVENUE_QUORUM_BPS};

    int64_t votingDuration{DEFAULT_VOTING_DURATION};
    int64_t emergencyVotingDuration{DEFAULT_EMERGENCY_VOTING_DURATION};
    int64_t executionDelay{DEFAULT_EXECUTION_DELAY};

    /**
     * Quorums must lie in 1..10000, the emergency quorum may not exceed the
     * default quorum, voting windows must be positive and the execution
     * delay at least one hour.
     */
    Result Validate() const;

    /// Quorum fraction for a proposal category
    uint32_t QuorumBpsFor(ProposalCategory category) const;

    /// Voting window applied when a proposal asks for duration 0
    int64_t VotingDurationFor(ProposalCategory category) const;

    bool operator==(const GovernanceSettings& other) const;
    bool operator!=(const GovernanceSettings& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Settings Registry
// ============================================================================

/**
 * Asset -> settings table. Assets without an explicit entry read the
 * registry-wide defaults.
 */
class SettingsRegistry {
public:
    SettingsRegistry() = default;
    explicit SettingsRegistry(const GovernanceSettings& defaults);

    GovernanceSettings Get(AssetId asset) const;

    /// True when the asset carries its own settings
    bool HasOverride(AssetId asset) const;

    /// Validate and store; no ownership check happens here
    Result Set(AssetId asset, const GovernanceSettings& settings);

    const GovernanceSettings& Defaults() const { return defaults_; }

private:
    GovernanceSettings defaults_;
    mutable std::mutex mutex_;
    std::map<AssetId, GovernanceSettings> overrides_;
};

} // namespace governance
} // namespace commonip

#endif // COMMONIP_GOVERNANCE_SETTINGS_H
