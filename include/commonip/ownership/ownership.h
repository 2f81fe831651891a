// COMMONIP - Ownership Ledger
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Fractional ownership of assets. Every owner holds an economic percentage
// (0..100, summing to exactly 100 per asset) and an independent governance
// weight. Other components read ownership from here; only registration and
// share transfers write it.

#ifndef COMMONIP_OWNERSHIP_OWNERSHIP_H
#define COMMONIP_OWNERSHIP_OWNERSHIP_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace commonip {
namespace ownership {

// ============================================================================
// Owner Entry
// ============================================================================

struct OwnerEntry {
    Address owner;

    /// Economic share, 0..100
    uint32_t percentage{0};

    /// Voting power, independent of the economic share
    Weight governanceWeight{0};

    /// Set once the address has held a share of the asset
    bool isMember{false};

    std::string ToString() const;
};

// ============================================================================
// Ownership Ledger
// ============================================================================

class OwnershipLedger {
public:
    OwnershipLedger(ledger::LedgerGuard& guard, ledger::EventJournal& journal);

    // === Mutations ===

    /**
     * Replace the owner set of an asset. Administrator only; asset
     * registration goes through ApplyOwnership instead.
     */
    Result RegisterOwnership(const Address& caller, AssetId asset,
                             const std::vector<Address>& owners,
                             const std::vector<uint32_t>& percentages,
                             const std::vector<Weight>& weights);

    /**
     * Move `percentage` points of economic share from `from` to `to`.
     * Governance weight follows proportionally:
     *   moved = floor(fromWeight * percentage / fromPercentageBefore)
     */
    Result TransferShare(const Address& caller, AssetId asset, const Address& from,
                         const Address& to, uint32_t percentage);

    // === Internal ===

    /// Check a prospective owner set without writing anything
    static Result ValidateShares(const std::vector<Address>& owners,
                                 const std::vector<uint32_t>& percentages,
                                 const std::vector<Weight>& weights);

    /// Validate and install an owner set; caller holds the guard scope
    Result ApplyOwnership(AssetId asset, const std::vector<Address>& owners,
                          const std::vector<uint32_t>& percentages,
                          const std::vector<Weight>& weights);

    // === Queries ===

    bool HasOwnership(AssetId asset) const;

    /// Member with a non-zero economic share
    bool IsOwner(AssetId asset, const Address& who) const;

    /// Owner with a non-zero governance weight
    bool HasGovernanceRights(AssetId asset, const Address& who) const;

    uint32_t GetPercentage(AssetId asset, const Address& who) const;
    Weight GetGovernanceWeight(AssetId asset, const Address& who) const;
    std::optional<OwnerEntry> GetEntry(AssetId asset, const Address& who) const;

    /// Owner enumeration in insertion order; entries reduced to zero stay listed
    std::vector<OwnerEntry> GetOwners(AssetId asset) const;
    std::vector<Address> GetOwnerAddresses(AssetId asset) const;
    size_t GetOwnerCount(AssetId asset) const;

    /// Sum of governance weights over the current owner set
    Weight GetTotalGovernanceWeight(AssetId asset) const;

    /// Sum of percentages; 100 for every registered asset
    uint32_t GetTotalPercentage(AssetId asset) const;

private:
    struct OwnerTable {
        std::vector<Address> order;
        std::map<Address, OwnerEntry> entries;
    };

    const OwnerTable* FindTable(AssetId asset) const;

    ledger::LedgerGuard& guard_;
    ledger::EventJournal& journal_;

    mutable std::recursive_mutex mutex_;
    std::map<AssetId, OwnerTable> tables_;
};

} // namespace ownership
} // namespace commonip

#endif // COMMONIP_OWNERSHIP_OWNERSHIP_H
