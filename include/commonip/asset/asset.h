// COMMONIP - Asset Registry
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Registration and mutable metadata of collectively-owned assets.
// Registering an asset installs its owner set in the Ownership Ledger and
// mints the initial supply through the asset token collaborator.

#ifndef COMMONIP_ASSET_ASSET_H
#define COMMONIP_ASSET_ASSET_H

#include <commonip/core/error.h>
#include <commonip/core/types.h>
#include <commonip/ledger/events.h>
#include <commonip/ledger/guard.h>
#include <commonip/ownership/ownership.h>
#include <commonip/token/asset_token.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace commonip {
namespace asset {

/// Units minted at registration, split by percentage
constexpr Amount DEFAULT_INITIAL_SUPPLY = 1000;

/// Compliance tag of a freshly registered asset
constexpr const char* DEFAULT_COMPLIANCE_STATUS = "pending";

// ============================================================================
// Asset
// ============================================================================

struct Asset {
    AssetId id{NULL_ID};

    /// Free-form type tag ("patent", "music", ...)
    std::string assetType;

    std::string metadataUri;

    /// SHA-256 of metadataUri
    Hash256 metadataHash;

    Amount totalSupply{0};
    Timestamp createdAt{0};

    /// Cached tag owned by the external compliance registry
    std::string complianceStatus{DEFAULT_COMPLIANCE_STATUS};

    /// Owner set at registration time
    std::vector<Address> creators;

    std::string ToString() const;
};

/// Fields a governance change actually modified
struct AssetChangeReport {
    bool metadataChanged{false};
    bool complianceChanged{false};

    bool Any() const { return metadataChanged || complianceChanged; }
};

// ============================================================================
// Asset Registry
// ============================================================================

class AssetRegistry {
public:
    AssetRegistry(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                  ownership::OwnershipLedger& owners, token::IAssetTokenLedger& tokens,
                  Amount initialSupply = DEFAULT_INITIAL_SUPPLY);

    /**
     * Register a new asset. Ids are sequential from 1. On success the
     * result's id is the new asset id.
     */
    Result RegisterAsset(const Address& caller, const std::string& assetType,
                         const std::string& metadataUri,
                         const std::vector<Address>& owners,
                         const std::vector<uint32_t>& percentages,
                         const std::vector<Weight>& weights);

    /// Owner-gated
    Result UpdateMetadata(const Address& caller, AssetId asset, const std::string& metadataUri);

    /// Owner-gated
    Result UpdateComplianceStatus(const Address& caller, AssetId asset,
                                  const std::string& status);

    /**
     * Mint additional supply pro-rata to current percentages. Floor residue
     * goes to the first owner holding a non-zero share.
     */
    Result MintAdditional(const Address& caller, AssetId asset, Amount amount);

    // === Governance (no owner check, caller holds the guard scope) ===

    Result SetMetadataInternal(AssetId asset, const std::string& metadataUri,
                               const Address& actor, bool& changed);
    Result SetComplianceInternal(AssetId asset, const std::string& status,
                                 const Address& actor, bool& changed);

    // === Queries ===

    bool HasAsset(AssetId asset) const;
    std::optional<Asset> GetAsset(AssetId asset) const;
    std::vector<AssetId> GetAssetsByComplianceStatus(const std::string& status) const;
    std::vector<Address> GetCreators(AssetId asset) const;
    size_t GetAssetCount() const;

    Amount InitialSupply() const { return initialSupply_; }

private:
    /// Split `amount` by percentage; residue to the first non-zero holder
    static std::vector<std::pair<Address, Amount>> SplitSupply(
        const std::vector<ownership::OwnerEntry>& entries, Amount amount);

    /// Mint every share or none; earlier mints are burned on failure
    Result MintShares(AssetId asset, const std::vector<std::pair<Address, Amount>>& shares);

    void BurnShares(AssetId asset, const std::vector<std::pair<Address, Amount>>& shares,
                    size_t count);

    ledger::LedgerGuard& guard_;
    ledger::EventJournal& journal_;
    ownership::OwnershipLedger& owners_;
    token::IAssetTokenLedger& tokens_;
    Amount initialSupply_;

    mutable std::recursive_mutex mutex_;
    std::map<AssetId, Asset> assets_;
    AssetId nextId_{1};
};

} // namespace asset
} // namespace commonip

#endif // COMMONIP_ASSET_ASSET_H
