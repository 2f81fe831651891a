// COMMONIP - Asset Registry Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/asset/asset.h>
#include <commonip/crypto/sha256.h>
#include <commonip/util/logging.h>
#include <commonip/util/time.h>

#include <cstdint>
#include <sstream>

namespace commonip {
namespace asset {

using ledger::EventType;
using ledger::Reject;

namespace {
const char* CATEGORY = util::LogCategory::ASSET;
}

std::string Asset::ToString() const {
    std::ostringstream oss;
    oss << "Asset(id=" << id << ", type=" << assetType << ", supply=" << totalSupply
        << ", compliance=" << complianceStatus << ", creators=" << creators.size() << ")";
    return oss.str();
}

AssetRegistry::AssetRegistry(ledger::LedgerGuard& guard, ledger::EventJournal& journal,
                             ownership::OwnershipLedger& owners,
                             token::IAssetTokenLedger& tokens, Amount initialSupply)
    : guard_(guard), journal_(journal), owners_(owners), tokens_(tokens),
      initialSupply_(initialSupply) {}

// ============================================================================
// Registration
// ============================================================================

Result AssetRegistry::RegisterAsset(const Address& caller, const std::string& assetType,
                                    const std::string& metadataUri,
                                    const std::vector<Address>& owners,
                                    const std::vector<uint32_t>& percentages,
                                    const std::vector<Weight>& weights) {
    auto scope = guard_.Enter("RegisterAsset");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (caller.IsNull()) {
        return Reject(CATEGORY, "RegisterAsset", ErrorCode::NULL_ADDRESS, "caller");
    }

    Result valid = ownership::OwnershipLedger::ValidateShares(owners, percentages, weights);
    if (!valid.IsOk()) {
        LOG_DEBUG(CATEGORY) << "RegisterAsset rejected: " << valid.reason;
        return valid;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    AssetId id = nextId_;

    std::vector<ownership::OwnerEntry> entries(owners.size());
    for (size_t i = 0; i < owners.size(); ++i) {
        entries[i].owner = owners[i];
        entries[i].percentage = percentages[i];
    }
    auto shares = SplitSupply(entries, initialSupply_);
    Result minted = MintShares(id, shares);
    if (!minted.IsOk()) {
        return minted;
    }

    Result applied = owners_.ApplyOwnership(id, owners, percentages, weights);
    if (!applied.IsOk()) {
        BurnShares(id, shares, shares.size());
        return applied;
    }

    Asset record;
    record.id = id;
    record.assetType = assetType;
    record.metadataUri = metadataUri;
    record.metadataHash = SHA256Hash(metadataUri);
    record.totalSupply = initialSupply_;
    record.createdAt = util::GetTime();
    record.creators = owners;
    assets_[id] = record;
    ++nextId_;

    journal_.Record(EventType::AssetRegistered, id, id, caller, initialSupply_, assetType);
    LOG_INFO(CATEGORY) << "Registered asset " << id << " (" << assetType << ") with "
                       << owners.size() << " owners";
    return Result::Success(id);
}

std::vector<std::pair<Address, Amount>> AssetRegistry::SplitSupply(
    const std::vector<ownership::OwnerEntry>& entries, Amount amount) {
    std::vector<std::pair<Address, Amount>> shares;
    Amount assigned = 0;
    for (const auto& entry : entries) {
        if (entry.percentage == 0) {
            continue;
        }
        Amount units = MulDivFloor(amount, entry.percentage, PERCENT_TOTAL);
        assigned += units;
        shares.emplace_back(entry.owner, units);
    }
    if (!shares.empty()) {
        shares.front().second += amount - assigned;
    }
    return shares;
}

Result AssetRegistry::MintShares(AssetId asset,
                                 const std::vector<std::pair<Address, Amount>>& shares) {
    for (size_t i = 0; i < shares.size(); ++i) {
        const auto& [holder, units] = shares[i];
        if (units == 0) {
            continue;
        }
        Result minted = tokens_.Mint(holder, asset, units);
        if (!minted.IsOk()) {
            LOG_ERROR(CATEGORY) << "Mint of " << units << " units of asset " << asset
                                << " to " << holder.ToShortHex() << " failed: "
                                << minted.reason;
            BurnShares(asset, shares, i);
            return minted;
        }
    }
    return Result::Success();
}

void AssetRegistry::BurnShares(AssetId asset,
                               const std::vector<std::pair<Address, Amount>>& shares,
                               size_t count) {
    for (size_t i = 0; i < count; ++i) {
        const auto& [holder, units] = shares[i];
        if (units == 0) {
            continue;
        }
        Result burned = tokens_.Burn(holder, asset, units);
        if (!burned.IsOk()) {
            LOG_ERROR(CATEGORY) << "Rollback of " << units << " units of asset " << asset
                                << " from " << holder.ToShortHex() << " failed: "
                                << burned.reason;
        }
    }
}

// ============================================================================
// Owner Updates
// ============================================================================

Result AssetRegistry::UpdateMetadata(const Address& caller, AssetId asset,
                                     const std::string& metadataUri) {
    auto scope = guard_.Enter("UpdateMetadata");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!HasAsset(asset)) {
        return Reject(CATEGORY, "UpdateMetadata", ErrorCode::ASSET_NOT_FOUND);
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "UpdateMetadata", ErrorCode::NOT_ASSET_OWNER);
    }
    bool changed = false;
    return SetMetadataInternal(asset, metadataUri, caller, changed);
}

Result AssetRegistry::UpdateComplianceStatus(const Address& caller, AssetId asset,
                                             const std::string& status) {
    auto scope = guard_.Enter("UpdateComplianceStatus");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!HasAsset(asset)) {
        return Reject(CATEGORY, "UpdateComplianceStatus", ErrorCode::ASSET_NOT_FOUND);
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "UpdateComplianceStatus", ErrorCode::NOT_ASSET_OWNER);
    }
    bool changed = false;
    return SetComplianceInternal(asset, status, caller, changed);
}

Result AssetRegistry::MintAdditional(const Address& caller, AssetId asset, Amount amount) {
    auto scope = guard_.Enter("MintAdditional");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        return Reject(CATEGORY, "MintAdditional", ErrorCode::ASSET_NOT_FOUND);
    }
    if (!owners_.IsOwner(asset, caller)) {
        return Reject(CATEGORY, "MintAdditional", ErrorCode::NOT_ASSET_OWNER);
    }
    if (amount <= 0) {
        return Reject(CATEGORY, "MintAdditional", ErrorCode::INVALID_AMOUNT);
    }
    Amount newSupply = 0;
    if (!CheckedAdd(it->second.totalSupply, amount, newSupply)) {
        return Reject(CATEGORY, "MintAdditional", ErrorCode::AMOUNT_OVERFLOW);
    }

    Result minted = MintShares(asset, SplitSupply(owners_.GetOwners(asset), amount));
    if (!minted.IsOk()) {
        return minted;
    }
    it->second.totalSupply = newSupply;

    journal_.Record(EventType::SupplyMinted, asset, asset, caller, amount);
    LOG_INFO(CATEGORY) << "Minted " << amount << " additional units of asset " << asset
                       << " (supply " << newSupply << ")";
    return Result::Success(asset);
}

// ============================================================================
// Governance Setters
// ============================================================================

Result AssetRegistry::SetMetadataInternal(AssetId asset, const std::string& metadataUri,
                                          const Address& actor, bool& changed) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    changed = false;
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        return Result::Error(ErrorCode::ASSET_NOT_FOUND);
    }
    if (it->second.metadataUri == metadataUri) {
        return Result::Success(asset);
    }
    it->second.metadataUri = metadataUri;
    it->second.metadataHash = SHA256Hash(metadataUri);
    changed = true;

    journal_.Record(EventType::MetadataUpdated, asset, asset, actor, 0, metadataUri);
    LOG_INFO(CATEGORY) << "Asset " << asset << " metadata now "
                       << it->second.metadataHash.ToShortHex();
    return Result::Success(asset);
}

Result AssetRegistry::SetComplianceInternal(AssetId asset, const std::string& status,
                                            const Address& actor, bool& changed) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    changed = false;
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        return Result::Error(ErrorCode::ASSET_NOT_FOUND);
    }
    if (it->second.complianceStatus == status) {
        return Result::Success(asset);
    }
    std::string previous = it->second.complianceStatus;
    it->second.complianceStatus = status;
    changed = true;

    journal_.Record(EventType::ComplianceUpdated, asset, asset, actor, 0, status);
    LOG_INFO(CATEGORY) << "Asset " << asset << " compliance " << previous << " -> " << status;
    return Result::Success(asset);
}

// ============================================================================
// Queries
// ============================================================================

bool AssetRegistry::HasAsset(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return assets_.count(asset) > 0;
}

std::optional<Asset> AssetRegistry::GetAsset(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AssetId> AssetRegistry::GetAssetsByComplianceStatus(const std::string& status) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<AssetId> result;
    for (const auto& [id, record] : assets_) {
        if (record.complianceStatus == status) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<Address> AssetRegistry::GetCreators(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = assets_.find(asset);
    return it == assets_.end() ? std::vector<Address>{} : it->second.creators;
}

size_t AssetRegistry::GetAssetCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return assets_.size();
}

} // namespace asset
} // namespace commonip
