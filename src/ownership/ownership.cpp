// COMMONIP - Ownership Ledger Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/ownership/ownership.h>
#include <commonip/util/logging.h>

#include <set>
#include <sstream>

namespace commonip {
namespace ownership {

using ledger::EventType;
using ledger::Reject;

namespace {
const char* CATEGORY = util::LogCategory::OWNERSHIP;
}

std::string OwnerEntry::ToString() const {
    std::ostringstream oss;
    oss << "OwnerEntry(" << owner.ToShortHex() << ", " << percentage << "%, weight="
        << governanceWeight << ")";
    return oss.str();
}

OwnershipLedger::OwnershipLedger(ledger::LedgerGuard& guard, ledger::EventJournal& journal)
    : guard_(guard), journal_(journal) {}

// ============================================================================
// Registration
// ============================================================================

Result OwnershipLedger::ValidateShares(const std::vector<Address>& owners,
                                       const std::vector<uint32_t>& percentages,
                                       const std::vector<Weight>& weights) {
    if (owners.size() != percentages.size() || owners.size() != weights.size()) {
        return Result::Error(ErrorCode::LENGTH_MISMATCH);
    }
    if (owners.empty()) {
        return Result::Error(ErrorCode::EMPTY_OWNER_LIST);
    }

    std::set<Address> seen;
    uint32_t sum = 0;
    Weight totalWeight = 0;
    for (size_t i = 0; i < owners.size(); ++i) {
        if (owners[i].IsNull()) {
            return Result::Error(ErrorCode::NULL_ADDRESS, "owner " + std::to_string(i));
        }
        if (!seen.insert(owners[i]).second) {
            return Result::Error(ErrorCode::DUPLICATE_OWNER, owners[i].ToShortHex());
        }
        if (percentages[i] > PERCENT_TOTAL) {
            return Result::Error(ErrorCode::PERCENTAGE_OUT_OF_RANGE);
        }
        sum += percentages[i];
        if (!CheckedAdd(totalWeight, weights[i], totalWeight)) {
            return Result::Error(ErrorCode::WEIGHT_OVERFLOW);
        }
    }
    if (sum != PERCENT_TOTAL) {
        return Result::Error(ErrorCode::PERCENTAGE_SUM_INVALID, "got " + std::to_string(sum));
    }
    return Result::Success();
}

Result OwnershipLedger::ApplyOwnership(AssetId asset, const std::vector<Address>& owners,
                                       const std::vector<uint32_t>& percentages,
                                       const std::vector<Weight>& weights) {
    Result valid = ValidateShares(owners, percentages, weights);
    if (!valid.IsOk()) {
        return valid;
    }

    OwnerTable table;
    for (size_t i = 0; i < owners.size(); ++i) {
        OwnerEntry entry;
        entry.owner = owners[i];
        entry.percentage = percentages[i];
        entry.governanceWeight = weights[i];
        entry.isMember = true;
        table.order.push_back(owners[i]);
        table.entries[owners[i]] = entry;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    tables_[asset] = std::move(table);
    return Result::Success();
}

Result OwnershipLedger::RegisterOwnership(const Address& caller, AssetId asset,
                                          const std::vector<Address>& owners,
                                          const std::vector<uint32_t>& percentages,
                                          const std::vector<Weight>& weights) {
    auto scope = guard_.Enter("RegisterOwnership");
    if (!scope.Ok()) {
        return scope.Status();
    }
    if (!guard_.IsAdmin(caller)) {
        return Reject(CATEGORY, "RegisterOwnership", ErrorCode::NOT_ADMIN);
    }

    Result applied = ApplyOwnership(asset, owners, percentages, weights);
    if (!applied.IsOk()) {
        LOG_DEBUG(CATEGORY) << "RegisterOwnership rejected: " << applied.reason;
        return applied;
    }

    journal_.Record(EventType::OwnershipRegistered, asset, asset, caller,
                    static_cast<Amount>(owners.size()));
    LOG_INFO(CATEGORY) << "Asset " << asset << " owner set replaced ("
                       << owners.size() << " owners)";
    return Result::Success(asset);
}

// ============================================================================
// Share Transfer
// ============================================================================

Result OwnershipLedger::TransferShare(const Address& caller, AssetId asset,
                                      const Address& from, const Address& to,
                                      uint32_t percentage) {
    auto scope = guard_.Enter("TransferShare");
    if (!scope.Ok()) {
        return scope.Status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto tableIt = tables_.find(asset);
    if (tableIt == tables_.end()) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::NO_OWNERSHIP_RECORD);
    }
    if (caller != from) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::NOT_SHARE_HOLDER);
    }
    if (to.IsNull()) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::NULL_ADDRESS);
    }
    if (to == from) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::SELF_TRANSFER);
    }
    if (percentage == 0 || percentage > PERCENT_TOTAL) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::PERCENTAGE_OUT_OF_RANGE);
    }

    OwnerTable& table = tableIt->second;
    auto fromIt = table.entries.find(from);
    if (fromIt == table.entries.end() || fromIt->second.percentage == 0) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::NOT_ASSET_OWNER);
    }
    OwnerEntry& source = fromIt->second;
    if (source.percentage < percentage) {
        return Reject(CATEGORY, "TransferShare", ErrorCode::INSUFFICIENT_SHARE,
                      std::to_string(source.percentage) + " < " + std::to_string(percentage));
    }

    Weight weightMoved = ScaleWeight(source.governanceWeight, percentage, source.percentage);

    auto toIt = table.entries.find(to);
    if (toIt != table.entries.end()) {
        Weight newWeight = 0;
        if (!CheckedAdd(toIt->second.governanceWeight, weightMoved, newWeight)) {
            return Reject(CATEGORY, "TransferShare", ErrorCode::WEIGHT_OVERFLOW);
        }
    }

    source.percentage -= percentage;
    source.governanceWeight -= weightMoved;

    if (toIt == table.entries.end()) {
        OwnerEntry entry;
        entry.owner = to;
        entry.isMember = true;
        toIt = table.entries.emplace(to, entry).first;
        table.order.push_back(to);
    }
    toIt->second.percentage += percentage;
    toIt->second.governanceWeight += weightMoved;
    toIt->second.isMember = true;

    journal_.Record(EventType::ShareTransferred, asset, asset, from,
                    static_cast<Amount>(percentage),
                    "to " + to.ToShortHex() + ", weight " + std::to_string(weightMoved));
    LOG_INFO(CATEGORY) << "Asset " << asset << ": " << from.ToShortHex() << " -> "
                       << to.ToShortHex() << " " << percentage << "% (weight "
                       << weightMoved << ")";
    return Result::Success();
}

// ============================================================================
// Queries
// ============================================================================

const OwnershipLedger::OwnerTable* OwnershipLedger::FindTable(AssetId asset) const {
    auto it = tables_.find(asset);
    return it == tables_.end() ? nullptr : &it->second;
}

bool OwnershipLedger::HasOwnership(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return FindTable(asset) != nullptr;
}

bool OwnershipLedger::IsOwner(AssetId asset, const Address& who) const {
    return GetPercentage(asset, who) > 0;
}

bool OwnershipLedger::HasGovernanceRights(AssetId asset, const Address& who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    if (!table) {
        return false;
    }
    auto it = table->entries.find(who);
    return it != table->entries.end() && it->second.percentage > 0 &&
           it->second.governanceWeight > 0;
}

uint32_t OwnershipLedger::GetPercentage(AssetId asset, const Address& who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    if (!table) {
        return 0;
    }
    auto it = table->entries.find(who);
    return it == table->entries.end() ? 0 : it->second.percentage;
}

Weight OwnershipLedger::GetGovernanceWeight(AssetId asset, const Address& who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    if (!table) {
        return 0;
    }
    auto it = table->entries.find(who);
    return it == table->entries.end() ? 0 : it->second.governanceWeight;
}

std::optional<OwnerEntry> OwnershipLedger::GetEntry(AssetId asset, const Address& who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    if (!table) {
        return std::nullopt;
    }
    auto it = table->entries.find(who);
    if (it == table->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<OwnerEntry> OwnershipLedger::GetOwners(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<OwnerEntry> result;
    const OwnerTable* table = FindTable(asset);
    if (!table) {
        return result;
    }
    result.reserve(table->order.size());
    for (const auto& addr : table->order) {
        result.push_back(table->entries.at(addr));
    }
    return result;
}

std::vector<Address> OwnershipLedger::GetOwnerAddresses(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    return table ? table->order : std::vector<Address>{};
}

size_t OwnershipLedger::GetOwnerCount(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    return table ? table->order.size() : 0;
}

Weight OwnershipLedger::GetTotalGovernanceWeight(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    Weight total = 0;
    if (table) {
        for (const auto& [addr, entry] : table->entries) {
            total += entry.governanceWeight;
        }
    }
    return total;
}

uint32_t OwnershipLedger::GetTotalPercentage(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const OwnerTable* table = FindTable(asset);
    uint32_t total = 0;
    if (table) {
        for (const auto& [addr, entry] : table->entries) {
            total += entry.percentage;
        }
    }
    return total;
}

} // namespace ownership
} // namespace commonip
