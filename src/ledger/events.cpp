// COMMONIP - Ledger Event Journal Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/ledger/events.h>
#include <commonip/util/time.h>

#include <sstream>

namespace commonip {
namespace ledger {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::AssetRegistered: return "AssetRegistered";
        case EventType::MetadataUpdated: return "MetadataUpdated";
        case EventType::ComplianceUpdated: return "ComplianceUpdated";
        case EventType::SupplyMinted: return "SupplyMinted";
        case EventType::OwnershipRegistered: return "OwnershipRegistered";
        case EventType::ShareTransferred: return "ShareTransferred";
        case EventType::RevenueReceived: return "RevenueReceived";
        case EventType::RevenueDistributed: return "RevenueDistributed";
        case EventType::RevenueWithdrawn: return "RevenueWithdrawn";
        case EventType::MinimumDistributionSet: return "MinimumDistributionSet";
        case EventType::LicenseOfferCreated: return "LicenseOfferCreated";
        case EventType::LicenseApproved: return "LicenseApproved";
        case EventType::LicenseRejected: return "LicenseRejected";
        case EventType::LicenseExecuted: return "LicenseExecuted";
        case EventType::LicenseRevoked: return "LicenseRevoked";
        case EventType::LicenseSuspended: return "LicenseSuspended";
        case EventType::LicenseReactivated: return "LicenseReactivated";
        case EventType::LicenseTransferred: return "LicenseTransferred";
        case EventType::UsageReported: return "UsageReported";
        case EventType::RoyaltiesPaid: return "RoyaltiesPaid";
        case EventType::LicenseProposalCreated: return "LicenseProposalCreated";
        case EventType::LicenseProposalVoted: return "LicenseProposalVoted";
        case EventType::LicenseProposalExecuted: return "LicenseProposalExecuted";
        case EventType::ProposalCreated: return "GovernanceProposalCreated";
        case EventType::ProposalVoted: return "GovernanceVoteCast";
        case EventType::ProposalExecuted: return "ProposalExecuted";
        case EventType::ProposalCancelled: return "ProposalCancelled";
        case EventType::GovernanceSettingsChanged: return "GovernanceSettingsChanged";
        case EventType::Paused: return "Paused";
        case EventType::Unpaused: return "Unpaused";
        default: return "Unknown";
    }
}

std::string LedgerEvent::ToString() const {
    std::ostringstream oss;
    oss << "#" << sequence << " " << EventTypeToString(type);
    if (id != 0) oss << " id=" << id;
    if (assetId != 0) oss << " asset=" << assetId;
    if (!actor.IsNull()) oss << " actor=" << actor.ToShortHex();
    if (amount != 0) oss << " amount=" << amount;
    if (!detail.empty()) oss << " (" << detail << ")";
    return oss.str();
}

void EventJournal::Record(EventType type, uint64_t id, AssetId asset, const Address& actor,
                          Amount amount, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerEvent event;
    event.sequence = events_.size() + 1;
    event.type = type;
    event.id = id;
    event.assetId = asset;
    event.actor = actor;
    event.amount = amount;
    event.time = util::GetTime();
    event.detail = detail;
    events_.push_back(std::move(event));
}

std::vector<LedgerEvent> EventJournal::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<LedgerEvent> EventJournal::GetEventsByType(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEvent> result;
    for (const auto& event : events_) {
        if (event.type == type) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<LedgerEvent> EventJournal::GetEventsForAsset(AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEvent> result;
    for (const auto& event : events_) {
        if (event.assetId == asset) {
            result.push_back(event);
        }
    }
    return result;
}

std::optional<LedgerEvent> EventJournal::Last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    return events_.back();
}

size_t EventJournal::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t EventJournal::Count(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& event : events_) {
        if (event.type == type) {
            ++count;
        }
    }
    return count;
}

} // namespace ledger
} // namespace commonip
