// COMMONIP - Ledger Event Journal
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#ifndef COMMONIP_LEDGER_EVENTS_H
#define COMMONIP_LEDGER_EVENTS_H

#include <commonip/core/types.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace commonip {
namespace ledger {

/// Kinds of committed state changes
enum class EventType {
    AssetRegistered,
    MetadataUpdated,
    ComplianceUpdated,
    SupplyMinted,
    OwnershipRegistered,
    ShareTransferred,
    RevenueReceived,
    RevenueDistributed,
    RevenueWithdrawn,
    MinimumDistributionSet,
    LicenseOfferCreated,
    LicenseApproved,
    LicenseRejected,
    LicenseExecuted,
    LicenseRevoked,
    LicenseSuspended,
    LicenseReactivated,
    LicenseTransferred,
    UsageReported,
    RoyaltiesPaid,
    LicenseProposalCreated,
    LicenseProposalVoted,
    LicenseProposalExecuted,
    ProposalCreated,
    ProposalVoted,
    ProposalExecuted,
    ProposalCancelled,
    GovernanceSettingsChanged,
    Paused,
    Unpaused
};

const char* EventTypeToString(EventType type);

/**
 * One journal record. `id` is the license, proposal or asset the event is
 * about; `amount` carries the moved value or cast weight where relevant.
 */
struct LedgerEvent {
    uint64_t sequence{0};
    EventType type{EventType::AssetRegistered};
    uint64_t id{0};
    AssetId assetId{0};
    Address actor;
    Amount amount{0};
    Timestamp time{0};
    std::string detail;

    std::string ToString() const;
};

/**
 * Append-only record of committed operations. Operations record only after
 * every check has passed, so a rejected call leaves no trace here.
 */
class EventJournal {
public:
    /// Stamp time and sequence, then append
    void Record(EventType type, uint64_t id, AssetId asset, const Address& actor,
                Amount amount = 0, const std::string& detail = "");

    std::vector<LedgerEvent> GetEvents() const;
    std::vector<LedgerEvent> GetEventsByType(EventType type) const;
    std::vector<LedgerEvent> GetEventsForAsset(AssetId asset) const;
    std::optional<LedgerEvent> Last() const;

    size_t Size() const;
    size_t Count(EventType type) const;

private:
    mutable std::mutex mutex_;
    std::vector<LedgerEvent> events_;
};

} // namespace ledger
} // namespace commonip

#endif // COMMONIP_LEDGER_EVENTS_H
