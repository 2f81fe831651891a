// COMMONIP - Core Types Header
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Fundamental value types shared by every ledger component.

#ifndef COMMONIP_CORE_TYPES_H
#define COMMONIP_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace commonip {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in the smallest unit of a payment or asset token
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Governance weight attached to an owner
using Weight = uint64_t;

/// Sequential identifiers, allocated from 1. Zero means "none".
using AssetId = uint64_t;
using LicenseId = uint64_t;
using ProposalId = uint64_t;

constexpr uint64_t NULL_ID = 0;

/// Economic percentages of an asset always add up to this
constexpr uint32_t PERCENT_TOTAL = 100;

/// Denominator for rates expressed in basis points
constexpr int64_t BPS_DENOMINATOR = 10000;

constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque byte string used for hashes and addresses
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copy up to SIZE bytes, zero-padding short input
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, storage order
    std::string ToHex() const;

    /// Parse hex produced by ToHex (throws std::invalid_argument)
    static BaseHash FromHex(const std::string& hex);

    /// Abbreviated form for log lines
    std::string ToShortHex() const { return ToHex().substr(0, 8); }

private:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (SHA-256 digests of free-text fields)
using Hash256 = BaseHash<256>;

/// 160-bit account address (owners, licensees, token ledgers, the pool)
using Address = BaseHash<160>;

/// Payment currencies are identified by the address of their token ledger
using CurrencyId = Address;

// ============================================================================
// Arithmetic Helpers
// ============================================================================

/**
 * floor(value * numerator / denominator) for value >= 0 and
 * 0 <= numerator <= denominator. Split into quotient and remainder so the
 * intermediate product never exceeds the int64 range.
 */
inline Amount MulDivFloor(Amount value, int64_t numerator, int64_t denominator) {
    return (value / denominator) * numerator +
           ((value % denominator) * numerator) / denominator;
}

/// Same split computation for governance weights
inline Weight ScaleWeight(Weight value, uint64_t numerator, uint64_t denominator) {
    return (value / denominator) * numerator +
           ((value % denominator) * numerator) / denominator;
}

/// Add two non-negative amounts; false on overflow
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (a > MAX_AMOUNT - b) {
        return false;
    }
    out = a + b;
    return true;
}

inline bool CheckedAdd(Weight a, Weight b, Weight& out) {
    if (a > std::numeric_limits<Weight>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

/// Deadline `duration` seconds after `start`; false past the largest timestamp
inline bool CheckedDeadline(Timestamp start, int64_t duration, Timestamp& out) {
    if (duration < 0 || start > std::numeric_limits<Timestamp>::max() - duration) {
        return false;
    }
    out = start + duration;
    return true;
}

} // namespace commonip

#endif // COMMONIP_CORE_TYPES_H
