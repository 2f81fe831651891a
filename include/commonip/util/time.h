// COMMONIP - Time Utilities
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Clock access for deadline and expiry checks. Every ledger component reads
// "now" through GetTime(), so tests can pin the clock with mock time.

#ifndef COMMONIP_UTIL_TIME_H
#define COMMONIP_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace commonip {
namespace util {

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
constexpr int64_t SECONDS_PER_WEEK = 7 * SECONDS_PER_DAY;

using Seconds = std::chrono::seconds;

// ============================================================================
// Clock
// ============================================================================

/// Current Unix time in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix time in milliseconds
int64_t GetTimeMillis();

/// Format a Unix timestamp as ISO 8601 ("2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Human-readable duration ("1d 2h 5m"), "0s" for zero
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze the clock at the current real time
void EnableMockTime();

/// Resume reading the system clock
void DisableMockTime();

bool IsMockTimeEnabled();

/// Pin the clock; enables mock time if needed
void SetMockTime(int64_t timestamp);

/// Move the pinned clock forward
void AdvanceMockTime(int64_t seconds);

} // namespace util
} // namespace commonip

#endif // COMMONIP_UTIL_TIME_H
