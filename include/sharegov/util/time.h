// SHAREGOV - Time Utilities
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// The governance engine runs on a logical clock: every deadline and voting
// window is compared against GetTime(). Mock time lets tests and replay tools
// drive that clock explicitly.

#ifndef SHAREGOV_UTIL_TIME_H
#define SHAREGOV_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sharegov {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting
// ============================================================================

/// Format as ISO 8601 UTC (2024-01-15T10:30:00Z)
std::string FormatISO8601(int64_t timestamp);

/// Parse ISO 8601 UTC; nullopt if malformed
std::optional<int64_t> ParseISO8601(const std::string& str);

/// Human readable duration ("1d 2h 3m 4s")
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time
// ============================================================================

/// Enable mock time (starts at the current real time if never set)
void EnableMockTime();

/// Disable mock time
void DisableMockTime();

bool IsMockTimeEnabled();

/// Set mock time; has effect on GetTime() once enabled
void SetMockTime(int64_t timestamp);

/// Advance mock time by the given number of seconds
void AdvanceMockTime(int64_t seconds);

int64_t GetMockTime();

} // namespace util
} // namespace sharegov

#endif // SHAREGOV_UTIL_TIME_H
