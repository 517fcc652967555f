// SHAREGOV - Core Types Header
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// This file defines fundamental types used throughout SHAREGOV.

#ifndef SHAREGOV_CORE_TYPES_H
#define SHAREGOV_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sharegov {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Share amount in indivisible units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds, or logical clock ticks under mock time)
using Timestamp = int64_t;

/// Identity of a share holder, voter or operator
using HolderId = std::string;

/// Share class (token id) within the multi-asset ledger
using ShareClassId = uint64_t;

/// Tokenized asset identifier
using AssetId = uint64_t;

/// Proposal identifier (monotonic, starts at 1)
using ProposalId = uint64_t;

/// Fraction record identifier (monotonic, starts at 1)
using FractionId = uint64_t;

/// 256-bit digest
using Hash256 = std::array<Byte, 32>;

/// Largest amount any single holding may carry
constexpr Amount MAX_AMOUNT = INT64_C(1) << 62;

/// Check if amount is in valid range
inline bool AmountRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

/// Check if a holder id is usable as a ledger or vote key
inline bool IsValidHolderId(const HolderId& id) {
    return !id.empty() && id.size() <= 128;
}

} // namespace sharegov

#endif // SHAREGOV_CORE_TYPES_H
