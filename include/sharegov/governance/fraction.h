// SHAREGOV - Fraction Registry
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Ownership entries for fractionalized assets. The vote on a fraction is an
// ordinary binary proposal linked from the entry; per-holder votes live in
// that proposal's vote records.

#ifndef SHAREGOV_GOVERNANCE_FRACTION_H
#define SHAREGOV_GOVERNANCE_FRACTION_H

#include <sharegov/governance/types.h>

#include <map>
#include <string>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Fraction Record
// ============================================================================

struct FractionRecord {
    FractionId id{0};

    /// Asset the shares were minted against
    AssetId assetId{0};

    ShareClassId shareClass{0};

    /// Shares minted for this fraction; the baseline of its vote
    Amount totalMinted{0};

    /// Class supply seen by the ledger when the fraction was registered
    Amount trackedAmount{0};

    HolderId owner;
    Timestamp createdAt{0};

    /// Linked fraction-vote proposal (0 until created)
    ProposalId proposalId{0};

    bool HasVote() const { return proposalId != 0; }

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, id);
        Serialize(s, assetId);
        Serialize(s, shareClass);
        Serialize(s, totalMinted);
        Serialize(s, trackedAmount);
        Serialize(s, owner);
        Serialize(s, createdAt);
        Serialize(s, proposalId);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, id);
        Unserialize(s, assetId);
        Unserialize(s, shareClass);
        Unserialize(s, totalMinted);
        Unserialize(s, trackedAmount);
        Unserialize(s, owner);
        Unserialize(s, createdAt);
        Unserialize(s, proposalId);
    }
};

// ============================================================================
// Fraction Registry
// ============================================================================

/// Fraction entries with sequential ids starting at 1. Not internally synchronized.
class FractionRegistry {
public:
    FractionId PeekNextId() const { return nextId_; }

    /// Append an entry; its id must equal PeekNextId()
    bool Add(FractionRecord record);

    /// Replace an existing entry (e.g. to link its proposal)
    bool Update(const FractionRecord& record);

    /// Re-insert a persisted entry; advances the id counter
    void Restore(FractionRecord record);

    const FractionRecord* Get(FractionId id) const;

    /// Fractions registered against an asset
    std::vector<FractionRecord> GetByAsset(AssetId assetId) const;

    size_t Count() const { return fractions_.size(); }

    void Clear();

private:
    std::map<FractionId, FractionRecord> fractions_;
    FractionId nextId_{1};
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_FRACTION_H
