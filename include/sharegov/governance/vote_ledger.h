// SHAREGOV - Vote Ledger
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// One vote record per (proposal, voter). Records are never overwritten.

#ifndef SHAREGOV_GOVERNANCE_VOTE_LEDGER_H
#define SHAREGOV_GOVERNANCE_VOTE_LEDGER_H

#include <sharegov/governance/types.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Vote Record
// ============================================================================

struct VoteRecord {
    ProposalId proposalId{0};
    HolderId voter;
    VoteChoice choice{false};

    /// Weight the vote contributed to the tally
    uint64_t weight{0};

    Timestamp castAt{0};

    /// Receipt hash over the serialized record
    Hash256 GetHash() const;

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, proposalId);
        Serialize(s, voter);
        SerializeChoice(s, choice);
        Serialize(s, weight);
        Serialize(s, castAt);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, proposalId);
        Unserialize(s, voter);
        UnserializeChoice(s, choice);
        Unserialize(s, weight);
        Unserialize(s, castAt);
    }
};

// ============================================================================
// Vote Ledger
// ============================================================================

/**
 * Vote records keyed by the flat composite (proposal id, voter).
 *
 * Votes of one proposal are contiguous in key order, so per-proposal scans
 * are range lookups. Not internally synchronized.
 */
class VoteLedger {
public:
    using Key = std::pair<ProposalId, HolderId>;

    bool HasVoted(ProposalId proposalId, const HolderId& voter) const;

    const VoteRecord* Get(ProposalId proposalId, const HolderId& voter) const;

    /// Insert a record; false (and no change) if the pair already voted
    bool Insert(VoteRecord record);

    /// Votes on one proposal ordered by voter
    std::vector<VoteRecord> GetVotes(ProposalId proposalId) const;

    /// Number of votes on one proposal
    size_t CountVotes(ProposalId proposalId) const;

    /// Total records across all proposals
    size_t Size() const { return votes_.size(); }

    void Clear() { votes_.clear(); }

private:
    std::map<Key, VoteRecord> votes_;
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_VOTE_LEDGER_H
