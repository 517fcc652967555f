// SHAREGOV - Proposal Store
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Proposal records and the append-only store that assigns their ids.

#ifndef SHAREGOV_GOVERNANCE_PROPOSAL_H
#define SHAREGOV_GOVERNANCE_PROPOSAL_H

#include <sharegov/governance/types.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Proposal
// ============================================================================

/**
 * A governance item voted on by the holders of one share class.
 *
 * Binary proposals have no options and take boolean votes. Multi-option
 * proposals declare at least two option names. The supply baseline is the
 * denominator every decision on this proposal uses; it is fixed when the
 * proposal is created.
 */
struct Proposal {
    ProposalId id{0};

    HolderId creator;
    std::string description;

    /// Declared option names; empty for binary yes/no proposals
    std::vector<std::string> options;

    Timestamp createdAt{0};

    /// 0 until voting is opened
    Timestamp votingStart{0};

    Timestamp deadline{0};

    bool finalized{false};
    Timestamp finalizedAt{0};

    /// Share class whose holders may vote
    ShareClassId shareClass{0};

    VoteWeighting weighting{VoteWeighting::PerHolder};

    /// Declared quorum base (0 = derive from supply)
    Amount quorumBase{0};

    /// Denominator for decisions, fixed at creation
    Amount supplyBaseline{0};

    /// Fraction this proposal votes on (0 = none)
    FractionId fractionId{0};

    /// Tally frozen by finalization
    uint64_t finalYes{0};
    uint64_t finalNo{0};
    std::vector<uint64_t> finalOptionCounts;

    /// SHA-256 of the frozen tally snapshot
    Hash256 tallyDigest{};

    bool IsMultiOption() const { return !options.empty(); }
    bool IsVotingOpened() const { return votingStart != 0; }

    /// Position of a declared option
    std::optional<size_t> OptionIndex(const std::string& name) const;

    /// Hash of the serialized record
    Hash256 GetHash() const;

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, id);
        Serialize(s, creator);
        Serialize(s, description);
        Serialize(s, options);
        Serialize(s, createdAt);
        Serialize(s, votingStart);
        Serialize(s, deadline);
        Serialize(s, finalized);
        Serialize(s, finalizedAt);
        Serialize(s, shareClass);
        Serialize(s, static_cast<uint8_t>(weighting));
        Serialize(s, quorumBase);
        Serialize(s, supplyBaseline);
        Serialize(s, fractionId);
        Serialize(s, finalYes);
        Serialize(s, finalNo);
        Serialize(s, finalOptionCounts);
        Serialize(s, tallyDigest);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        uint8_t weightingByte = 0;
        Unserialize(s, id);
        Unserialize(s, creator);
        Unserialize(s, description);
        Unserialize(s, options);
        Unserialize(s, createdAt);
        Unserialize(s, votingStart);
        Unserialize(s, deadline);
        Unserialize(s, finalized);
        Unserialize(s, finalizedAt);
        Unserialize(s, shareClass);
        Unserialize(s, weightingByte);
        Unserialize(s, quorumBase);
        Unserialize(s, supplyBaseline);
        Unserialize(s, fractionId);
        Unserialize(s, finalYes);
        Unserialize(s, finalNo);
        Unserialize(s, finalOptionCounts);
        Unserialize(s, tallyDigest);
        if (weightingByte > static_cast<uint8_t>(VoteWeighting::ByBalance)) {
            throw std::ios_base::failure("Proposal: unknown vote weighting");
        }
        weighting = static_cast<VoteWeighting>(weightingByte);
    }
};

// ============================================================================
// Proposal Store
// ============================================================================

/// Limits applied to new proposals
struct ProposalLimits {
    size_t maxDescriptionLength;
    size_t maxOptions;
};

/**
 * Append-only proposal storage with sequential ids starting at 1.
 *
 * Not internally synchronized; the governance engine serializes access.
 */
class ProposalStore {
public:
    ProposalStore() = default;

    /// Validate description and options of a proposal about to be created
    static Status ValidateContent(const std::string& description,
                                  const std::vector<std::string>& options,
                                  const ProposalLimits& limits);

    /// Id the next Add() must carry
    ProposalId PeekNextId() const { return nextId_; }

    /// Append a proposal; its id must equal PeekNextId()
    bool Add(Proposal proposal);

    /// Re-insert a persisted proposal (any id); advances the id counter
    void Restore(Proposal proposal);

    const Proposal* Get(ProposalId id) const;
    Proposal* GetMutable(ProposalId id);

    bool Contains(ProposalId id) const { return proposals_.count(id) > 0; }

    /// Number of proposals ever created
    size_t Count() const { return proposals_.size(); }

    /// All proposal ids in creation order
    std::vector<ProposalId> GetIds() const;

    void Clear();

private:
    std::map<ProposalId, Proposal> proposals_;
    ProposalId nextId_{1};
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_PROPOSAL_H
