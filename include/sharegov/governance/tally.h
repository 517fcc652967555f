// SHAREGOV - Tally Engine
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Running vote counters per proposal and the decision rules applied to
// them. Counters are updated when a vote is accepted, so computing a
// decision never scans votes or fractions.

#ifndef SHAREGOV_GOVERNANCE_TALLY_H
#define SHAREGOV_GOVERNANCE_TALLY_H

#include <sharegov/governance/proposal.h>
#include <sharegov/governance/types.h>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sharegov {
namespace governance {

// ============================================================================
// Tally Sheet
// ============================================================================

/// Running counters of one proposal
struct TallySheet {
    /// Binary proposals
    uint64_t yes{0};
    uint64_t no{0};

    /// Multi-option proposals, in declaration order
    std::vector<uint64_t> optionCounts;

    /// Accepted votes regardless of weight
    uint64_t voteCount{0};

    /// Sum of every counter
    uint64_t TotalWeight() const;

    bool operator==(const TallySheet& other) const {
        return yes == other.yes && no == other.no &&
               optionCounts == other.optionCounts && voteCount == other.voteCount;
    }

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, yes);
        Serialize(s, no);
        Serialize(s, optionCounts);
        Serialize(s, voteCount);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, yes);
        Unserialize(s, no);
        Unserialize(s, optionCounts);
        Unserialize(s, voteCount);
    }
};

// ============================================================================
// Decision
// ============================================================================

struct Decision {
    bool passed{false};
    GovernanceModel model{GovernanceModel::SimpleMajority};

    /// Count compared against the threshold
    uint64_t affirmative{0};

    /// Fixed supply baseline of the proposal
    uint64_t totalSupply{0};

    /// Smallest affirmative count that passes (equal to totalSupply for Consensus)
    uint64_t threshold{0};

    uint64_t yes{0};
    uint64_t no{0};

    /// Leading option of a multi-option proposal
    std::optional<std::string> winningOption;

    std::string ToString() const;
};

// ============================================================================
// Tally Engine
// ============================================================================

/**
 * Owns the running tally of every proposal.
 *
 * Not internally synchronized; the governance engine serializes access.
 */
class TallyEngine {
public:
    const TallySheet* Get(ProposalId id) const;

    /// Replace a proposal's sheet (after the caller applied and persisted a vote)
    void Put(ProposalId id, TallySheet sheet);

    size_t Size() const { return sheets_.size(); }
    void Clear() { sheets_.clear(); }

    /**
     * Add one vote to a sheet.
     * @return InvalidOption if the choice does not fit the proposal kind or
     *         names an undeclared option; the sheet is unchanged on error
     */
    static Status ApplyVote(TallySheet& sheet, const Proposal& proposal,
                            const VoteChoice& choice, uint64_t weight);

    /// Smallest affirmative count that passes under the model
    static uint64_t Threshold(GovernanceModel model, uint64_t totalSupply);

    /// Apply a decision rule with unsigned arithmetic
    static bool EvaluateModel(GovernanceModel model, uint64_t affirmative, uint64_t totalSupply);

    /// Leading option (highest count, earliest declared on ties)
    static std::optional<size_t> LeadingOption(const std::vector<uint64_t>& counts);

    /// Decide a proposal from a sheet; finalized proposals use their frozen tally
    static Decision ComputeDecision(const Proposal& proposal, const TallySheet& sheet,
                                    GovernanceModel model);

    /// (option, count) in declaration order; binary proposals report yes, no
    static std::vector<std::pair<std::string, uint64_t>> GetResults(const Proposal& proposal,
                                                                    const TallySheet& sheet);

    /// Count for one option name; nullopt for names the proposal does not know
    static std::optional<uint64_t> GetOptionCount(const Proposal& proposal,
                                                  const TallySheet& sheet,
                                                  const std::string& option);

    /**
     * Yes/no pair reported by voting history and finalization events.
     * Multi-option proposals report the leading option as yes and the sum
     * of the other options as no.
     */
    static std::pair<uint64_t, uint64_t> YesNo(const Proposal& proposal, const TallySheet& sheet);

    /// Frozen tally of a finalized proposal as a sheet
    static TallySheet FrozenSheet(const Proposal& proposal, uint64_t voteCount);

    /// Digest of a frozen tally snapshot
    static Hash256 SnapshotDigest(ProposalId id, const TallySheet& sheet);

private:
    std::map<ProposalId, TallySheet> sheets_;
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_TALLY_H
