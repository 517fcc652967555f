// SHAREGOV - Lifecycle Controller
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Phase ordering of proposals: Created -> VotingOpen -> Closed -> Finalized.
// Closed is computed from the clock; the other phases come from the record.

#ifndef SHAREGOV_GOVERNANCE_LIFECYCLE_H
#define SHAREGOV_GOVERNANCE_LIFECYCLE_H

#include <sharegov/governance/proposal.h>
#include <sharegov/governance/types.h>

namespace sharegov {
namespace governance {

class LifecycleController {
public:
    /// Phase of a proposal at the given time
    ProposalState StateAt(const Proposal& proposal, Timestamp now) const;

    /// A new proposal's deadline must lie in the future
    Status ValidateDeadline(Timestamp deadline, Timestamp now) const;

    /**
     * Created -> VotingOpen.
     * InvalidWindow unless the proposal is in state Created at now, or if
     * votingStart is 0 or not before the deadline.
     */
    Status CheckCanOpen(const Proposal& proposal, Timestamp votingStart, Timestamp now) const;

    /// Voting window check: opened, and now within [votingStart, deadline]
    Status CheckCanVote(const Proposal& proposal, Timestamp now) const;

    /// Closed -> Finalized: not yet finalized and now > deadline
    Status CheckCanFinalize(const Proposal& proposal, Timestamp now) const;

    // Cancellation extension point: a cancel/veto transition adds a
    // CheckCanCancel() here plus a terminal ProposalState handled in StateAt().
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_LIFECYCLE_H
