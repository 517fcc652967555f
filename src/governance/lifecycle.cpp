// SHAREGOV - Lifecycle Controller Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/lifecycle.h>

namespace sharegov {
namespace governance {

ProposalState LifecycleController::StateAt(const Proposal& proposal, Timestamp now) const {
    if (proposal.finalized) {
        return ProposalState::Finalized;
    }
    if (now > proposal.deadline) {
        return ProposalState::Closed;
    }
    if (proposal.IsVotingOpened()) {
        return ProposalState::VotingOpen;
    }
    return ProposalState::Created;
}

Status LifecycleController::ValidateDeadline(Timestamp deadline, Timestamp now) const {
    if (deadline <= now) {
        return Status::InvalidDeadline("deadline " + std::to_string(deadline) +
                                       " is not after now (" + std::to_string(now) + ")");
    }
    return Status::Ok();
}

Status LifecycleController::CheckCanOpen(const Proposal& proposal, Timestamp votingStart,
                                         Timestamp now) const {
    ProposalState state = StateAt(proposal, now);
    if (state != ProposalState::Created) {
        if (proposal.IsVotingOpened()) {
            return Status::InvalidWindow("voting already opened at " +
                                         std::to_string(proposal.votingStart));
        }
        return Status::InvalidWindow("proposal " + std::to_string(proposal.id) + " is " +
                                     ProposalStateToString(state));
    }
    if (votingStart == 0) {
        return Status::InvalidWindow("voting start must be nonzero");
    }
    if (votingStart >= proposal.deadline) {
        return Status::InvalidWindow("voting start " + std::to_string(votingStart) +
                                     " is not before deadline " +
                                     std::to_string(proposal.deadline));
    }
    return Status::Ok();
}

Status LifecycleController::CheckCanVote(const Proposal& proposal, Timestamp now) const {
    if (!proposal.IsVotingOpened()) {
        return Status::VotingNotStarted("voting not opened for proposal " +
                                        std::to_string(proposal.id));
    }
    if (now < proposal.votingStart || now > proposal.deadline) {
        return Status::VotingClosed("outside voting window [" +
                                    std::to_string(proposal.votingStart) + ", " +
                                    std::to_string(proposal.deadline) + "]");
    }
    return Status::Ok();
}

Status LifecycleController::CheckCanFinalize(const Proposal& proposal, Timestamp now) const {
    if (proposal.finalized) {
        return Status::AlreadyFinalized("proposal " + std::to_string(proposal.id) +
                                        " finalized at " + std::to_string(proposal.finalizedAt));
    }
    if (now <= proposal.deadline) {
        return Status::TooEarly("deadline " + std::to_string(proposal.deadline) +
                                " has not passed");
    }
    return Status::Ok();
}

} // namespace governance
} // namespace sharegov
