// SHAREGOV - Governance Engine
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Token-weighted governance: holders of a share class create proposals,
// vote within an open window, and the engine decides proposals under a
// governance model against a supply baseline fixed at creation.
//
// Key features:
// - Binary and multi-option proposals
// - One vote per (proposal, voter), weighted per holder or by balance
// - Simple majority, supermajority and unanimous consensus decisions
// - Fraction votes with O(1) decisions from running counters
// - Time-locked escrow of share balances
// - Append-only event journal with per-kind sequences
// - Optional persistence with one atomic write batch per mutation

#ifndef SHAREGOV_GOVERNANCE_ENGINE_H
#define SHAREGOV_GOVERNANCE_ENGINE_H

#include <sharegov/db/database.h>
#include <sharegov/governance/events.h>
#include <sharegov/governance/fraction.h>
#include <sharegov/governance/governance_db.h>
#include <sharegov/governance/lifecycle.h>
#include <sharegov/governance/lock_ledger.h>
#include <sharegov/governance/params.h>
#include <sharegov/governance/proposal.h>
#include <sharegov/governance/tally.h>
#include <sharegov/governance/types.h>
#include <sharegov/governance/vote_ledger.h>
#include <sharegov/ledger/access_control.h>
#include <sharegov/ledger/balance_ledger.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sharegov {
namespace governance {

/// Everything a caller chooses when creating a proposal
struct ProposalSpec {
    std::string description;

    /// Empty for a binary yes/no proposal
    std::vector<std::string> options;

    Timestamp deadline{0};

    /// Defaults to GovernanceParams::governanceClass
    std::optional<ShareClassId> shareClass;

    VoteWeighting weighting{VoteWeighting::PerHolder};

    /**
     * Fixed denominator for decisions. 0 takes it from the ledger at
     * creation: the number of holders of the class under PerHolder, the
     * class's minted supply under ByBalance.
     */
    Amount quorumBase{0};
};

/// Counts reported by GetVotingHistory()
struct VotingHistory {
    uint64_t yes{0};
    uint64_t no{0};
    bool finalized{false};
};

// ============================================================================
// Governance Engine
// ============================================================================

/**
 * Facade owning the proposal store, vote ledger, tally engine, lock ledger,
 * fraction registry and event journal.
 *
 * Every operation runs under one mutex, so each call observes the effects
 * of every call that returned before it. A failed operation changes
 * nothing. With a database attached, each mutation is written as a single
 * batch before memory is updated. Observers are notified after the mutex
 * has been released.
 */
class GovernanceEngine {
public:
    using Clock = std::function<Timestamp()>;
    using Observer = EventJournal::Observer;
    using SubscriptionId = EventJournal::SubscriptionId;

    /**
     * @param ledger   Balance ledger consulted for weights and escrow
     * @param access   Authorization for privileged operations
     * @param params   Engine limits
     * @param database Optional persistent store (not owned)
     */
    GovernanceEngine(ledger::BalanceLedger& ledger,
                     const ledger::AccessControl& access,
                     GovernanceParams params = GovernanceParams(),
                     db::Database* database = nullptr);
    ~GovernanceEngine();

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // === Proposals ===

    /// Create a proposal on the configured governance class
    std::pair<Status, ProposalId> CreateProposal(const HolderId& creator,
                                                 const std::string& description,
                                                 const std::vector<std::string>& options,
                                                 Timestamp deadline);

    std::pair<Status, ProposalId> CreateProposal(const HolderId& creator,
                                                 const ProposalSpec& spec);

    /// Set the voting start of a proposal
    Status OpenVoting(const HolderId& caller, ProposalId id, Timestamp votingStart);

    /// Record a vote; the tally is updated in the same step
    Status CastVote(ProposalId id, const HolderId& voter, const VoteChoice& choice);

    /// Freeze the tally of a proposal whose deadline has passed
    Status Finalize(const HolderId& caller, ProposalId id);

    /// Decide a proposal under a model; never mutates state
    std::pair<Status, Decision> ComputeDecision(ProposalId id, GovernanceModel model) const;

    /// Decide a proposal under the configured default model
    std::pair<Status, Decision> ComputeDecision(ProposalId id) const;

    // === Fractions ===

    /// Register the shares minted for a fractionalized asset
    std::pair<Status, FractionId> RegisterFraction(const HolderId& caller, AssetId assetId,
                                                   ShareClassId shareClass, Amount totalMinted,
                                                   const HolderId& owner);

    /**
     * Create the binary vote of a fraction. Voting opens immediately, votes
     * are weighted by balance and the fraction's minted amount is the
     * supply baseline. A fraction has at most one vote.
     */
    std::pair<Status, ProposalId> CreateFractionVote(const HolderId& caller, FractionId id,
                                                     const std::string& description,
                                                     Timestamp deadline);

    /// Decide a fraction's vote from running counters
    std::pair<Status, Decision> ComputeFractionDecision(FractionId id,
                                                        GovernanceModel model) const;

    // === Locks ===

    /// Move shares into escrow until unlockTime
    Status LockTokens(const HolderId& holder, ShareClassId shareClass, Amount amount,
                      Timestamp unlockTime);

    /// Return escrowed shares once the unlock time has been reached
    Status UnlockTokens(const HolderId& holder, ShareClassId shareClass, Amount amount);

    // === Queries ===

    std::pair<Status, Proposal> GetProposal(ProposalId id) const;
    std::pair<Status, ProposalState> GetState(ProposalId id) const;

    std::optional<VoteRecord> GetVote(ProposalId id, const HolderId& voter) const;
    bool HasVoted(ProposalId id, const HolderId& voter) const;

    /// All vote records of a proposal ordered by voter
    std::vector<VoteRecord> GetVoteRecords(ProposalId id) const;

    /// Count for one option ("yes"/"no" on binary proposals)
    std::pair<Status, uint64_t> GetVotes(ProposalId id, const std::string& option) const;

    /// (option, count) in declaration order
    std::pair<Status, std::vector<std::pair<std::string, uint64_t>>> GetResults(ProposalId id) const;

    std::pair<Status, VotingHistory> GetVotingHistory(ProposalId id) const;

    /// Number of proposals ever created
    uint64_t GetCurrentProposalCount() const;

    std::optional<LockRecord> GetLock(const HolderId& holder, ShareClassId shareClass) const;

    /// Every lock of a holder ordered by share class
    std::vector<LockRecord> GetLocks(const HolderId& holder) const;

    /// Shares of a class held in escrow across all holders
    Amount GetTotalLocked(ShareClassId shareClass) const;

    std::pair<Status, FractionRecord> GetFraction(FractionId id) const;

    /// Fractions registered against an asset ordered by id
    std::vector<FractionRecord> GetFractionsByAsset(AssetId assetId) const;

    // === Events ===

    std::vector<GovernanceEvent> GetEvents(EventKind kind, uint64_t afterSequence = 0,
                                           size_t limit = 0) const;
    SubscriptionId Subscribe(Observer observer);
    bool Unsubscribe(SubscriptionId id);

    // === Persistence & Time ===

    /**
     * Rebuild all state from the attached database.
     * StorageError if no database is attached, a record fails to decode, or
     * counters disagree with the records; state is untouched on error.
     */
    Status Load();

    bool HasDatabase() const { return store_ != nullptr; }

    /// Replace the clock (nullptr restores util::GetTime)
    void SetClock(Clock clock);

    Timestamp Now() const;

    const GovernanceParams& GetParams() const { return params_; }

private:
    std::pair<Status, ProposalId> CreateLocked(const HolderId& creator, const ProposalSpec& spec,
                                               FractionId fractionId, Timestamp now,
                                               std::vector<GovernanceEvent>& events);

    /// Write a batch plus staged events; StorageError on failure
    Status PersistLocked(db::WriteBatch& batch, const std::vector<GovernanceEvent>& events);

    /// Log a rejected operation and hand back its status
    Status Reject(const char* operation, Status status) const;

    mutable std::mutex mutex_;

    ledger::BalanceLedger& ledger_;
    const ledger::AccessControl& access_;
    const GovernanceParams params_;
    std::unique_ptr<GovernanceDB> store_;
    Clock clock_;

    ProposalStore proposals_;
    VoteLedger votes_;
    TallyEngine tally_;
    LifecycleController lifecycle_;
    LockLedger locks_;
    FractionRegistry fractions_;
    EventJournal journal_;
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_ENGINE_H
