// SHAREGOV - Governance Database
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Persistent layout of governance state on top of the key-value database.
//
// Key layout:
//   'P' + id                      -> Proposal
//   'V' + proposal id + voter     -> VoteRecord
//   'T' + proposal id             -> TallySheet
//   'L' + holder + class          -> LockRecord
//   'F' + fraction id             -> FractionRecord
//   'E' + kind + sequence         -> GovernanceEvent
//   'M' + name                    -> counter

#ifndef SHAREGOV_GOVERNANCE_GOVERNANCE_DB_H
#define SHAREGOV_GOVERNANCE_GOVERNANCE_DB_H

#include <sharegov/db/database.h>
#include <sharegov/governance/events.h>
#include <sharegov/governance/fraction.h>
#include <sharegov/governance/lock_ledger.h>
#include <sharegov/governance/proposal.h>
#include <sharegov/governance/tally.h>
#include <sharegov/governance/vote_ledger.h>

#include <map>
#include <string>
#include <vector>

namespace sharegov {
namespace governance {

/// Counter names stored under the 'M' prefix
namespace counter {
    constexpr const char* NEXT_PROPOSAL_ID = "nextproposal";
    constexpr const char* NEXT_FRACTION_ID = "nextfraction";
}

/// Everything persisted by the engine, as read back by LoadAll()
struct GovernanceSnapshot {
    std::vector<Proposal> proposals;
    std::vector<VoteRecord> votes;
    std::map<ProposalId, TallySheet> tallies;
    std::vector<LockRecord> locks;
    std::vector<FractionRecord> fractions;
    std::vector<GovernanceEvent> events;
    std::map<std::string, uint64_t> counters;
};

class GovernanceDB {
public:
    /// The database must outlive this object
    explicit GovernanceDB(db::Database& database);

    // === Keys ===

    static std::string ProposalKey(ProposalId id);
    static std::string VoteKey(ProposalId id, const HolderId& voter);
    static std::string TallyKey(ProposalId id);
    static std::string LockKey(const HolderId& holder, ShareClassId shareClass);
    static std::string FractionKey(FractionId id);
    static std::string EventKey(EventKind kind, uint64_t sequence);
    static std::string CounterKey(const std::string& name);

    // === Batch Builders ===

    static void WriteProposal(db::WriteBatch& batch, const Proposal& proposal);
    static void WriteVote(db::WriteBatch& batch, const VoteRecord& vote);
    static void WriteTally(db::WriteBatch& batch, ProposalId id, const TallySheet& sheet);

    /// Writes the record, or deletes the key when its amount is zero
    static void WriteLock(db::WriteBatch& batch, const LockRecord& record);

    static void WriteFraction(db::WriteBatch& batch, const FractionRecord& record);
    static void WriteEvents(db::WriteBatch& batch, const std::vector<GovernanceEvent>& events);
    static void WriteCounter(db::WriteBatch& batch, const std::string& name, uint64_t value);

    /// Apply a batch atomically
    db::Status Commit(db::WriteBatch& batch, bool sync = false);

    // === Loading ===

    /**
     * Read every governance record.
     * Returns Corruption naming the key of the first record that fails to
     * decode.
     */
    db::Status LoadAll(GovernanceSnapshot& out) const;

    db::Database& GetDatabase() { return db_; }

private:
    db::Database& db_;
};

} // namespace governance
} // namespace sharegov

#endif // SHAREGOV_GOVERNANCE_GOVERNANCE_DB_H
