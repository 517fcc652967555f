// SHAREGOV - Governance Engine Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/engine.h>
#include <sharegov/crypto/sha256.h>
#include <sharegov/util/logging.h>
#include <sharegov/util/time.h>

#include <algorithm>

namespace sharegov {
namespace governance {

// ============================================================================
// Construction
// ============================================================================

GovernanceEngine::GovernanceEngine(ledger::BalanceLedger& ledger,
                                   const ledger::AccessControl& access,
                                   GovernanceParams params,
                                   db::Database* database)
    : ledger_(ledger),
      access_(access),
      params_(std::move(params)),
      clock_([] { return static_cast<Timestamp>(util::GetTime()); }),
      journal_(params_.eventRetention) {
    if (database) {
        store_ = std::make_unique<GovernanceDB>(*database);
    }
    LOG_DEBUG(util::LogCategory::GOV) << "Governance engine created: " << params_.ToString()
                                      << (store_ ? " (persistent)" : " (in-memory)");
}

GovernanceEngine::~GovernanceEngine() = default;

void GovernanceEngine::SetClock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (clock) {
        clock_ = std::move(clock);
    } else {
        clock_ = [] { return static_cast<Timestamp>(util::GetTime()); };
    }
}

Timestamp GovernanceEngine::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_();
}

Status GovernanceEngine::Reject(const char* operation, Status status) const {
    LOG_DEBUG(util::LogCategory::GOV) << operation << " rejected: " << status.ToString();
    return status;
}

Status GovernanceEngine::PersistLocked(db::WriteBatch& batch,
                                       const std::vector<GovernanceEvent>& events) {
    if (!store_) {
        return Status::Ok();
    }
    GovernanceDB::WriteEvents(batch, events);
    db::Status status = store_->Commit(batch);
    if (!status.ok()) {
        return Status::StorageError(status.ToString());
    }
    return Status::Ok();
}

// ============================================================================
// Proposals
// ============================================================================

std::pair<Status, ProposalId> GovernanceEngine::CreateProposal(
    const HolderId& creator,
    const std::string& description,
    const std::vector<std::string>& options,
    Timestamp deadline) {
    ProposalSpec spec;
    spec.description = description;
    spec.options = options;
    spec.deadline = deadline;
    return CreateProposal(creator, spec);
}

std::pair<Status, ProposalId> GovernanceEngine::CreateProposal(const HolderId& creator,
                                                               const ProposalSpec& spec) {
    std::vector<GovernanceEvent> events;
    std::pair<Status, ProposalId> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        if (!access_.IsAuthorized(creator)) {
            return {Reject("CreateProposal", Status::Unauthorized(creator)), 0};
        }
        result = CreateLocked(creator, spec, 0, now, events);
        if (!result.first.ok()) {
            return {Reject("CreateProposal", result.first), 0};
        }
    }
    journal_.Dispatch(events);
    return result;
}

std::pair<Status, ProposalId> GovernanceEngine::CreateLocked(const HolderId& creator,
                                                             const ProposalSpec& spec,
                                                             FractionId fractionId,
                                                             Timestamp now,
                                                             std::vector<GovernanceEvent>& events) {
    Status status = lifecycle_.ValidateDeadline(spec.deadline, now);
    if (!status.ok()) {
        return {status, 0};
    }
    status = ProposalStore::ValidateContent(spec.description, spec.options,
                                            {params_.maxDescriptionLength, params_.maxOptions});
    if (!status.ok()) {
        return {status, 0};
    }
    if (spec.quorumBase < 0 || !AmountRange(spec.quorumBase)) {
        return {Status::InvalidAmount("quorum base out of range"), 0};
    }

    // The baseline is in the same unit as a vote's weight
    ShareClassId shareClass = spec.shareClass.value_or(params_.governanceClass);
    Amount baseline = spec.quorumBase;
    if (baseline == 0) {
        if (fractionId != 0) {
            baseline = fractions_.Get(fractionId)->totalMinted;
        } else if (spec.weighting == VoteWeighting::ByBalance) {
            baseline = ledger_.TotalMinted(shareClass);
        } else {
            baseline = static_cast<Amount>(ledger_.HolderCount(shareClass));
        }
    }
    if (baseline <= 0) {
        return {Status::NoVotingWeight("share class has no supply"), 0};
    }

    Proposal proposal;
    proposal.id = proposals_.PeekNextId();
    proposal.creator = creator;
    proposal.description = spec.description;
    proposal.options = spec.options;
    proposal.createdAt = now;
    proposal.deadline = spec.deadline;
    proposal.shareClass = shareClass;
    proposal.weighting = spec.weighting;
    proposal.quorumBase = spec.quorumBase;
    proposal.supplyBaseline = baseline;
    proposal.fractionId = fractionId;

    journal_.Stage(events, ProposalCreatedEvent{proposal.id, proposal.description,
                                                proposal.deadline}, now);

    // Fraction votes open at creation
    FractionRecord linked;
    if (fractionId != 0) {
        Timestamp start = std::max<Timestamp>(now, 1);
        status = lifecycle_.CheckCanOpen(proposal, start, now);
        if (!status.ok()) {
            events.clear();
            return {status, 0};
        }
        proposal.votingStart = start;
        journal_.Stage(events, VotingStartedEvent{proposal.id, start}, now);

        linked = *fractions_.Get(fractionId);
        linked.proposalId = proposal.id;
    }

    TallySheet sheet;
    sheet.optionCounts.assign(proposal.options.size(), 0);

    db::WriteBatch batch;
    if (store_) {
        GovernanceDB::WriteProposal(batch, proposal);
        GovernanceDB::WriteTally(batch, proposal.id, sheet);
        GovernanceDB::WriteCounter(batch, counter::NEXT_PROPOSAL_ID, proposal.id + 1);
        if (fractionId != 0) {
            GovernanceDB::WriteFraction(batch, linked);
        }
    }
    status = PersistLocked(batch, events);
    if (!status.ok()) {
        events.clear();
        return {status, 0};
    }

    ProposalId id = proposal.id;
    tally_.Put(id, std::move(sheet));
    proposals_.Add(std::move(proposal));
    if (fractionId != 0) {
        fractions_.Update(linked);
    }
    journal_.Commit(events);

    LOG_INFO(util::LogCategory::GOV) << "Proposal " << id << " created by " << creator
                                     << " (deadline " << spec.deadline
                                     << ", baseline " << baseline << ")";
    return {Status::Ok(), id};
}

Status GovernanceEngine::OpenVoting(const HolderId& caller, ProposalId id, Timestamp votingStart) {
    std::vector<GovernanceEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        if (!access_.IsAuthorized(caller)) {
            return Reject("OpenVoting", Status::Unauthorized(caller));
        }
        Proposal* proposal = proposals_.GetMutable(id);
        if (!proposal) {
            return Reject("OpenVoting", Status::NotFound("proposal " + std::to_string(id)));
        }
        Status status = lifecycle_.CheckCanOpen(*proposal, votingStart, now);
        if (!status.ok()) {
            return Reject("OpenVoting", status);
        }

        Proposal updated = *proposal;
        updated.votingStart = votingStart;
        journal_.Stage(events, VotingStartedEvent{id, votingStart}, now);

        db::WriteBatch batch;
        if (store_) {
            GovernanceDB::WriteProposal(batch, updated);
        }
        status = PersistLocked(batch, events);
        if (!status.ok()) {
            return Reject("OpenVoting", status);
        }

        *proposal = std::move(updated);
        journal_.Commit(events);
        LOG_INFO(util::LogCategory::GOV) << "Voting on proposal " << id << " opens at "
                                         << votingStart;
    }
    journal_.Dispatch(events);
    return Status::Ok();
}

Status GovernanceEngine::CastVote(ProposalId id, const HolderId& voter, const VoteChoice& choice) {
    std::vector<GovernanceEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        const Proposal* proposal = proposals_.Get(id);
        if (!proposal) {
            return Reject("CastVote", Status::NotFound("proposal " + std::to_string(id)));
        }
        Status status = lifecycle_.CheckCanVote(*proposal, now);
        if (!status.ok()) {
            return Reject("CastVote", status);
        }
        if (votes_.HasVoted(id, voter)) {
            return Reject("CastVote", Status::AlreadyVoted(voter + " on proposal " +
                                                           std::to_string(id)));
        }
        Amount balance = IsValidHolderId(voter) ? ledger_.BalanceOf(voter, proposal->shareClass) : 0;
        if (balance <= 0) {
            return Reject("CastVote", Status::NoVotingWeight(voter + " holds no class " +
                                                             std::to_string(proposal->shareClass)));
        }

        uint64_t weight = proposal->weighting == VoteWeighting::ByBalance
                              ? static_cast<uint64_t>(balance) : 1;

        TallySheet sheet;
        if (const TallySheet* current = tally_.Get(id)) {
            sheet = *current;
        }
        status = TallyEngine::ApplyVote(sheet, *proposal, choice, weight);
        if (!status.ok()) {
            return Reject("CastVote", status);
        }

        VoteRecord record;
        record.proposalId = id;
        record.voter = voter;
        record.choice = choice;
        record.weight = weight;
        record.castAt = now;
        journal_.Stage(events, VoteCastEvent{id, voter, choice}, now);

        db::WriteBatch batch;
        if (store_) {
            GovernanceDB::WriteVote(batch, record);
            GovernanceDB::WriteTally(batch, id, sheet);
        }
        status = PersistLocked(batch, events);
        if (!status.ok()) {
            return Reject("CastVote", status);
        }

        votes_.Insert(std::move(record));
        tally_.Put(id, std::move(sheet));
        journal_.Commit(events);
        LOG_DEBUG(util::LogCategory::VOTE) << voter << " voted " << ChoiceToString(choice)
                                           << " on proposal " << id << " (weight " << weight << ")";
    }
    journal_.Dispatch(events);
    return Status::Ok();
}

Status GovernanceEngine::Finalize(const HolderId& caller, ProposalId id) {
    std::vector<GovernanceEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        if (!access_.IsAuthorized(caller)) {
            return Reject("Finalize", Status::Unauthorized(caller));
        }
        Proposal* proposal = proposals_.GetMutable(id);
        if (!proposal) {
            return Reject("Finalize", Status::NotFound("proposal " + std::to_string(id)));
        }
        Status status = lifecycle_.CheckCanFinalize(*proposal, now);
        if (!status.ok()) {
            return Reject("Finalize", status);
        }

        TallySheet sheet;
        if (const TallySheet* current = tally_.Get(id)) {
            sheet = *current;
        }
        sheet.optionCounts.resize(proposal->options.size(), 0);
        auto [yes, no] = TallyEngine::YesNo(*proposal, sheet);

        Proposal updated = *proposal;
        updated.finalized = true;
        updated.finalizedAt = now;
        updated.finalYes = sheet.yes;
        updated.finalNo = sheet.no;
        updated.finalOptionCounts = sheet.optionCounts;
        updated.tallyDigest = TallyEngine::SnapshotDigest(id, sheet);

        journal_.Stage(events, ProposalFinalizedEvent{id, yes, no, sheet.optionCounts}, now);

        db::WriteBatch batch;
        if (store_) {
            GovernanceDB::WriteProposal(batch, updated);
        }
        status = PersistLocked(batch, events);
        if (!status.ok()) {
            return Reject("Finalize", status);
        }

        *proposal = std::move(updated);
        journal_.Commit(events);
        LOG_INFO(util::LogCategory::GOV) << "Proposal " << id << " finalized (yes=" << yes
                                         << ", no=" << no << ", digest "
                                         << HashToHex(proposal->tallyDigest) << ")";
    }
    journal_.Dispatch(events);
    return Status::Ok();
}

std::pair<Status, Decision> GovernanceEngine::ComputeDecision(ProposalId id,
                                                              GovernanceModel model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = proposals_.Get(id);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(id)), Decision{}};
    }
    const TallySheet* sheet = tally_.Get(id);
    Decision decision = TallyEngine::ComputeDecision(*proposal, sheet ? *sheet : TallySheet{},
                                                     model);
    LOG_DEBUG(util::LogCategory::TALLY) << "Proposal " << id << ": " << decision.ToString();
    return {Status::Ok(), decision};
}

std::pair<Status, Decision> GovernanceEngine::ComputeDecision(ProposalId id) const {
    return ComputeDecision(id, params_.defaultModel);
}

// ============================================================================
// Fractions
// ============================================================================

std::pair<Status, FractionId> GovernanceEngine::RegisterFraction(const HolderId& caller,
                                                                 AssetId assetId,
                                                                 ShareClassId shareClass,
                                                                 Amount totalMinted,
                                                                 const HolderId& owner) {
    std::vector<GovernanceEvent> events;
    FractionId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        if (!access_.IsAuthorized(caller)) {
            return {Reject("RegisterFraction", Status::Unauthorized(caller)), 0};
        }
        if (totalMinted <= 0 || !AmountRange(totalMinted)) {
            return {Reject("RegisterFraction",
                           Status::InvalidAmount("minted amount must be positive")), 0};
        }
        if (!IsValidHolderId(owner)) {
            return {Reject("RegisterFraction", Status::InvalidProposal("invalid owner")), 0};
        }

        FractionRecord record;
        record.id = fractions_.PeekNextId();
        record.assetId = assetId;
        record.shareClass = shareClass;
        record.totalMinted = totalMinted;
        record.trackedAmount = ledger_.TotalMinted(shareClass);
        record.owner = owner;
        record.createdAt = now;

        journal_.Stage(events, FractionCreatedEvent{record.id, assetId, totalMinted}, now);

        db::WriteBatch batch;
        if (store_) {
            GovernanceDB::WriteFraction(batch, record);
            GovernanceDB::WriteCounter(batch, counter::NEXT_FRACTION_ID, record.id + 1);
        }
        Status status = PersistLocked(batch, events);
        if (!status.ok()) {
            return {Reject("RegisterFraction", status), 0};
        }

        id = record.id;
        fractions_.Add(std::move(record));
        journal_.Commit(events);
        LOG_INFO(util::LogCategory::GOV) << "Fraction " << id << " of asset " << assetId
                                         << " registered: " << totalMinted << " shares of class "
                                         << shareClass;
    }
    journal_.Dispatch(events);
    return {Status::Ok(), id};
}

std::pair<Status, ProposalId> GovernanceEngine::CreateFractionVote(const HolderId& caller,
                                                                   FractionId id,
                                                                   const std::string& description,
                                                                   Timestamp deadline) {
    std::vector<GovernanceEvent> events;
    std::pair<Status, ProposalId> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        if (!access_.IsAuthorized(caller)) {
            return {Reject("CreateFractionVote", Status::Unauthorized(caller)), 0};
        }
        const FractionRecord* fraction = fractions_.Get(id);
        if (!fraction) {
            return {Reject("CreateFractionVote", Status::NotFound("fraction " + std::to_string(id))), 0};
        }
        if (fraction->HasVote()) {
            return {Reject("CreateFractionVote",
                           Status::InvalidProposal("fraction " + std::to_string(id) +
                                                   " already has proposal " +
                                                   std::to_string(fraction->proposalId))), 0};
        }

        ProposalSpec spec;
        spec.description = description;
        spec.deadline = deadline;
        spec.shareClass = fraction->shareClass;
        spec.weighting = VoteWeighting::ByBalance;

        result = CreateLocked(caller, spec, id, now, events);
        if (!result.first.ok()) {
            return {Reject("CreateFractionVote", result.first), 0};
        }
    }
    journal_.Dispatch(events);
    return result;
}

std::pair<Status, Decision> GovernanceEngine::ComputeFractionDecision(FractionId id,
                                                                      GovernanceModel model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const FractionRecord* fraction = fractions_.Get(id);
    if (!fraction) {
        return {Status::NotFound("fraction " + std::to_string(id)), Decision{}};
    }
    if (!fraction->HasVote()) {
        return {Status::NotFound("fraction " + std::to_string(id) + " has no vote"), Decision{}};
    }
    const Proposal* proposal = proposals_.Get(fraction->proposalId);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(fraction->proposalId)), Decision{}};
    }
    const TallySheet* sheet = tally_.Get(proposal->id);
    Decision decision = TallyEngine::ComputeDecision(*proposal, sheet ? *sheet : TallySheet{},
                                                     model);
    LOG_DEBUG(util::LogCategory::TALLY) << "Fraction " << id << ": " << decision.ToString();
    return {Status::Ok(), decision};
}

// ============================================================================
// Locks
// ============================================================================

Status GovernanceEngine::LockTokens(const HolderId& holder, ShareClassId shareClass,
                                    Amount amount, Timestamp unlockTime) {
    std::vector<GovernanceEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        auto [status, record] = locks_.PrepareLock(holder, shareClass, amount, unlockTime, now);
        if (!status.ok()) {
            return Reject("LockTokens", status);
        }
        if (!ledger_.Lock(holder, shareClass, amount)) {
            return Reject("LockTokens", Status::InsufficientBalance(
                holder + " has " + std::to_string(ledger_.SpendableOf(holder, shareClass)) +
                " spendable"));
        }

        journal_.Stage(events, TokensLockedEvent{holder, shareClass, amount, record.unlockTime},
                       now);

        db::WriteBatch batch;
        if (store_) {
            GovernanceDB::WriteLock(batch, record);
        }
        status = PersistLocked(batch, events);
        if (!status.ok()) {
            if (!ledger_.Unlock(holder, shareClass, amount)) {
                LOG_ERROR(util::LogCategory::LOCK) << "Could not return " << amount
                                                   << " escrowed shares to " << holder;
            }
            return Reject("LockTokens", status);
        }

        locks_.Put(record);
        journal_.Commit(events);
        LOG_INFO(util::LogCategory::LOCK) << "Locked " << amount << " of class " << shareClass
                                          << " for " << holder << " until " << record.unlockTime;
    }
    journal_.Dispatch(events);
    return Status::Ok();
}

Status GovernanceEngine::UnlockTokens(const HolderId& holder, ShareClassId shareClass,
                                      Amount amount) {
    std::vector<GovernanceEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_();

        auto [status, record] = locks_.PrepareUnlock(holder, shareClass, amount, now);
        if (!status.ok()) {
            return Reject("UnlockTokens", status);
        }
        if (!ledger_.Unlock(holder, shareClass, amount)) {
            return Reject("UnlockTokens", Status::InsufficientLocked(
                "ledger holds " + std::to_string(ledger_.LockedOf(holder, shareClass)) +
                " in escrow for " + holder));
        }

        journal_.Stage(events, TokensUnlockedEvent{holder, shareClass, amount}, now);

        db::WriteBatch batch;
        if (store_) {
            GovernanceDB::WriteLock(batch, record);
        }
        status = PersistLocked(batch, events);
        if (!status.ok()) {
            if (!ledger_.Lock(holder, shareClass, amount)) {
                LOG_ERROR(util::LogCategory::LOCK) << "Could not re-escrow " << amount
                                                   << " shares of " << holder;
            }
            return Reject("UnlockTokens", status);
        }

        locks_.Put(record);
        journal_.Commit(events);
        LOG_INFO(util::LogCategory::LOCK) << "Unlocked " << amount << " of class " << shareClass
                                          << " for " << holder << " (" << record.amount
                                          << " still locked)";
    }
    journal_.Dispatch(events);
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::pair<Status, Proposal> GovernanceEngine::GetProposal(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = proposals_.Get(id);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(id)), Proposal{}};
    }
    return {Status::Ok(), *proposal};
}

std::pair<Status, ProposalState> GovernanceEngine::GetState(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = proposals_.Get(id);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(id)), ProposalState::Created};
    }
    return {Status::Ok(), lifecycle_.StateAt(*proposal, clock_())};
}

std::optional<VoteRecord> GovernanceEngine::GetVote(ProposalId id, const HolderId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const VoteRecord* record = votes_.Get(id, voter);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

bool GovernanceEngine::HasVoted(ProposalId id, const HolderId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return votes_.HasVoted(id, voter);
}

std::vector<VoteRecord> GovernanceEngine::GetVoteRecords(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return votes_.GetVotes(id);
}

std::pair<Status, uint64_t> GovernanceEngine::GetVotes(ProposalId id,
                                                       const std::string& option) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = proposals_.Get(id);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(id)), 0};
    }
    const TallySheet* sheet = tally_.Get(id);
    auto count = TallyEngine::GetOptionCount(*proposal, sheet ? *sheet : TallySheet{}, option);
    if (!count) {
        return {Status::InvalidOption("unknown option '" + option + "'"), 0};
    }
    return {Status::Ok(), *count};
}

std::pair<Status, std::vector<std::pair<std::string, uint64_t>>> GovernanceEngine::GetResults(
    ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = proposals_.Get(id);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(id)), {}};
    }
    const TallySheet* sheet = tally_.Get(id);
    return {Status::Ok(), TallyEngine::GetResults(*proposal, sheet ? *sheet : TallySheet{})};
}

std::pair<Status, VotingHistory> GovernanceEngine::GetVotingHistory(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = proposals_.Get(id);
    if (!proposal) {
        return {Status::NotFound("proposal " + std::to_string(id)), VotingHistory{}};
    }
    const TallySheet* current = tally_.Get(id);
    TallySheet sheet = proposal->finalized
                           ? TallyEngine::FrozenSheet(*proposal, current ? current->voteCount : 0)
                           : (current ? *current : TallySheet{});
    auto [yes, no] = TallyEngine::YesNo(*proposal, sheet);
    return {Status::Ok(), VotingHistory{yes, no, proposal->finalized}};
}

uint64_t GovernanceEngine::GetCurrentProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.Count();
}

std::optional<LockRecord> GovernanceEngine::GetLock(const HolderId& holder,
                                                    ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const LockRecord* record = locks_.Get(holder, shareClass);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::vector<LockRecord> GovernanceEngine::GetLocks(const HolderId& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.GetLocks(holder);
}

Amount GovernanceEngine::GetTotalLocked(ShareClassId shareClass) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.TotalLocked(shareClass);
}

std::pair<Status, FractionRecord> GovernanceEngine::GetFraction(FractionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const FractionRecord* record = fractions_.Get(id);
    if (!record) {
        return {Status::NotFound("fraction " + std::to_string(id)), FractionRecord{}};
    }
    return {Status::Ok(), *record};
}

std::vector<FractionRecord> GovernanceEngine::GetFractionsByAsset(AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fractions_.GetByAsset(assetId);
}

// ============================================================================
// Events
// ============================================================================

std::vector<GovernanceEvent> GovernanceEngine::GetEvents(EventKind kind, uint64_t afterSequence,
                                                         size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return journal_.GetEvents(kind, afterSequence, limit);
}

GovernanceEngine::SubscriptionId GovernanceEngine::Subscribe(Observer observer) {
    return journal_.Subscribe(std::move(observer));
}

bool GovernanceEngine::Unsubscribe(SubscriptionId id) {
    return journal_.Unsubscribe(id);
}

// ============================================================================
// Persistence
// ============================================================================

Status GovernanceEngine::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_) {
        return Status::StorageError("no database attached");
    }

    GovernanceSnapshot snapshot;
    db::Status dbStatus = store_->LoadAll(snapshot);
    if (!dbStatus.ok()) {
        return Reject("Load", Status::StorageError(dbStatus.ToString()));
    }

    ProposalStore proposals;
    VoteLedger votes;
    TallyEngine tally;
    LockLedger locks;
    FractionRegistry fractions;

    for (auto& proposal : snapshot.proposals) {
        ProposalId id = proposal.id;
        auto it = snapshot.tallies.find(id);
        if (it == snapshot.tallies.end()) {
            return Reject("Load", Status::StorageError("no tally for proposal " +
                                                       std::to_string(id)));
        }
        tally.Put(id, it->second);
        proposals.Restore(std::move(proposal));
    }
    for (auto& vote : snapshot.votes) {
        if (!proposals.Contains(vote.proposalId)) {
            return Reject("Load", Status::StorageError("vote on unknown proposal " +
                                                       std::to_string(vote.proposalId)));
        }
        votes.Insert(std::move(vote));
    }
    for (ProposalId id : proposals.GetIds()) {
        if (tally.Get(id)->voteCount != votes.CountVotes(id)) {
            return Reject("Load", Status::StorageError("tally of proposal " + std::to_string(id) +
                                                       " disagrees with its votes"));
        }
    }
    for (auto& record : snapshot.locks) {
        locks.Put(std::move(record));
    }
    for (auto& record : snapshot.fractions) {
        fractions.Restore(std::move(record));
    }

    auto checkCounter = [&snapshot](const char* name, uint64_t expected) {
        auto it = snapshot.counters.find(name);
        uint64_t stored = it == snapshot.counters.end() ? 1 : it->second;
        return stored == expected;
    };
    if (!checkCounter(counter::NEXT_PROPOSAL_ID, proposals.PeekNextId()) ||
        !checkCounter(counter::NEXT_FRACTION_ID, fractions.PeekNextId())) {
        return Reject("Load", Status::StorageError("id counters disagree with stored records"));
    }

    proposals_ = std::move(proposals);
    votes_ = std::move(votes);
    tally_ = std::move(tally);
    locks_ = std::move(locks);
    fractions_ = std::move(fractions);
    journal_.Clear();
    for (auto& event : snapshot.events) {
        journal_.Restore(std::move(event));
    }

    LOG_INFO(util::LogCategory::GOV) << "Loaded " << proposals_.Count() << " proposals, "
                                     << votes_.Size() << " votes, " << locks_.Size()
                                     << " locks, " << fractions_.Count() << " fractions";
    return Status::Ok();
}

} // namespace governance
} // namespace sharegov
