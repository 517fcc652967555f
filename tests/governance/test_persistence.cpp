// SHAREGOV - Governance Persistence Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/db/memorydb.h>
#include <sharegov/governance/engine.h>
#include <sharegov/governance/governance_db.h>
#include <sharegov/ledger/access_control.h>
#include <sharegov/ledger/balance_ledger.h>

#include <memory>
#include <string>

namespace sharegov {
namespace governance {
namespace test {

class GovernancePersistenceTest : public ::testing::Test {
protected:
    static constexpr ShareClassId kClass = DEFAULT_GOVERNANCE_CLASS;

    void SetUp() override {
        ASSERT_TRUE(operators_.Add("operator"));
        ASSERT_TRUE(ledger_.Mint("alice", kClass, 60));
        ASSERT_TRUE(ledger_.Mint("bob", kClass, 40));
        engine_ = NewEngine();
    }

    std::unique_ptr<GovernanceEngine> NewEngine() {
        auto engine = std::make_unique<GovernanceEngine>(ledger_, operators_,
                                                         GovernanceParams(), &db_);
        engine->SetClock([this] { return now_; });
        return engine;
    }

    db::MemoryDatabase db_;
    ledger::MemoryBalanceLedger ledger_;
    ledger::OperatorRegistry operators_;
    Timestamp now_{1000};
    std::unique_ptr<GovernanceEngine> engine_;
};

TEST_F(GovernancePersistenceTest, ReloadRestoresState) {
    auto [s1, binary] = engine_->CreateProposal("operator", "Upgrade Treasury", {}, 2000);
    ASSERT_TRUE(s1.ok());
    ASSERT_TRUE(engine_->OpenVoting("operator", binary, 1000).ok());
    ASSERT_TRUE(engine_->CastVote(binary, "alice", true).ok());
    ASSERT_TRUE(engine_->CastVote(binary, "bob", false).ok());

    auto [s2, multi] = engine_->CreateProposal("operator", "Venue", {"a", "b"}, 3000);
    ASSERT_TRUE(s2.ok());
    ASSERT_TRUE(engine_->OpenVoting("operator", multi, 1000).ok());
    ASSERT_TRUE(engine_->CastVote(multi, "alice", std::string("b")).ok());

    auto [s3, fraction] = engine_->RegisterFraction("operator", 9, kClass, 100, "alice");
    ASSERT_TRUE(s3.ok());
    auto [s4, fractionVote] = engine_->CreateFractionVote("operator", fraction, "Sell", 2500);
    ASSERT_TRUE(s4.ok());
    ASSERT_TRUE(engine_->LockTokens("bob", kClass, 15, 4000).ok());

    now_ = 2001;
    ASSERT_TRUE(engine_->Finalize("operator", binary).ok());

    auto reloaded = NewEngine();
    ASSERT_TRUE(reloaded->Load().ok());

    EXPECT_EQ(reloaded->GetCurrentProposalCount(), 3u);
    auto proposal = reloaded->GetProposal(binary).second;
    EXPECT_TRUE(proposal.finalized);
    EXPECT_EQ(proposal.GetHash(), engine_->GetProposal(binary).second.GetHash());

    auto history = reloaded->GetVotingHistory(binary).second;
    EXPECT_EQ(history.yes, 1u);
    EXPECT_EQ(history.no, 1u);
    EXPECT_TRUE(history.finalized);

    EXPECT_EQ(reloaded->GetVotes(multi, "b").second, 1u);
    EXPECT_TRUE(reloaded->HasVoted(multi, "alice"));
    EXPECT_TRUE(reloaded->CastVote(multi, "alice", std::string("a")).Is(ErrorCode::AlreadyVoted));

    auto fractionRecord = reloaded->GetFraction(fraction).second;
    EXPECT_EQ(fractionRecord.proposalId, fractionVote);

    auto lock = reloaded->GetLock("bob", kClass);
    ASSERT_TRUE(lock.has_value());
    EXPECT_EQ(lock->amount, 15);

    EXPECT_EQ(reloaded->GetEvents(EventKind::VoteCast).size(), 3u);
    EXPECT_EQ(reloaded->GetEvents(EventKind::ProposalCreated).size(), 3u);
}

TEST_F(GovernancePersistenceTest, ReloadedEngineContinuesSequences) {
    ASSERT_TRUE(engine_->CreateProposal("operator", "one", {}, 2000).first.ok());
    ASSERT_TRUE(engine_->CreateProposal("operator", "two", {}, 2000).first.ok());

    auto reloaded = NewEngine();
    ASSERT_TRUE(reloaded->Load().ok());
    auto [status, id] = reloaded->CreateProposal("operator", "three", {}, 2000);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(id, 3u);

    auto events = reloaded->GetEvents(EventKind::ProposalCreated);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.back().sequence, 3u);
}

TEST_F(GovernancePersistenceTest, FailedWriteChangesNothing) {
    auto [status, id] = engine_->CreateProposal("operator", "Upgrade Treasury", {}, 2000);
    ASSERT_TRUE(status.ok());
    ASSERT_TRUE(engine_->OpenVoting("operator", id, 1000).ok());

    db_.SetFailWrites(true);
    EXPECT_TRUE(engine_->CastVote(id, "alice", true).Is(ErrorCode::StorageError));
    EXPECT_FALSE(engine_->HasVoted(id, "alice"));
    EXPECT_EQ(engine_->GetVotes(id, "yes").second, 0u);
    EXPECT_TRUE(engine_->GetEvents(EventKind::VoteCast).empty());

    EXPECT_TRUE(engine_->CreateProposal("operator", "two", {}, 2000).first
                    .Is(ErrorCode::StorageError));
    EXPECT_EQ(engine_->GetCurrentProposalCount(), 1u);

    EXPECT_TRUE(engine_->LockTokens("alice", kClass, 10, 5000).Is(ErrorCode::StorageError));
    EXPECT_EQ(ledger_.LockedOf("alice", kClass), 0);
    EXPECT_FALSE(engine_->GetLock("alice", kClass).has_value());

    db_.SetFailWrites(false);
    ASSERT_TRUE(engine_->CastVote(id, "alice", true).ok());
    auto [s2, second] = engine_->CreateProposal("operator", "two", {}, 2000);
    ASSERT_TRUE(s2.ok());
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(engine_->GetEvents(EventKind::VoteCast).front().sequence, 1u);
}

TEST_F(GovernancePersistenceTest, FailedUnlockKeepsEscrow) {
    ASSERT_TRUE(engine_->LockTokens("alice", kClass, 10, 1500).ok());
    now_ = 1500;

    db_.SetFailWrites(true);
    EXPECT_TRUE(engine_->UnlockTokens("alice", kClass, 10).Is(ErrorCode::StorageError));
    EXPECT_EQ(ledger_.LockedOf("alice", kClass), 10);
    EXPECT_EQ(engine_->GetLock("alice", kClass)->amount, 10);
}

TEST_F(GovernancePersistenceTest, LoadWithoutDatabase) {
    GovernanceEngine engine(ledger_, operators_);
    EXPECT_FALSE(engine.HasDatabase());
    EXPECT_TRUE(engine.Load().Is(ErrorCode::StorageError));
}

TEST_F(GovernancePersistenceTest, LoadEmptyDatabase) {
    EXPECT_TRUE(engine_->HasDatabase());
    EXPECT_TRUE(engine_->Load().ok());
    EXPECT_EQ(engine_->GetCurrentProposalCount(), 0u);
}

TEST_F(GovernancePersistenceTest, CorruptRecordLeavesStateUntouched) {
    auto [status, id] = engine_->CreateProposal("operator", "keep me", {}, 2000);
    ASSERT_TRUE(status.ok());
    ASSERT_TRUE(db_.Put(GovernanceDB::TallyKey(id), "garbage").ok());

    EXPECT_TRUE(engine_->Load().Is(ErrorCode::StorageError));
    EXPECT_EQ(engine_->GetCurrentProposalCount(), 1u);
    EXPECT_EQ(engine_->GetEvents(EventKind::ProposalCreated).size(), 1u);
}

TEST_F(GovernancePersistenceTest, VoteWithoutTallyUpdateRejected) {
    auto [status, id] = engine_->CreateProposal("operator", "tampered", {}, 2000);
    ASSERT_TRUE(status.ok());

    VoteRecord forged;
    forged.proposalId = id;
    forged.voter = "mallory";
    forged.choice = true;
    forged.weight = 1;
    db::WriteBatch batch;
    GovernanceDB::WriteVote(batch, forged);
    ASSERT_TRUE(db_.Write(&batch).ok());

    auto reloaded = NewEngine();
    EXPECT_TRUE(reloaded->Load().Is(ErrorCode::StorageError));
    EXPECT_EQ(reloaded->GetCurrentProposalCount(), 0u);
}

TEST_F(GovernancePersistenceTest, CounterMismatchRejected) {
    db::WriteBatch batch;
    GovernanceDB::WriteCounter(batch, counter::NEXT_PROPOSAL_ID, 5);
    ASSERT_TRUE(db_.Write(&batch).ok());
    EXPECT_TRUE(engine_->Load().Is(ErrorCode::StorageError));
}

TEST_F(GovernancePersistenceTest, ForeignPrefixesIgnored) {
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::LEDGER, "ledger"), "opaque").ok());
    EXPECT_TRUE(engine_->Load().ok());
}

// ============================================================================
// Key Layout
// ============================================================================

TEST(GovernanceKeyTest, VotesOfOneProposalAreContiguous) {
    std::string a = GovernanceDB::VoteKey(1, "zed");
    std::string b = GovernanceDB::VoteKey(2, "amy");
    EXPECT_LT(a, b);
    EXPECT_EQ(a[0], db::prefix::VOTE);
}

TEST(GovernanceKeyTest, EventKeysOrderBySequence) {
    EXPECT_LT(GovernanceDB::EventKey(EventKind::VoteCast, 9),
              GovernanceDB::EventKey(EventKind::VoteCast, 10));
    EXPECT_LT(GovernanceDB::EventKey(EventKind::ProposalCreated, 500),
              GovernanceDB::EventKey(EventKind::VoteCast, 1));
}

} // namespace test
} // namespace governance
} // namespace sharegov
