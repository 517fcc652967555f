// SHAREGOV - Fraction Vote Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/governance/engine.h>
#include <sharegov/governance/fraction.h>
#include <sharegov/ledger/access_control.h>
#include <sharegov/ledger/balance_ledger.h>

#include <memory>
#include <string>

namespace sharegov {
namespace governance {
namespace test {

// ============================================================================
// Registry
// ============================================================================

TEST(FractionRegistryTest, SequentialIds) {
    FractionRegistry registry;
    FractionRecord record;
    record.id = 1;
    record.assetId = 500;
    EXPECT_TRUE(registry.Add(record));
    EXPECT_FALSE(registry.Add(record));

    record.id = 2;
    record.assetId = 501;
    EXPECT_TRUE(registry.Add(record));
    EXPECT_EQ(registry.PeekNextId(), 3u);
    EXPECT_EQ(registry.Count(), 2u);
}

TEST(FractionRegistryTest, UpdateOnlyExisting) {
    FractionRegistry registry;
    FractionRecord record;
    record.id = 1;
    ASSERT_TRUE(registry.Add(record));

    record.proposalId = 9;
    EXPECT_TRUE(registry.Update(record));
    EXPECT_TRUE(registry.Get(1)->HasVote());

    record.id = 5;
    EXPECT_FALSE(registry.Update(record));
    EXPECT_EQ(registry.Get(5), nullptr);
}

TEST(FractionRegistryTest, GetByAsset) {
    FractionRegistry registry;
    for (FractionId id = 1; id <= 3; ++id) {
        FractionRecord record;
        record.id = id;
        record.assetId = id == 2 ? 77 : 88;
        ASSERT_TRUE(registry.Add(record));
    }
    auto fractions = registry.GetByAsset(88);
    ASSERT_EQ(fractions.size(), 2u);
    EXPECT_EQ(fractions[0].id, 1u);
    EXPECT_EQ(fractions[1].id, 3u);
}

TEST(FractionRegistryTest, RestoreAdvancesCounter) {
    FractionRegistry registry;
    FractionRecord record;
    record.id = 4;
    registry.Restore(record);
    EXPECT_EQ(registry.PeekNextId(), 5u);
    registry.Clear();
    EXPECT_EQ(registry.PeekNextId(), 1u);
}

// ============================================================================
// Engine Fraction Votes
// ============================================================================

class FractionVoteTest : public ::testing::Test {
protected:
    static constexpr ShareClassId kClass = 3;

    void SetUp() override {
        ASSERT_TRUE(operators_.Add("operator"));
        engine_ = std::make_unique<GovernanceEngine>(ledger_, operators_);
        engine_->SetClock([this] { return now_; });
        for (int i = 0; i < 10; ++i) {
            ASSERT_TRUE(ledger_.Mint("holder" + std::to_string(i), kClass, 1));
        }
    }

    FractionId Register(Amount minted = 10) {
        auto [status, id] = engine_->RegisterFraction("operator", 700, kClass, minted, "owner");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return id;
    }

    ledger::MemoryBalanceLedger ledger_;
    ledger::OperatorRegistry operators_;
    Timestamp now_{1000};
    std::unique_ptr<GovernanceEngine> engine_;
};

TEST_F(FractionVoteTest, RegisterRecordsFraction) {
    FractionId id = Register();
    EXPECT_EQ(id, 1u);

    auto [status, fraction] = engine_->GetFraction(id);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(fraction.assetId, 700u);
    EXPECT_EQ(fraction.totalMinted, 10);
    EXPECT_EQ(fraction.trackedAmount, 10);
    EXPECT_EQ(fraction.owner, "owner");
    EXPECT_FALSE(fraction.HasVote());

    auto events = engine_->GetEvents(EventKind::FractionCreated);
    ASSERT_EQ(events.size(), 1u);
    const auto& payload = std::get<FractionCreatedEvent>(events[0].payload);
    EXPECT_EQ(payload.fractionId, id);
    EXPECT_EQ(payload.amount, 10);
}

TEST_F(FractionVoteTest, RegisterRejections) {
    EXPECT_TRUE(engine_->RegisterFraction("mallory", 1, kClass, 10, "owner").first
                    .Is(ErrorCode::Unauthorized));
    EXPECT_TRUE(engine_->RegisterFraction("operator", 1, kClass, 0, "owner").first
                    .Is(ErrorCode::InvalidAmount));
    EXPECT_TRUE(engine_->RegisterFraction("operator", 1, kClass, 10, "").first
                    .Is(ErrorCode::InvalidProposal));
    EXPECT_TRUE(engine_->GetFraction(1).first.Is(ErrorCode::NotFound));
}

TEST_F(FractionVoteTest, VoteOpensImmediately) {
    FractionId fraction = Register();
    auto [status, proposalId] = engine_->CreateFractionVote("operator", fraction,
                                                            "Sell the asset", 2000);
    ASSERT_TRUE(status.ok()) << status.ToString();

    auto proposal = engine_->GetProposal(proposalId).second;
    EXPECT_EQ(proposal.fractionId, fraction);
    EXPECT_EQ(proposal.votingStart, 1000);
    EXPECT_EQ(proposal.supplyBaseline, 10);
    EXPECT_EQ(proposal.shareClass, kClass);
    EXPECT_EQ(engine_->GetFraction(fraction).second.proposalId, proposalId);
    EXPECT_EQ(engine_->GetEvents(EventKind::VotingStarted).size(), 1u);

    EXPECT_TRUE(engine_->CastVote(proposalId, "holder0", true).ok());
}

TEST_F(FractionVoteTest, OneVotePerFraction) {
    FractionId fraction = Register();
    ASSERT_TRUE(engine_->CreateFractionVote("operator", fraction, "first", 2000).first.ok());
    EXPECT_TRUE(engine_->CreateFractionVote("operator", fraction, "second", 2000).first
                    .Is(ErrorCode::InvalidProposal));
    EXPECT_EQ(engine_->GetCurrentProposalCount(), 1u);
}

TEST_F(FractionVoteTest, CreateVoteRejections) {
    FractionId fraction = Register();
    EXPECT_TRUE(engine_->CreateFractionVote("mallory", fraction, "x", 2000).first
                    .Is(ErrorCode::Unauthorized));
    EXPECT_TRUE(engine_->CreateFractionVote("operator", 99, "x", 2000).first
                    .Is(ErrorCode::NotFound));
    EXPECT_TRUE(engine_->CreateFractionVote("operator", fraction, "x", 1000).first
                    .Is(ErrorCode::InvalidDeadline));
    EXPECT_FALSE(engine_->GetFraction(fraction).second.HasVote());
}

TEST_F(FractionVoteTest, DecisionOnFractionBaseline) {
    FractionId fraction = Register();
    auto [status, proposalId] = engine_->CreateFractionVote("operator", fraction, "vote", 2000);
    ASSERT_TRUE(status.ok());

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(engine_->CastVote(proposalId, "holder" + std::to_string(i), true).ok());
    }
    auto decision = engine_->ComputeFractionDecision(fraction, GovernanceModel::SimpleMajority);
    ASSERT_TRUE(decision.first.ok());
    EXPECT_FALSE(decision.second.passed);
    EXPECT_EQ(decision.second.affirmative, 5u);
    EXPECT_EQ(decision.second.totalSupply, 10u);

    ASSERT_TRUE(engine_->CastVote(proposalId, "holder5", true).ok());
    EXPECT_TRUE(engine_->ComputeFractionDecision(fraction, GovernanceModel::SimpleMajority)
                    .second.passed);
    EXPECT_TRUE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Supermajority)
                    .second.passed);
    EXPECT_FALSE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Consensus)
                     .second.passed);
}

TEST_F(FractionVoteTest, ConsensusNeedsEveryShare) {
    FractionId fraction = Register();
    auto [status, proposalId] = engine_->CreateFractionVote("operator", fraction, "vote", 2000);
    ASSERT_TRUE(status.ok());
    for (int i = 0; i < 9; ++i) {
        ASSERT_TRUE(engine_->CastVote(proposalId, "holder" + std::to_string(i), true).ok());
    }
    EXPECT_FALSE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Consensus)
                     .second.passed);
    ASSERT_TRUE(engine_->CastVote(proposalId, "holder9", true).ok());
    EXPECT_TRUE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Consensus)
                    .second.passed);
}

TEST_F(FractionVoteTest, DecisionWithoutVoteIsNotFound) {
    FractionId fraction = Register();
    EXPECT_TRUE(engine_->ComputeFractionDecision(fraction, GovernanceModel::SimpleMajority)
                    .first.Is(ErrorCode::NotFound));
    EXPECT_TRUE(engine_->ComputeFractionDecision(42, GovernanceModel::SimpleMajority)
                    .first.Is(ErrorCode::NotFound));
}

TEST_F(FractionVoteTest, VotesWeighedByShares) {
    constexpr ShareClassId kOther = 4;
    ASSERT_TRUE(ledger_.Mint("alice", kOther, 60));
    ASSERT_TRUE(ledger_.Mint("bob", kOther, 40));
    auto [s1, fraction] = engine_->RegisterFraction("operator", 800, kOther, 100, "owner");
    ASSERT_TRUE(s1.ok());
    auto [s2, proposalId] = engine_->CreateFractionVote("operator", fraction, "vote", 2000);
    ASSERT_TRUE(s2.ok());
    EXPECT_EQ(engine_->GetProposal(proposalId).second.weighting, VoteWeighting::ByBalance);

    ASSERT_TRUE(engine_->CastVote(proposalId, "alice", true).ok());
    auto decision = engine_->ComputeFractionDecision(fraction, GovernanceModel::SimpleMajority);
    ASSERT_TRUE(decision.first.ok());
    EXPECT_TRUE(decision.second.passed);
    EXPECT_EQ(decision.second.affirmative, 60u);
    EXPECT_FALSE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Supermajority)
                     .second.passed);

    ASSERT_TRUE(engine_->CastVote(proposalId, "bob", true).ok());
    EXPECT_TRUE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Consensus)
                    .second.passed);
}

TEST_F(FractionVoteTest, FractionsListedByAsset) {
    FractionId first = Register();
    ASSERT_TRUE(engine_->RegisterFraction("operator", 701, kClass, 5, "owner").first.ok());
    FractionId third = Register(4);

    auto fractions = engine_->GetFractionsByAsset(700);
    ASSERT_EQ(fractions.size(), 2u);
    EXPECT_EQ(fractions[0].id, first);
    EXPECT_EQ(fractions[1].id, third);
    EXPECT_EQ(fractions[1].totalMinted, 4);
    EXPECT_TRUE(engine_->GetFractionsByAsset(999).empty());
}

TEST_F(FractionVoteTest, FractionsDecideIndependently) {
    FractionId a = Register(10);
    FractionId b = Register(4);
    ProposalId pa = engine_->CreateFractionVote("operator", a, "a", 2000).second;
    ProposalId pb = engine_->CreateFractionVote("operator", b, "b", 2000).second;

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(engine_->CastVote(pb, "holder" + std::to_string(i), true).ok());
    }
    ASSERT_TRUE(engine_->CastVote(pa, "holder0", true).ok());

    EXPECT_TRUE(engine_->ComputeFractionDecision(b, GovernanceModel::SimpleMajority).second.passed);
    EXPECT_FALSE(engine_->ComputeFractionDecision(a, GovernanceModel::SimpleMajority).second.passed);
}

} // namespace test
} // namespace governance
} // namespace sharegov
