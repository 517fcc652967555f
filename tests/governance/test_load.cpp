// SHAREGOV - Governance Load Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/governance/engine.h>
#include <sharegov/ledger/access_control.h>
#include <sharegov/ledger/balance_ledger.h>

#include <memory>
#include <string>
#include <vector>

namespace sharegov {
namespace governance {
namespace test {

class GovernanceLoadTest : public ::testing::Test {
protected:
    static constexpr ShareClassId kClass = 5;
    static constexpr Amount kSupply = 1000000;

    void SetUp() override {
        ASSERT_TRUE(operators_.Add("operator"));
        GovernanceParams params;
        params.eventRetention = 1000;
        engine_ = std::make_unique<GovernanceEngine>(ledger_, operators_, params);
        engine_->SetClock([this] { return now_; });
    }

    static HolderId Holder(int i) { return "holder" + std::to_string(i); }

    void MintHolders(int count) {
        for (int i = 0; i < count; ++i) {
            ASSERT_TRUE(ledger_.Mint(Holder(i), kClass, 1));
        }
    }

    /// Register a fraction and open its vote
    std::pair<FractionId, ProposalId> OpenFractionVote(Amount minted) {
        auto [s1, fraction] = engine_->RegisterFraction("operator", 1, kClass, minted, "issuer");
        EXPECT_TRUE(s1.ok()) << s1.ToString();
        auto [s2, proposal] = engine_->CreateFractionVote("operator", fraction, "Sell", 5000);
        EXPECT_TRUE(s2.ok()) << s2.ToString();
        return {fraction, proposal};
    }

    ledger::MemoryBalanceLedger ledger_;
    ledger::OperatorRegistry operators_;
    Timestamp now_{1000};
    std::unique_ptr<GovernanceEngine> engine_;
};

TEST_F(GovernanceLoadTest, MillionShareFractionMajority) {
    constexpr int kVoters = 600001;
    MintHolders(kVoters);
    auto [fraction, proposal] = OpenFractionVote(kSupply);

    for (int i = 0; i < kVoters; ++i) {
        ASSERT_TRUE(engine_->CastVote(proposal, Holder(i), true).ok()) << i;
    }

    auto [status, decision] = engine_->ComputeFractionDecision(fraction,
                                                               GovernanceModel::SimpleMajority);
    ASSERT_TRUE(status.ok());
    EXPECT_TRUE(decision.passed);
    EXPECT_EQ(decision.affirmative, 600001u);
    EXPECT_EQ(decision.totalSupply, 1000000u);

    EXPECT_FALSE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Supermajority)
                     .second.passed);
    EXPECT_FALSE(engine_->ComputeFractionDecision(fraction, GovernanceModel::Consensus)
                     .second.passed);
    EXPECT_EQ(engine_->GetVotes(proposal, "yes").second, 600001u);
}

TEST_F(GovernanceLoadTest, MillionShareFractionBoundary) {
    constexpr int kVoters = 500001;
    MintHolders(kVoters);
    auto [fraction, proposal] = OpenFractionVote(kSupply);

    for (int i = 0; i < kVoters - 1; ++i) {
        ASSERT_TRUE(engine_->CastVote(proposal, Holder(i), true).ok()) << i;
    }
    EXPECT_FALSE(engine_->ComputeFractionDecision(fraction, GovernanceModel::SimpleMajority)
                     .second.passed);

    ASSERT_TRUE(engine_->CastVote(proposal, Holder(kVoters - 1), true).ok());
    EXPECT_TRUE(engine_->ComputeFractionDecision(fraction, GovernanceModel::SimpleMajority)
                    .second.passed);
}

TEST_F(GovernanceLoadTest, ManyProposalsKeepIndependentTallies) {
    constexpr int kHolders = 50;
    constexpr int kProposals = 200;
    MintHolders(kHolders);

    std::vector<ProposalId> ids;
    for (int p = 0; p < kProposals; ++p) {
        auto [status, id] = engine_->CreateProposal(
            "operator", ProposalSpec{"proposal " + std::to_string(p), {}, 5000, kClass,
                                     VoteWeighting::PerHolder, 0});
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(engine_->OpenVoting("operator", id, 1000).ok());
        ids.push_back(id);
    }

    // Proposal p receives p % kHolders yes votes and the rest no
    for (int p = 0; p < kProposals; ++p) {
        int yes = p % kHolders;
        for (int h = 0; h < kHolders; ++h) {
            ASSERT_TRUE(engine_->CastVote(ids[p], Holder(h), h < yes).ok());
        }
    }

    EXPECT_EQ(engine_->GetCurrentProposalCount(), static_cast<uint64_t>(kProposals));
    for (int p = 0; p < kProposals; ++p) {
        uint64_t yes = static_cast<uint64_t>(p % kHolders);
        EXPECT_EQ(engine_->GetVotes(ids[p], "yes").second, yes);
        EXPECT_EQ(engine_->GetVotes(ids[p], "no").second, static_cast<uint64_t>(kHolders) - yes);
        EXPECT_EQ(engine_->ComputeDecision(ids[p], GovernanceModel::SimpleMajority).second.passed,
                  yes > static_cast<uint64_t>(kHolders / 2));
    }
}

TEST_F(GovernanceLoadTest, EventRetentionBoundsMemoryNotSequences) {
    constexpr int kVoters = 5000;
    MintHolders(kVoters);
    auto [fraction, proposal] = OpenFractionVote(kVoters);
    (void)fraction;

    for (int i = 0; i < kVoters; ++i) {
        ASSERT_TRUE(engine_->CastVote(proposal, Holder(i), i % 2 == 0).ok());
    }

    auto events = engine_->GetEvents(EventKind::VoteCast);
    ASSERT_EQ(events.size(), 1000u);
    EXPECT_EQ(events.front().sequence, 4001u);
    EXPECT_EQ(events.back().sequence, 5000u);

    auto tail = engine_->GetEvents(EventKind::VoteCast, 4990);
    ASSERT_EQ(tail.size(), 10u);
    EXPECT_EQ(tail.front().sequence, 4991u);

    EXPECT_EQ(engine_->GetVotes(proposal, "yes").second, 2500u);
}

} // namespace test
} // namespace governance
} // namespace sharegov
