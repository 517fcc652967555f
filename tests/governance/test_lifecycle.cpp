// SHAREGOV - Lifecycle Controller Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/governance/lifecycle.h>

namespace sharegov {
namespace governance {
namespace test {

class LifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        proposal_.id = 1;
        proposal_.description = "Upgrade Treasury";
        proposal_.createdAt = 1000;
        proposal_.deadline = 2000;
    }

    LifecycleController lifecycle_;
    Proposal proposal_;
};

TEST_F(LifecycleTest, DeadlineMustBeInFuture) {
    EXPECT_TRUE(lifecycle_.ValidateDeadline(1001, 1000).ok());
    EXPECT_TRUE(lifecycle_.ValidateDeadline(1000, 1000).Is(ErrorCode::InvalidDeadline));
    EXPECT_TRUE(lifecycle_.ValidateDeadline(5, 1000).Is(ErrorCode::InvalidDeadline));
}

TEST_F(LifecycleTest, StateProgression) {
    EXPECT_EQ(lifecycle_.StateAt(proposal_, 1500), ProposalState::Created);

    proposal_.votingStart = 1100;
    EXPECT_EQ(lifecycle_.StateAt(proposal_, 1500), ProposalState::VotingOpen);
    EXPECT_EQ(lifecycle_.StateAt(proposal_, 2000), ProposalState::VotingOpen);
    EXPECT_EQ(lifecycle_.StateAt(proposal_, 2001), ProposalState::Closed);

    proposal_.finalized = true;
    EXPECT_EQ(lifecycle_.StateAt(proposal_, 2001), ProposalState::Finalized);
}

TEST_F(LifecycleTest, UnopenedProposalClosesAtDeadline) {
    EXPECT_EQ(lifecycle_.StateAt(proposal_, 2001), ProposalState::Closed);
}

TEST_F(LifecycleTest, OpenWindowRules) {
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1100, 1000).ok());
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1999, 1000).ok());
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 0, 1000).Is(ErrorCode::InvalidWindow));
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 2000, 1000).Is(ErrorCode::InvalidWindow));
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 2500, 1000).Is(ErrorCode::InvalidWindow));
}

TEST_F(LifecycleTest, OpenOnlyOnce) {
    proposal_.votingStart = 1100;
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1200, 1000).Is(ErrorCode::InvalidWindow));
}

TEST_F(LifecycleTest, OpenRequiresCreatedState) {
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1500, 2000).ok());
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1500, 2001).Is(ErrorCode::InvalidWindow));

    proposal_.finalized = true;
    proposal_.finalizedAt = 2001;
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1500, 1500).Is(ErrorCode::InvalidWindow));
    EXPECT_TRUE(lifecycle_.CheckCanOpen(proposal_, 1500, 2500).Is(ErrorCode::InvalidWindow));
}

TEST_F(LifecycleTest, VotingWindowIsInclusive) {
    EXPECT_TRUE(lifecycle_.CheckCanVote(proposal_, 1500).Is(ErrorCode::VotingNotStarted));

    proposal_.votingStart = 1100;
    EXPECT_TRUE(lifecycle_.CheckCanVote(proposal_, 1099).Is(ErrorCode::VotingClosed));
    EXPECT_TRUE(lifecycle_.CheckCanVote(proposal_, 1100).ok());
    EXPECT_TRUE(lifecycle_.CheckCanVote(proposal_, 2000).ok());
    EXPECT_TRUE(lifecycle_.CheckCanVote(proposal_, 2001).Is(ErrorCode::VotingClosed));
}

TEST_F(LifecycleTest, FinalizeAfterDeadlineOnce) {
    EXPECT_TRUE(lifecycle_.CheckCanFinalize(proposal_, 2000).Is(ErrorCode::TooEarly));
    EXPECT_TRUE(lifecycle_.CheckCanFinalize(proposal_, 2001).ok());

    proposal_.finalized = true;
    EXPECT_TRUE(lifecycle_.CheckCanFinalize(proposal_, 3000).Is(ErrorCode::AlreadyFinalized));
    EXPECT_TRUE(lifecycle_.CheckCanFinalize(proposal_, 1500).Is(ErrorCode::AlreadyFinalized));
}

} // namespace test
} // namespace governance
} // namespace sharegov
