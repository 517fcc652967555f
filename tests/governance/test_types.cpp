// SHAREGOV - Governance Types Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/governance/types.h>

#include <string>

namespace sharegov {
namespace governance {
namespace test {

TEST(GovernanceStatusTest, OkAndErrors) {
    Status ok;
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.ToString(), "OK");

    Status err = Status::AlreadyVoted("alice on 3");
    EXPECT_FALSE(err.ok());
    EXPECT_TRUE(err.Is(ErrorCode::AlreadyVoted));
    EXPECT_EQ(err.ToString(), "AlreadyVoted: alice on 3");
    EXPECT_EQ(Status::TooEarly().ToString(), "TooEarly");
}

TEST(GovernanceStatusTest, EveryCodeHasName) {
    for (int c = static_cast<int>(ErrorCode::OK);
         c <= static_cast<int>(ErrorCode::StorageError); ++c) {
        EXPECT_STRNE(ErrorCodeToString(static_cast<ErrorCode>(c)), "Unknown");
    }
}

TEST(GovernanceModelTest, ParseNames) {
    EXPECT_EQ(ParseGovernanceModel("SimpleMajority"), GovernanceModel::SimpleMajority);
    EXPECT_EQ(ParseGovernanceModel("majority"), GovernanceModel::SimpleMajority);
    EXPECT_EQ(ParseGovernanceModel("SUPERMAJORITY"), GovernanceModel::Supermajority);
    EXPECT_EQ(ParseGovernanceModel("unanimous"), GovernanceModel::Consensus);
    EXPECT_FALSE(ParseGovernanceModel("plurality").has_value());
    EXPECT_STREQ(GovernanceModelToString(GovernanceModel::Consensus), "Consensus");
}

TEST(VoteWeightingTest, ParseNames) {
    EXPECT_EQ(ParseVoteWeighting("balance"), VoteWeighting::ByBalance);
    EXPECT_EQ(ParseVoteWeighting("PerHolder"), VoteWeighting::PerHolder);
    EXPECT_FALSE(ParseVoteWeighting("quadratic").has_value());
}

TEST(VoteChoiceTest, ToString) {
    EXPECT_EQ(ChoiceToString(VoteChoice(true)), "yes");
    EXPECT_EQ(ChoiceToString(VoteChoice(false)), "no");
    EXPECT_EQ(ChoiceToString(VoteChoice(std::string("option-b"))), "option-b");
    EXPECT_TRUE(IsBinaryChoice(VoteChoice(false)));
    EXPECT_FALSE(IsBinaryChoice(VoteChoice(std::string("x"))));
}

TEST(VoteChoiceTest, SerializeBothKinds) {
    DataStream ds;
    SerializeChoice(ds, VoteChoice(true));
    SerializeChoice(ds, VoteChoice(std::string("blue")));

    VoteChoice a;
    VoteChoice b;
    UnserializeChoice(ds, a);
    UnserializeChoice(ds, b);
    EXPECT_EQ(a, VoteChoice(true));
    EXPECT_EQ(b, VoteChoice(std::string("blue")));
}

TEST(VoteChoiceTest, UnknownTagRejected) {
    DataStream ds;
    ds << uint8_t(7);
    VoteChoice choice;
    EXPECT_THROW(UnserializeChoice(ds, choice), std::ios_base::failure);
}

} // namespace test
} // namespace governance
} // namespace sharegov
