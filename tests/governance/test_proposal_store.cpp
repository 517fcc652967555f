// SHAREGOV - Proposal Store Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/governance/proposal.h>
#include <sharegov/governance/params.h>
#include <sharegov/db/database.h>

#include <string>
#include <vector>

namespace sharegov {
namespace governance {
namespace test {

namespace {

const ProposalLimits kLimits{DEFAULT_MAX_DESCRIPTION_LENGTH, 4};

Proposal MakeProposal(ProposalId id) {
    Proposal p;
    p.id = id;
    p.creator = "operator";
    p.description = "Proposal " + std::to_string(id);
    p.createdAt = 100;
    p.deadline = 1000;
    p.shareClass = 1;
    p.supplyBaseline = 10;
    return p;
}

} // namespace

// ============================================================================
// Content Validation
// ============================================================================

TEST(ProposalValidationTest, BinaryProposal) {
    EXPECT_TRUE(ProposalStore::ValidateContent("Upgrade Treasury", {}, kLimits).ok());
}

TEST(ProposalValidationTest, EmptyDescriptionRejected) {
    EXPECT_TRUE(ProposalStore::ValidateContent("", {}, kLimits).Is(ErrorCode::InvalidProposal));
}

TEST(ProposalValidationTest, LongDescriptionRejected) {
    std::string atLimit(DEFAULT_MAX_DESCRIPTION_LENGTH, 'd');
    EXPECT_TRUE(ProposalStore::ValidateContent(atLimit, {}, kLimits).ok());
    EXPECT_FALSE(ProposalStore::ValidateContent(atLimit + "d", {}, kLimits).ok());
}

TEST(ProposalValidationTest, OptionRules) {
    EXPECT_TRUE(ProposalStore::ValidateContent("pick", {"a", "b"}, kLimits).ok());
    EXPECT_FALSE(ProposalStore::ValidateContent("pick", {"only"}, kLimits).ok());
    EXPECT_FALSE(ProposalStore::ValidateContent("pick", {"a", "a"}, kLimits).ok());
    EXPECT_FALSE(ProposalStore::ValidateContent("pick", {"a", ""}, kLimits).ok());
    EXPECT_FALSE(ProposalStore::ValidateContent("pick", {"a", "b", "c", "d", "e"}, kLimits).ok());
    EXPECT_FALSE(ProposalStore::ValidateContent(
        "pick", {"a", std::string(MAX_OPTION_NAME_LENGTH + 1, 'o')}, kLimits).ok());
}

// ============================================================================
// Store
// ============================================================================

TEST(ProposalStoreTest, SequentialIdsFromOne) {
    ProposalStore store;
    EXPECT_EQ(store.PeekNextId(), 1u);
    EXPECT_TRUE(store.Add(MakeProposal(1)));
    EXPECT_TRUE(store.Add(MakeProposal(2)));
    EXPECT_EQ(store.PeekNextId(), 3u);
    EXPECT_EQ(store.Count(), 2u);
    EXPECT_EQ(store.GetIds(), (std::vector<ProposalId>{1, 2}));
}

TEST(ProposalStoreTest, AddRejectsWrongId) {
    ProposalStore store;
    EXPECT_FALSE(store.Add(MakeProposal(5)));
    EXPECT_EQ(store.Count(), 0u);
    EXPECT_EQ(store.PeekNextId(), 1u);
}

TEST(ProposalStoreTest, GetUnknown) {
    ProposalStore store;
    ASSERT_TRUE(store.Add(MakeProposal(1)));
    EXPECT_NE(store.Get(1), nullptr);
    EXPECT_EQ(store.Get(0), nullptr);
    EXPECT_EQ(store.Get(2), nullptr);
    EXPECT_FALSE(store.Contains(2));
}

TEST(ProposalStoreTest, RestoreAdvancesCounter) {
    ProposalStore store;
    store.Restore(MakeProposal(7));
    EXPECT_EQ(store.PeekNextId(), 8u);
    store.Restore(MakeProposal(3));
    EXPECT_EQ(store.PeekNextId(), 8u);

    store.Clear();
    EXPECT_EQ(store.PeekNextId(), 1u);
}

// ============================================================================
// Record
// ============================================================================

TEST(ProposalTest, OptionIndex) {
    Proposal p = MakeProposal(1);
    p.options = {"red", "green", "blue"};
    EXPECT_TRUE(p.IsMultiOption());
    EXPECT_EQ(p.OptionIndex("blue"), std::optional<size_t>(2));
    EXPECT_FALSE(p.OptionIndex("pink").has_value());
}

TEST(ProposalTest, SerializationPreservesFields) {
    Proposal p = MakeProposal(4);
    p.options = {"a", "b"};
    p.weighting = VoteWeighting::ByBalance;
    p.finalized = true;
    p.finalOptionCounts = {3, 1};
    p.tallyDigest[0] = 0xAB;

    Proposal restored;
    ASSERT_TRUE(db::DeserializeFromString(db::SerializeToString(p), restored));
    EXPECT_EQ(restored.id, 4u);
    EXPECT_EQ(restored.options, p.options);
    EXPECT_EQ(restored.weighting, VoteWeighting::ByBalance);
    EXPECT_EQ(restored.finalOptionCounts, p.finalOptionCounts);
    EXPECT_EQ(restored.GetHash(), p.GetHash());
}

TEST(ProposalTest, HashChangesWithContent) {
    Proposal a = MakeProposal(1);
    Proposal b = MakeProposal(1);
    b.description = "different";
    EXPECT_NE(a.GetHash(), b.GetHash());
}

} // namespace test
} // namespace governance
} // namespace sharegov
