// SHAREGOV - Governance Parameter Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/governance/params.h>

namespace sharegov {
namespace governance {
namespace test {

TEST(GovernanceParamsTest, Defaults) {
    GovernanceParams params;
    EXPECT_EQ(params.governanceClass, DEFAULT_GOVERNANCE_CLASS);
    EXPECT_EQ(params.maxDescriptionLength, DEFAULT_MAX_DESCRIPTION_LENGTH);
    EXPECT_EQ(params.maxOptions, DEFAULT_MAX_OPTIONS);
    EXPECT_EQ(params.defaultModel, GovernanceModel::SimpleMajority);
    EXPECT_TRUE(params.operators.empty());
}

TEST(GovernanceParamsTest, EmptyConfigKeepsDefaults) {
    util::ConfigManager config;
    GovernanceParams params;
    ASSERT_TRUE(GovernanceParams::FromConfig(config, params).success);
    EXPECT_EQ(params.maxOptions, DEFAULT_MAX_OPTIONS);
}

TEST(GovernanceParamsTest, ReadsAllKeys) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "governanceclass=7\n"
        "maxdescriptionlength=200\n"
        "maxoptions=4\n"
        "defaultmodel=supermajority\n"
        "eventretention=50\n"
        "operator=board\n"
        "operator=secretary\n").success);

    GovernanceParams params;
    auto result = GovernanceParams::FromConfig(config, params);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(params.governanceClass, 7u);
    EXPECT_EQ(params.maxDescriptionLength, 200u);
    EXPECT_EQ(params.maxOptions, 4u);
    EXPECT_EQ(params.defaultModel, GovernanceModel::Supermajority);
    EXPECT_EQ(params.eventRetention, 50u);
    ASSERT_EQ(params.operators.size(), 2u);
    EXPECT_EQ(params.operators[1], "secretary");
}

TEST(GovernanceParamsTest, RejectsOutOfRangeOptions) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("maxoptions=1\n").success);

    GovernanceParams params;
    auto result = GovernanceParams::FromConfig(config, params);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("maxoptions"), std::string::npos);
    EXPECT_EQ(params.maxOptions, DEFAULT_MAX_OPTIONS);
}

TEST(GovernanceParamsTest, RejectsUnknownModel) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("defaultmodel=plurality\n").success);

    GovernanceParams params;
    EXPECT_FALSE(GovernanceParams::FromConfig(config, params).success);
    EXPECT_EQ(params.defaultModel, GovernanceModel::SimpleMajority);
}

TEST(GovernanceParamsTest, ErrorLeavesOutputUnchanged) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("maxoptions=8\nmaxdescriptionlength=0\n").success);

    GovernanceParams params;
    EXPECT_FALSE(GovernanceParams::FromConfig(config, params).success);
    EXPECT_EQ(params.maxOptions, DEFAULT_MAX_OPTIONS);
}

TEST(GovernanceParamsTest, ToStringMentionsModel) {
    GovernanceParams params;
    EXPECT_NE(params.ToString().find("SimpleMajority"), std::string::npos);
}

} // namespace test
} // namespace governance
} // namespace sharegov
