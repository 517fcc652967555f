// SHAREGOV - Access Control Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/ledger/access_control.h>

#include <string>

using namespace sharegov;
using namespace sharegov::ledger;

TEST(OperatorRegistryTest, EmptyRegistryAuthorizesNobody) {
    OperatorRegistry registry;
    EXPECT_FALSE(registry.IsAuthorized("operator"));
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(OperatorRegistryTest, AddAndRemove) {
    OperatorRegistry registry;
    EXPECT_TRUE(registry.Add("operator"));
    EXPECT_FALSE(registry.Add("operator"));
    EXPECT_FALSE(registry.Add(""));

    EXPECT_TRUE(registry.IsAuthorized("operator"));
    EXPECT_FALSE(registry.IsAuthorized("mallory"));

    EXPECT_TRUE(registry.Remove("operator"));
    EXPECT_FALSE(registry.Remove("operator"));
    EXPECT_FALSE(registry.IsAuthorized("operator"));
}

TEST(OperatorRegistryTest, OperatorsAreSorted) {
    OperatorRegistry registry;
    ASSERT_TRUE(registry.Add("zed"));
    ASSERT_TRUE(registry.Add("amy"));
    auto ops = registry.GetOperators();
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0], "amy");
}

TEST(OperatorRegistryTest, AllowAllAcceptsValidIds) {
    OperatorRegistry registry(true);
    EXPECT_TRUE(registry.AllowsAll());
    EXPECT_TRUE(registry.IsAuthorized("anyone"));
    EXPECT_FALSE(registry.IsAuthorized(""));
    EXPECT_FALSE(registry.IsAuthorized(std::string(129, 'x')));
}
