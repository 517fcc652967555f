// SHAREGOV - SHA256 Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/crypto/sha256.h>
#include <sharegov/core/serialize.h>
#include <sharegov/core/types.h>

#include <string>
#include <vector>

namespace sharegov {
namespace test {

namespace {

Hash256 HashString(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

} // namespace

// ============================================================================
// Known Vectors (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(HashToHex(HashString("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(HashToHex(HashString("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(HashToHex(HashString("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionA) {
    std::string input(1000000, 'a');
    EXPECT_EQ(HashToHex(HashString(input)),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, ChainedWritesMatchSingleWrite) {
    const std::string part1 = "abcdbcdecdefdefgefgh";
    const std::string part2 = "fghighijhijkijkljklmklmnlmnomnopnopq";

    SHA256 hasher;
    Hash256 chained;
    hasher.Write(reinterpret_cast<const Byte*>(part1.data()), part1.size())
          .Write(reinterpret_cast<const Byte*>(part2.data()), part2.size());
    hasher.Finalize(chained);

    EXPECT_EQ(chained, HashString(part1 + part2));
}

TEST(SHA256Test, ResetDiscardsInput) {
    SHA256 hasher;
    const std::string junk = "junk";
    hasher.Write(reinterpret_cast<const Byte*>(junk.data()), junk.size());
    hasher.Reset();

    const std::string abc = "abc";
    Hash256 hash;
    hasher.Write(reinterpret_cast<const Byte*>(abc.data()), abc.size());
    hasher.Finalize(hash);
    EXPECT_EQ(hash, HashString("abc"));
}

TEST(SHA256Test, FinalizeResetsHasher) {
    SHA256 hasher;
    Hash256 first;
    Hash256 second;
    hasher.Write(reinterpret_cast<const Byte*>("abc"), 3);
    hasher.Finalize(first);
    hasher.Write(reinterpret_cast<const Byte*>("abc"), 3);
    hasher.Finalize(second);
    EXPECT_EQ(first, second);
}

TEST(SHA256Test, WriteNothing) {
    SHA256 hasher;
    Hash256 hash;
    hasher.Write(nullptr, 0);
    hasher.Finalize(hash);
    EXPECT_EQ(hash, HashString(""));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(SHA256Test, HashOfStreamMatchesHashOfBytes) {
    DataStream ss;
    Serialize(ss, std::string("governance"));
    Serialize(ss, static_cast<uint64_t>(42));

    std::vector<Byte> bytes(ss.data(), ss.data() + ss.size());
    EXPECT_EQ(SHA256Hash(ss), SHA256Hash(bytes));
}

TEST(SHA256Test, NullHash) {
    Hash256 zero{};
    EXPECT_TRUE(IsNullHash(zero));
    EXPECT_FALSE(IsNullHash(HashString("")));
}

TEST(SHA256Test, HashToHexIsLowercase) {
    Hash256 hash{};
    hash[0] = 0xAB;
    hash[31] = 0x0F;
    std::string hex = HashToHex(hash);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(62, 2), "0f");
}

} // namespace test
} // namespace sharegov
