// SHAREGOV - In-Memory Database Tests
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <gtest/gtest.h>
#include <sharegov/db/database.h>
#include <sharegov/db/memorydb.h>

#include <string>
#include <vector>

using namespace sharegov;
using namespace sharegov::db;

// ============================================================================
// Basic Operations
// ============================================================================

TEST(MemoryDatabaseTest, PutGetDelete) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("key", "value").ok());

    std::string value;
    ASSERT_TRUE(db.Get("key", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_TRUE(db.Exists("key"));

    ASSERT_TRUE(db.Delete("key").ok());
    EXPECT_TRUE(db.Get("key", &value).IsNotFound());
    EXPECT_FALSE(db.Exists("key"));
}

TEST(MemoryDatabaseTest, BinaryKeys) {
    MemoryDatabase db;
    std::string key("a\0b", 3);
    ASSERT_TRUE(db.Put(key, "x").ok());

    std::string value;
    EXPECT_TRUE(db.Get(key, &value).ok());
    EXPECT_TRUE(db.Get("a", &value).IsNotFound());
}

TEST(MemoryDatabaseTest, WriteBatchIsApplied) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("old", "1").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("old");
    EXPECT_EQ(batch.Count(), 3u);
    ASSERT_TRUE(db.Write(&batch).ok());

    EXPECT_EQ(db.Size(), 2u);
    EXPECT_FALSE(db.Exists("old"));
}

TEST(MemoryDatabaseTest, FailWritesRejectsWholeBatch) {
    MemoryDatabase db;
    db.SetFailWrites(true);

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    Status status = db.Write(&batch);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db.Size(), 0u);
    EXPECT_FALSE(db.Put("c", "3").ok());

    db.SetFailWrites(false);
    EXPECT_TRUE(db.Write(&batch).ok());
    EXPECT_EQ(db.Size(), 2u);
}

// ============================================================================
// Iteration
// ============================================================================

TEST(MemoryDatabaseTest, IteratorVisitsKeysInOrder) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("c", "3").ok());
    ASSERT_TRUE(db.Put("a", "1").ok());
    ASSERT_TRUE(db.Put("b", "2").ok());

    std::vector<std::string> keys;
    auto it = db.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(MemoryDatabaseTest, IteratorSeek) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("P1", "x").ok());
    ASSERT_TRUE(db.Put("V1", "y").ok());
    ASSERT_TRUE(db.Put("V2", "z").ok());

    auto it = db.NewIterator();
    it->Seek("V");
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "V1");
    EXPECT_EQ(it->value().ToString(), "y");
}

TEST(MemoryDatabaseTest, IteratorIsSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("a", "1").ok());
    auto it = db.NewIterator();
    ASSERT_TRUE(db.Put("b", "2").ok());

    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST(MemoryDatabaseTest, ClearAndStats) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("a", "1").ok());
    EXPECT_NE(db.GetStats().find("keys=1"), std::string::npos);

    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

// ============================================================================
// Keys
// ============================================================================

TEST(KeyBuilderTest, IntegersSortNumerically) {
    std::string k1 = KeyBuilder(prefix::PROPOSAL).Add(uint64_t(2)).str();
    std::string k2 = KeyBuilder(prefix::PROPOSAL).Add(uint64_t(256)).str();
    EXPECT_EQ(k1.size(), 9u);
    EXPECT_EQ(k1[0], 'P');
    EXPECT_LT(k1, k2);
}

TEST(KeyBuilderTest, StringsAreLengthPrefixed) {
    std::string k1 = KeyBuilder(prefix::VOTE).Add(std::string("ab")).Add(std::string("c")).str();
    std::string k2 = KeyBuilder(prefix::VOTE).Add(std::string("a")).Add(std::string("bc")).str();
    EXPECT_NE(k1, k2);
}

TEST(KeyBuilderTest, MakeKeyWithName) {
    std::string key = MakeKey(prefix::META, "nextproposal");
    ASSERT_EQ(key.size(), 2u + 12u);
    EXPECT_EQ(key[0], 'M');
    EXPECT_EQ(static_cast<unsigned char>(key[1]), 12u);
    EXPECT_EQ(key.substr(2), "nextproposal");
}

TEST(StatusTest, ToStringNamesCode) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_NE(Status::IOError("disk").ToString().find("disk"), std::string::npos);
}
