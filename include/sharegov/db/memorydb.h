// SHAREGOV - In-Memory Database
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Ordered in-memory implementation of the Database interface. Backs
// ephemeral engines and tests; supports fault injection so callers can
// exercise their rollback paths.

#ifndef SHAREGOV_DB_MEMORYDB_H
#define SHAREGOV_DB_MEMORYDB_H

#include <sharegov/db/database.h>

#include <map>
#include <mutex>

namespace sharegov {
namespace db {

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetStats() const override;

    size_t Size() const;
    void Clear();

    /// Make every subsequent write fail with IOError until cleared
    void SetFailWrites(bool fail);

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    bool failWrites_{false};
    uint64_t writeCount_{0};
};

} // namespace db
} // namespace sharegov

#endif // SHAREGOV_DB_MEMORYDB_H
