// SHAREGOV - SHA256 Hash Function
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL EVP. Used for vote receipts,
// proposal digests and finalized tally commitments.

#ifndef SHAREGOV_CRYPTO_SHA256_H
#define SHAREGOV_CRYPTO_SHA256_H

#include <sharegov/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace sharegov {

class DataStream;

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash into an output digest. The hasher is reset afterwards.
    void Finalize(Hash256& hash);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256 of the unread contents of a stream
Hash256 SHA256Hash(const DataStream& stream);

/// Lowercase hex encoding of a digest
std::string HashToHex(const Hash256& hash);

/// True if every byte of the digest is zero
bool IsNullHash(const Hash256& hash);

} // namespace sharegov

#endif // SHAREGOV_CRYPTO_SHA256_H
