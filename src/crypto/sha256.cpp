// SHAREGOV - SHA256 Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/crypto/sha256.h>
#include <sharegov/core/serialize.h>

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace sharegov {

// ============================================================================
// SHA256 Implementation
// ============================================================================

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Hash256& hash) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash.data(), &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
    Reset();
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result{};
    SHA256 hasher;
    hasher.Write(data, len).Finalize(result);
    return result;
}

Hash256 SHA256Hash(const DataStream& stream) {
    return SHA256Hash(stream.data(), stream.size());
}

std::string HashToHex(const Hash256& hash) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (Byte b : hash) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

bool IsNullHash(const Hash256& hash) {
    return std::all_of(hash.begin(), hash.end(), [](Byte b) { return b == 0; });
}

} // namespace sharegov
