#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Keccak-256 (SHA3-256) wrapper around OpenSSL 3.0+ EVP API.
//
// Used for the event journal hash chain and for snapshot checksums. The
// "keccak256" naming follows common ledger convention; the underlying
// primitive is NIST SHA3-256 (FIPS 202).
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

// Forward-declare the OpenSSL context type so callers do not need the
// OpenSSL headers just to include this header.
struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

using Hash256 = std::array<uint8_t, 32>;

/// Compute Keccak-256 (SHA3-256) of a byte span.
[[nodiscard]] Hash256 keccak256(std::span<const uint8_t> data);

/// Lower-case hex rendering of a digest.
[[nodiscard]] std::string to_hex(const Hash256& hash);

/// Move-only incremental Keccak-256 hasher backed by an OpenSSL
/// EVP_MD_CTX.  Feed data with write(), obtain the digest with
/// finalize().  OpenSSL failures throw std::runtime_error.
class Keccak256Hasher {
public:
    Keccak256Hasher();
    ~Keccak256Hasher();

    Keccak256Hasher(const Keccak256Hasher&) = delete;
    Keccak256Hasher& operator=(const Keccak256Hasher&) = delete;

    Keccak256Hasher(Keccak256Hasher&& other) noexcept;
    Keccak256Hasher& operator=(Keccak256Hasher&& other) noexcept;

    Keccak256Hasher& write(std::span<const uint8_t> data);

    /// Produce the final digest.  The hasher cannot be written to again.
    [[nodiscard]] Hash256 finalize();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

} // namespace crypto
