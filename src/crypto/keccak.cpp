// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

Hash256 keccak256(std::span<const uint8_t> data) {
    Keccak256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

std::string to_hex(const Hash256& hash) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (uint8_t b : hash) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

// ===================================================================
// Keccak256Hasher
// ===================================================================

Keccak256Hasher::Keccak256Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_MD_CTX_new() allocation failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error(
            "Keccak256Hasher: EVP_DigestInit_ex() failed");
    }
}

Keccak256Hasher::~Keccak256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Keccak256Hasher::Keccak256Hasher(Keccak256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Keccak256Hasher& Keccak256Hasher::operator=(
    Keccak256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Keccak256Hasher& Keccak256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

Hash256 Keccak256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): context not initialised "
            "or already finalised");
    }

    Hash256 out{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &digest_len) != 1 ||
        digest_len != out.size()) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return out;
}

} // namespace crypto
