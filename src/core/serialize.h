#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace core {

/// Maximum byte length for a deserialized string (1 MiB).
inline constexpr size_t MAX_STRING_LENGTH = 1u << 20;

/// Maximum element count accepted by ser_read_count (16 Mi elements).
inline constexpr uint64_t MAX_SERIALIZED_COUNT = 1u << 24;

// ===================================================================
// Primitive serializers -- little-endian wire format
// ===================================================================

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 4));
}

template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

template <typename Stream>
inline void ser_write_i64(Stream& s, int64_t v) {
    ser_write_u64(s, static_cast<uint64_t>(v));
}

template <typename Stream>
inline void ser_write_bool(Stream& s, bool v) {
    ser_write_u8(s, v ? 1 : 0);
}

/// Length-prefixed (u32) raw bytes.
template <typename Stream>
void ser_write_string(Stream& s, std::string_view str) {
    ser_write_u32(s, static_cast<uint32_t>(str.size()));
    if (!str.empty()) {
        s.write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(str.data()), str.size()));
    }
}

// ===================================================================
// Primitive deserializers
// ===================================================================

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) {
    uint8_t v{};
    s.read(std::span<uint8_t>(&v, 1));
    return v;
}

template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) {
    uint8_t buf[4];
    s.read(std::span<uint8_t>(buf, 4));
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <typename Stream>
inline uint64_t ser_read_u64(Stream& s) {
    uint8_t buf[8];
    s.read(std::span<uint8_t>(buf, 8));
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <typename Stream>
inline int64_t ser_read_i64(Stream& s) {
    return static_cast<int64_t>(ser_read_u64(s));
}

template <typename Stream>
inline bool ser_read_bool(Stream& s) {
    uint8_t v = ser_read_u8(s);
    if (v > 1) {
        throw std::runtime_error("ser_read_bool(): invalid boolean value");
    }
    return v != 0;
}

template <typename Stream>
std::string ser_read_string(Stream& s) {
    uint32_t len = ser_read_u32(s);
    if (len > MAX_STRING_LENGTH) {
        throw std::runtime_error(
            "ser_read_string(): string exceeds MAX_STRING_LENGTH");
    }
    std::string result(static_cast<size_t>(len), '\0');
    if (len > 0) {
        s.read(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(result.data()), len));
    }
    return result;
}

/// Element count prefix for a following sequence, bounded by
/// MAX_SERIALIZED_COUNT.
template <typename Stream>
uint64_t ser_read_count(Stream& s) {
    uint64_t n = ser_read_u64(s);
    if (n > MAX_SERIALIZED_COUNT) {
        throw std::runtime_error("ser_read_count(): count too large");
    }
    return n;
}

}  // namespace core
