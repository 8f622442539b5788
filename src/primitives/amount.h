#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/error.h"
#include "core/serialize.h"

namespace primitives {

/// A quantity of the funding asset in indivisible base units.
class Amount {
    int64_t value_ = 0;

public:
    /// Upper bound for any single amount or running total, leaving headroom
    /// so that the sum of two valid amounts never overflows int64_t.
    static constexpr int64_t MAX_AMOUNT = 1'000'000'000'000'000'000;

    constexpr Amount() = default;

    /// Construct from a raw base-unit value. No validation is performed;
    /// prefer from_value() when the source is untrusted.
    constexpr explicit Amount(int64_t v) : value_(v) {}

    /// Construct an Amount after validating that v is within [0, MAX_AMOUNT].
    static core::Result<Amount> from_value(int64_t v);

    /// Parse a decimal base-unit string ("1500").
    static core::Result<Amount> parse(std::string_view text);

    [[nodiscard]] int64_t value() const { return value_; }

    /// Checked addition. Returns AMOUNT_OVERFLOW if the result leaves the
    /// valid range.
    [[nodiscard]] core::Result<Amount> operator+(Amount other) const;

    /// Checked subtraction. Returns INSUFFICIENT_FUNDS if the result would
    /// be negative.
    [[nodiscard]] core::Result<Amount> operator-(Amount other) const;

    /// In-place arithmetic for callers that already proved the result is
    /// in range (undo replays, pre-validated totals).
    Amount& operator+=(Amount other);
    Amount& operator-=(Amount other);

    bool operator==(Amount o) const { return value_ == o.value_; }
    auto operator<=>(Amount o) const { return value_ <=> o.value_; }

    [[nodiscard]] bool is_zero() const { return value_ == 0; }

    [[nodiscard]] bool is_valid() const {
        return value_ >= 0 && value_ <= MAX_AMOUNT;
    }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(value_);
    }

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_i64(s, value_);
    }

    template<typename Stream>
    static Amount deserialize(Stream& s) {
        return Amount(core::ser_read_i64(s));
    }
};

inline constexpr Amount ZERO_AMOUNT{0};

/// Returns the smaller of two amounts.
[[nodiscard]] inline Amount min(Amount a, Amount b) {
    return a < b ? a : b;
}

} // namespace primitives
