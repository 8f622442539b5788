#include "primitives/amount.h"

#include <charconv>

namespace primitives {

core::Result<Amount> Amount::from_value(int64_t v) {
    if (v < 0 || v > MAX_AMOUNT) {
        return core::make_error(
            core::ErrorCode::AMOUNT_OVERFLOW,
            "Amount out of valid range [0, " +
                std::to_string(MAX_AMOUNT) + "]: " + std::to_string(v));
    }
    return Amount(v);
}

core::Result<Amount> Amount::parse(std::string_view text) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return core::make_error(core::ErrorCode::PARSE_ERROR,
                                "not a base-unit amount: '" +
                                    std::string(text) + "'");
    }
    return from_value(v);
}

core::Result<Amount> Amount::operator+(Amount other) const {
    // Both operands are bounded by MAX_AMOUNT, so the raw sum cannot
    // overflow int64_t; only the range check matters.
    if (!is_valid() || !other.is_valid()) {
        return core::make_error(core::ErrorCode::AMOUNT_OVERFLOW,
                                "Amount addition on out-of-range operand");
    }
    int64_t result = value_ + other.value_;
    if (result > MAX_AMOUNT) {
        return core::make_error(
            core::ErrorCode::AMOUNT_OVERFLOW,
            "Amount addition result exceeds " + std::to_string(MAX_AMOUNT));
    }
    return Amount(result);
}

core::Result<Amount> Amount::operator-(Amount other) const {
    if (!is_valid() || !other.is_valid()) {
        return core::make_error(core::ErrorCode::AMOUNT_OVERFLOW,
                                "Amount subtraction on out-of-range operand");
    }
    if (other.value_ > value_) {
        return core::make_error(
            core::ErrorCode::INSUFFICIENT_FUNDS,
            "Amount subtraction underflows: " + std::to_string(value_) +
                " - " + std::to_string(other.value_));
    }
    return Amount(value_ - other.value_);
}

Amount& Amount::operator+=(Amount other) {
    value_ += other.value_;
    return *this;
}

Amount& Amount::operator-=(Amount other) {
    value_ -= other.value_;
    return *this;
}

} // namespace primitives
