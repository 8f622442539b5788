#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the cfund stack
enum class ErrorCode : uint16_t {
    NONE                      = 0,
    // Parsing / serialization (100-199)
    PARSE_ERROR               = 100, PARSE_OVERFLOW   = 101,
    PARSE_BAD_FORMAT          = 102,
    // Argument validation (200-299)
    INVALID_PARAMETERS        = 200, AMOUNT_OVERFLOW  = 201,
    CONTRIBUTION_OUT_OF_BOUNDS = 202,
    // Campaign state (300-399)
    CAMPAIGN_NOT_FOUND        = 300, CAMPAIGN_CLOSED     = 301,
    DEADLINE_PASSED           = 302, REFUNDS_UNAVAILABLE = 303,
    NO_CONTRIBUTION           = 304, NO_EXCESS           = 305,
    // Withdrawals (400-499)
    WITHDRAWAL_LIMIT_EXCEEDED = 400, INTERVAL_NOT_ELAPSED = 401,
    INSUFFICIENT_FUNDS        = 402,
    // Access control (500-599)
    UNAUTHORIZED              = 500, PAUSED = 501,
    // Value transfer (600-699)
    TRANSFER_FAILED           = 600,
    // Storage (700-799)
    STORAGE_ERROR             = 700, STORAGE_NOT_FOUND = 701,
    STORAGE_CORRUPT           = 702,
    // Cryptography (800-899)
    CRYPTO_ERROR              = 800,
    // Internal (900-999)
    INTERNAL_ERROR            = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

    /// Error code, or NONE when the result holds a value.
    [[nodiscard]] ErrorCode code() const noexcept {
        return ok() ? ErrorCode::NONE : std::get<E>(storage_).code();
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] ErrorCode code() const noexcept {
        return ok() ? ErrorCode::NONE : std::get<E>(storage_).code();
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// CFUND_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = CFUND_TRY(some_result_expr);
#define CFUND_TRY(expr)                                                   \
    ({                                                                    \
        auto&& _cf_res = (expr);                                          \
        if (!_cf_res.ok()) return std::move(_cf_res).error();             \
        std::move(_cf_res).value();                                       \
    })

// CFUND_TRY_VOID: propagate errors from Result<void> expressions
#define CFUND_TRY_VOID(expr)                                              \
    do {                                                                  \
        auto _cf_tmp = (expr);                                            \
        if (!_cf_tmp.ok()) return std::move(_cf_tmp).error();             \
    } while (false)

} // namespace core
