#pragma once

#include "core/error.h"

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace primitives {

// ---------------------------------------------------------------------------
// AccountId -- identifier of a creator, contributor or platform account
// ---------------------------------------------------------------------------
// 1..64 characters from [a-z0-9._-]. The empty id is the "no account"
// sentinel and is never accepted from callers.
// ---------------------------------------------------------------------------
class AccountId {
public:
    static constexpr size_t MAX_LENGTH = 64;

    AccountId() = default;

    /// Unchecked construction, for literals and already validated input.
    explicit AccountId(std::string name) : name_(std::move(name)) {}

    /// Validating factory.
    static core::Result<AccountId> from_string(std::string_view name);

    [[nodiscard]] const std::string& str() const noexcept { return name_; }
    [[nodiscard]] bool empty() const noexcept { return name_.empty(); }
    [[nodiscard]] bool is_valid() const noexcept;

    bool operator==(const AccountId& o) const = default;
    auto operator<=>(const AccountId& o) const = default;

private:
    std::string name_;
};

} // namespace primitives

template <>
struct std::hash<primitives::AccountId> {
    std::size_t operator()(const primitives::AccountId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};
