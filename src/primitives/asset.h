#pragma once

#include "core/error.h"

#include <string>
#include <string_view>
#include <variant>

namespace primitives {

/// The platform's native currency.
struct NativeAsset {
    bool operator==(const NativeAsset&) const = default;
};

/// A fungible token identified by its contract / symbol id.
struct TokenAsset {
    std::string token_id;

    bool operator==(const TokenAsset&) const = default;
};

// ---------------------------------------------------------------------------
// Asset -- funding asset selector {Native, Token(id)}
// ---------------------------------------------------------------------------
// A campaign holds exactly one Asset. The engine never branches on the
// alternative when moving value; it hands the selector to the transfer
// collaborator. Only contribution intake asks is_token() to decide whether
// a pull is required.
// ---------------------------------------------------------------------------
class Asset {
public:
    Asset() = default;
    Asset(NativeAsset n) : value_(n) {}                    // NOLINT implicit
    Asset(TokenAsset t) : value_(std::move(t)) {}          // NOLINT implicit

    static Asset native() { return Asset(NativeAsset{}); }
    static Asset token(std::string id) { return Asset(TokenAsset{std::move(id)}); }

    /// Parses "native" or "token:<id>".
    static core::Result<Asset> parse(std::string_view text);

    [[nodiscard]] bool is_native() const noexcept {
        return std::holds_alternative<NativeAsset>(value_);
    }
    [[nodiscard]] bool is_token() const noexcept { return !is_native(); }

    /// Token id, or the empty string for the native asset.
    [[nodiscard]] const std::string& token_id() const;

    /// "native" or "token:<id>", accepted back by parse().
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Asset&) const = default;

private:
    std::variant<NativeAsset, TokenAsset> value_;
};

} // namespace primitives
