#include "primitives/asset.h"

#include <type_traits>

namespace primitives {

namespace {

constexpr std::string_view TOKEN_PREFIX = "token:";

} // namespace

core::Result<Asset> Asset::parse(std::string_view text) {
    if (text == "native") return Asset::native();

    if (text.starts_with(TOKEN_PREFIX) && text.size() > TOKEN_PREFIX.size()) {
        return Asset::token(std::string(text.substr(TOKEN_PREFIX.size())));
    }
    return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                            "unknown asset '" + std::string(text) +
                                "' (expected native or token:<id>)");
}

const std::string& Asset::token_id() const {
    static const std::string empty;
    if (const auto* t = std::get_if<TokenAsset>(&value_)) {
        return t->token_id;
    }
    return empty;
}

std::string Asset::to_string() const {
    return std::visit(
        [](const auto& alt) -> std::string {
            using T = std::decay_t<decltype(alt)>;
            if constexpr (std::is_same_v<T, NativeAsset>) {
                return "native";
            } else {
                return std::string(TOKEN_PREFIX) + alt.token_id;
            }
        },
        value_);
}

} // namespace primitives
