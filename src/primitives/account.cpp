#include "primitives/account.h"

namespace primitives {

namespace {

bool is_account_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

} // namespace

bool AccountId::is_valid() const noexcept {
    if (name_.empty() || name_.size() > MAX_LENGTH) return false;
    for (char c : name_) {
        if (!is_account_char(c)) return false;
    }
    return true;
}

core::Result<AccountId> AccountId::from_string(std::string_view name) {
    AccountId id{std::string(name)};
    if (!id.is_valid()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "invalid account id '" + std::string(name) +
                                    "'");
    }
    return id;
}

} // namespace primitives
