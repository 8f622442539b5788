// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/access.h"

#include "core/logging.h"

namespace campaign {

bool OwnerAccessGate::is_owner(const AccountId& caller) const {
    std::lock_guard lock(mutex_);
    return !owner_.empty() && caller == owner_;
}

core::Result<void> OwnerAccessGate::require_owner(
    const AccountId& caller) const {
    if (!is_owner(caller)) {
        return core::make_error(core::ErrorCode::UNAUTHORIZED,
                                caller.str() + " is not the platform owner");
    }
    return core::make_ok();
}

core::Result<void> OwnerAccessGate::pause(const AccountId& caller) {
    CFUND_TRY_VOID(require_owner(caller));
    paused_.store(true, std::memory_order_release);
    LOG_WARN(core::LogCategory::CONFIG, "platform paused by " + caller.str());
    return core::make_ok();
}

core::Result<void> OwnerAccessGate::unpause(const AccountId& caller) {
    CFUND_TRY_VOID(require_owner(caller));
    paused_.store(false, std::memory_order_release);
    LOG_INFO(core::LogCategory::CONFIG,
             "platform unpaused by " + caller.str());
    return core::make_ok();
}

core::Result<void> OwnerAccessGate::transfer_ownership(
    const AccountId& caller, AccountId new_owner) {
    CFUND_TRY_VOID(require_owner(caller));
    if (!new_owner.is_valid()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "invalid platform owner account");
    }
    std::lock_guard lock(mutex_);
    LOG_INFO(core::LogCategory::CONFIG,
             "platform ownership " + owner_.str() + " -> " + new_owner.str());
    owner_ = std::move(new_owner);
    return core::make_ok();
}

AccountId OwnerAccessGate::owner() const {
    std::lock_guard lock(mutex_);
    return owner_;
}

} // namespace campaign
