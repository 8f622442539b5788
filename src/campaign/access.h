#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/interfaces.h"
#include "core/error.h"

#include <atomic>
#include <mutex>

namespace campaign {

// ---------------------------------------------------------------------------
// OwnerAccessGate -- single platform owner with a pause switch
// ---------------------------------------------------------------------------
class OwnerAccessGate final : public AccessGate {
public:
    explicit OwnerAccessGate(AccountId owner) : owner_(std::move(owner)) {}

    [[nodiscard]] bool is_owner(const AccountId& caller) const override;
    [[nodiscard]] bool is_paused() const override {
        return paused_.load(std::memory_order_acquire);
    }

    /// Owner only; UNAUTHORIZED otherwise.
    core::Result<void> pause(const AccountId& caller);
    core::Result<void> unpause(const AccountId& caller);

    /// Hand platform ownership to @p new_owner.  Owner only.
    core::Result<void> transfer_ownership(const AccountId& caller,
                                         AccountId new_owner);

    [[nodiscard]] AccountId owner() const;

private:
    core::Result<void> require_owner(const AccountId& caller) const;

    mutable std::mutex mutex_;
    AccountId owner_;
    std::atomic<bool> paused_{false};
};

} // namespace campaign
