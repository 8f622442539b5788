#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/interfaces.h"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace campaign {

// ---------------------------------------------------------------------------
// InMemoryCustody -- reference TransferGateway
// ---------------------------------------------------------------------------
// Keeps external account balances ("wallets") and the engine's custody pool
// per asset.  pull() moves value from a wallet into custody; settle() moves
// a whole batch out of custody or fails without moving anything.
//
// For tests and the scenario runner it can reject chosen recipients, fail a
// number of upcoming settlements, and run a hook for every paid-out element
// once a batch has been applied.  The hook runs without the custody lock
// held, so it may call back into the engine.
// ---------------------------------------------------------------------------
class InMemoryCustody final : public TransferGateway {
public:
    using PayoutHook = std::function<void(const Payout&)>;

    InMemoryCustody() = default;

    // -- TransferGateway ----------------------------------------------------

    core::Result<void> pull(const Asset& asset, const AccountId& from,
                            Amount amount) override;

    core::Result<void> settle(const SettlementBatch& batch) override;

    // -- Wallets ------------------------------------------------------------

    /// Credit an external account, e.g. to fund a contributor.
    void deposit(const Asset& asset, const AccountId& who, Amount amount);

    [[nodiscard]] Amount wallet_balance(const Asset& asset,
                                        const AccountId& who) const;

    /// Value of @p asset currently held in custody.
    [[nodiscard]] Amount held(const Asset& asset) const;

    // -- Failure injection --------------------------------------------------

    /// Payouts to @p who fail the whole batch while rejected.
    void reject_recipient(const AccountId& who, bool reject = true);

    /// The next @p count calls to settle() fail.
    void fail_next_settlements(size_t count);

    /// Every pull fails while set.
    void fail_pulls(bool fail);

    void set_payout_hook(PayoutHook hook);

    // -- History ------------------------------------------------------------

    /// Every payout of every successful batch, in order.
    [[nodiscard]] std::vector<Payout> history() const;

    [[nodiscard]] size_t settle_calls() const;

private:
    using WalletKey = std::pair<std::string, AccountId>;

    mutable std::mutex mutex_;
    std::map<WalletKey, Amount> wallets_;
    std::map<std::string, Amount> custody_;
    std::set<AccountId> rejected_;
    size_t failures_pending_ = 0;
    bool fail_pulls_ = false;
    PayoutHook hook_;
    std::vector<Payout> history_;
    size_t settle_calls_ = 0;
};

} // namespace campaign
