// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/custody.h"

#include "core/logging.h"

namespace campaign {

namespace {

core::Error transfer_failed(std::string message) {
    return core::Error(core::ErrorCode::TRANSFER_FAILED, std::move(message));
}

} // namespace

core::Result<void> InMemoryCustody::pull(const Asset& asset,
                                         const AccountId& from,
                                         Amount amount) {
    std::lock_guard lock(mutex_);
    if (fail_pulls_) {
        return transfer_failed("pull from " + from.str() + " refused");
    }

    const std::string key = asset.to_string();
    Amount& wallet = wallets_[{key, from}];
    if (wallet < amount) {
        return transfer_failed(from.str() + " holds " + wallet.to_string() +
                               " " + key + ", needs " + amount.to_string());
    }
    auto pooled = custody_[key] + amount;
    if (!pooled.ok()) return transfer_failed("custody pool overflow");

    wallet -= amount;
    custody_[key] = pooled.value();
    return core::make_ok();
}

core::Result<void> InMemoryCustody::settle(const SettlementBatch& batch) {
    std::vector<Payout> paid;
    PayoutHook hook;
    {
        std::lock_guard lock(mutex_);
        ++settle_calls_;

        if (failures_pending_ > 0) {
            --failures_pending_;
            return transfer_failed("settlement rejected by substrate");
        }

        // Validate the whole batch before moving anything.
        std::map<std::string, Amount> needed;
        for (const auto& p : batch) {
            if (rejected_.count(p.recipient)) {
                return transfer_failed("recipient " + p.recipient.str() +
                                       " rejected the transfer");
            }
            auto sum = needed[p.asset.to_string()] + p.amount;
            if (!sum.ok()) return transfer_failed("batch total overflow");
            needed[p.asset.to_string()] = sum.value();
        }
        for (const auto& [asset, amount] : needed) {
            if (custody_[asset] < amount) {
                return transfer_failed("custody holds " +
                                       custody_[asset].to_string() + " " +
                                       asset + ", batch needs " +
                                       amount.to_string());
            }
        }

        for (const auto& p : batch) {
            const std::string key = p.asset.to_string();
            custody_[key] -= p.amount;
            wallets_[{key, p.recipient}] += p.amount;
            history_.push_back(p);
            LOG_TRACE(core::LogCategory::TRANSFER, "paid " + describe(p));
        }
        paid = batch;
        hook = hook_;
    }

    if (hook) {
        for (const auto& p : paid) {
            hook(p);
        }
    }
    return core::make_ok();
}

void InMemoryCustody::deposit(const Asset& asset, const AccountId& who,
                              Amount amount) {
    std::lock_guard lock(mutex_);
    wallets_[{asset.to_string(), who}] += amount;
}

Amount InMemoryCustody::wallet_balance(const Asset& asset,
                                       const AccountId& who) const {
    std::lock_guard lock(mutex_);
    auto it = wallets_.find({asset.to_string(), who});
    return it == wallets_.end() ? Amount() : it->second;
}

Amount InMemoryCustody::held(const Asset& asset) const {
    std::lock_guard lock(mutex_);
    auto it = custody_.find(asset.to_string());
    return it == custody_.end() ? Amount() : it->second;
}

void InMemoryCustody::reject_recipient(const AccountId& who, bool reject) {
    std::lock_guard lock(mutex_);
    if (reject) {
        rejected_.insert(who);
    } else {
        rejected_.erase(who);
    }
}

void InMemoryCustody::fail_next_settlements(size_t count) {
    std::lock_guard lock(mutex_);
    failures_pending_ = count;
}

void InMemoryCustody::fail_pulls(bool fail) {
    std::lock_guard lock(mutex_);
    fail_pulls_ = fail;
}

void InMemoryCustody::set_payout_hook(PayoutHook hook) {
    std::lock_guard lock(mutex_);
    hook_ = std::move(hook);
}

std::vector<Payout> InMemoryCustody::history() const {
    std::lock_guard lock(mutex_);
    return history_;
}

size_t InMemoryCustody::settle_calls() const {
    std::lock_guard lock(mutex_);
    return settle_calls_;
}

} // namespace campaign
