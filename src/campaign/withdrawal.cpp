// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/withdrawal.h"

#include "campaign/lifecycle.h"
#include "core/logging.h"

namespace campaign {

namespace {

core::Result<void> check_ceiling(const Campaign& c, Amount amount) {
    if (!c.withdrawal.ceiling_enabled) return core::make_ok();

    auto total = c.withdrawal.total_withdrawn + amount;
    if (!total.ok() || total.value() > c.withdrawal.ceiling) {
        return core::make_error(
            core::ErrorCode::WITHDRAWAL_LIMIT_EXCEEDED,
            "withdrawing " + amount.to_string() + " would exceed the " +
                c.withdrawal.ceiling.to_string() + " ceiling (" +
                c.withdrawal.total_withdrawn.to_string() + " withdrawn)");
    }
    return core::make_ok();
}

} // namespace

// ---------------------------------------------------------------------------
// Withdrawal policy
// ---------------------------------------------------------------------------

core::Result<void> configure_withdrawals(Campaign& c,
                                         const WithdrawalSettings& settings) {
    CFUND_TRY_VOID(require_not_completed(c));
    if (!settings.ceiling.is_valid() || settings.min_interval < 0) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "invalid withdrawal settings");
    }
    if (!settings.ceiling.is_zero() &&
        settings.ceiling < c.withdrawal.total_withdrawn) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "ceiling " + settings.ceiling.to_string() +
                                    " below amount already withdrawn");
    }

    c.withdrawal.partial_enabled = settings.partial_enabled;
    c.withdrawal.ceiling_enabled = !settings.ceiling.is_zero();
    c.withdrawal.ceiling = settings.ceiling;
    c.withdrawal.min_interval = settings.min_interval;
    return core::make_ok();
}

core::Result<FeeSplit> withdraw_partial(Campaign& c, Amount amount,
                                        int64_t now, uint32_t fee_bps,
                                        UndoLog& undo) {
    CFUND_TRY_VOID(require_not_completed(c));
    if (!c.withdrawal.partial_enabled) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "partial withdrawals are disabled for "
                                "campaign " + std::to_string(c.id));
    }
    if (!amount.is_valid() || amount.is_zero()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "withdrawal amount must be positive");
    }
    if (amount > c.raised) {
        return core::make_error(core::ErrorCode::INSUFFICIENT_FUNDS,
                                "withdrawal " + amount.to_string() +
                                    " exceeds raised " +
                                    c.raised.to_string());
    }
    const int64_t last = c.withdrawal.last_withdrawal_time;
    if (last != 0 && now < last + c.withdrawal.min_interval) {
        return core::make_error(
            core::ErrorCode::INTERVAL_NOT_ELAPSED,
            "next withdrawal allowed in " +
                std::to_string(last + c.withdrawal.min_interval - now) + "s");
    }
    CFUND_TRY_VOID(check_ceiling(c, amount));

    FeeSplit split = CFUND_TRY(split_fee(amount, fee_bps));

    undo.subtract("raised", c.raised, amount);
    undo.add("withdrawn", c.withdrawal.total_withdrawn, amount);
    undo.assign("last withdrawal", c.withdrawal.last_withdrawal_time, now);
    undo.add("fees paid", c.fees_paid, split.fee);

    LOG_DEBUG(core::LogCategory::WITHDRAW,
              "campaign " + std::to_string(c.id) + " partial withdrawal " +
                  amount.to_string());
    return split;
}

core::Result<FeeSplit> withdraw_surplus(Campaign& c, uint32_t fee_bps,
                                        UndoLog& undo) {
    CFUND_TRY_VOID(require_funded(c));
    if (c.raised <= c.goal) {
        return core::make_error(core::ErrorCode::NO_EXCESS,
                                "campaign " + std::to_string(c.id) +
                                    " raised no more than its goal");
    }
    const Amount excess(c.raised.value() - c.goal.value());
    if (excess > c.custody_balance()) {
        return core::make_error(core::ErrorCode::INSUFFICIENT_FUNDS,
                                "custody cannot cover surplus of campaign " +
                                    std::to_string(c.id));
    }

    FeeSplit split = CFUND_TRY(split_fee(excess, fee_bps));

    undo.subtract("raised", c.raised, excess);
    undo.add("fees paid", c.fees_paid, split.fee);

    LOG_DEBUG(core::LogCategory::WITHDRAW,
              "campaign " + std::to_string(c.id) + " surplus " +
                  excess.to_string());
    return split;
}

// ---------------------------------------------------------------------------
// Milestones
// ---------------------------------------------------------------------------

core::Result<size_t> add_milestone(Campaign& c, Amount amount,
                                   std::string description,
                                   size_t max_milestones) {
    CFUND_TRY_VOID(require_not_completed(c));
    if (!amount.is_valid() || amount.is_zero()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "milestone amount must be positive");
    }
    if (description.empty()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "milestone description must not be empty");
    }
    if (c.milestones.size() >= max_milestones) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "campaign " + std::to_string(c.id) +
                                    " already has " +
                                    std::to_string(max_milestones) +
                                    " milestones");
    }
    auto total = c.milestone_total() + amount;
    if (!total.ok() || total.value() > c.goal) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "milestones would exceed the goal of " +
                                    c.goal.to_string());
    }

    c.milestones.push_back(Milestone{amount, std::move(description), false});
    return c.milestones.size() - 1;
}

core::Result<FeeSplit> complete_milestone(Campaign& c, size_t index,
                                          uint32_t fee_bps, UndoLog& undo) {
    CFUND_TRY_VOID(require_funded(c));
    if (index >= c.milestones.size()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "no milestone " + std::to_string(index) +
                                    " in campaign " + std::to_string(c.id));
    }
    Milestone& m = c.milestones[index];
    if (m.completed) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "milestone " + std::to_string(index) +
                                    " already completed");
    }
    CFUND_TRY_VOID(check_ceiling(c, m.amount));
    if (m.amount > c.custody_balance()) {
        return core::make_error(core::ErrorCode::INSUFFICIENT_FUNDS,
                                "custody cannot cover milestone " +
                                    std::to_string(index));
    }

    FeeSplit split = CFUND_TRY(split_fee(m.amount, fee_bps));

    undo.assign("milestone completed", m.completed, true);
    undo.add("released", c.released, m.amount);
    undo.add("withdrawn", c.withdrawal.total_withdrawn, m.amount);
    undo.add("fees paid", c.fees_paid, split.fee);

    LOG_DEBUG(core::LogCategory::WITHDRAW,
              "campaign " + std::to_string(c.id) + " milestone " +
                  std::to_string(index) + " released " +
                  m.amount.to_string());
    return split;
}

} // namespace campaign
