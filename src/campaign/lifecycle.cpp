// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/lifecycle.h"

#include "core/logging.h"
#include "core/time.h"

namespace campaign {

namespace {

std::string tag(const Campaign& c) {
    return "campaign " + std::to_string(c.id);
}

} // namespace

// ---------------------------------------------------------------------------
// Guards
// ---------------------------------------------------------------------------

core::Result<void> require_creator(const Campaign& c,
                                   const AccountId& caller) {
    if (caller != c.creator) {
        return core::make_error(core::ErrorCode::UNAUTHORIZED,
                                caller.str() + " is not the creator of " +
                                    tag(c));
    }
    return core::make_ok();
}

core::Result<void> require_not_completed(const Campaign& c) {
    if (c.completed) {
        return core::make_error(core::ErrorCode::CAMPAIGN_CLOSED,
                                tag(c) + (c.cancelled ? " is cancelled"
                                                      : " is already funded"));
    }
    return core::make_ok();
}

core::Result<void> require_open(const Campaign& c, int64_t now) {
    CFUND_TRY_VOID(require_not_completed(c));
    if (now >= c.deadline) {
        return core::make_error(core::ErrorCode::DEADLINE_PASSED,
                                tag(c) + " deadline passed at " +
                                    core::format_iso8601(c.deadline));
    }
    return core::make_ok();
}

core::Result<void> require_funded(const Campaign& c) {
    if (!c.is_funded()) {
        return core::make_error(core::ErrorCode::CAMPAIGN_CLOSED,
                                tag(c) + " has not reached its goal");
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Contribution intake
// ---------------------------------------------------------------------------

core::Result<void> check_contribution_bounds(const Campaign& c,
                                             Amount amount) {
    if (amount.is_zero() || amount < c.min_contribution ||
        amount > c.max_contribution) {
        return core::make_error(
            core::ErrorCode::CONTRIBUTION_OUT_OF_BOUNDS,
            "contribution " + amount.to_string() + " outside [" +
                c.min_contribution.to_string() + ", " +
                c.max_contribution.to_string() + "]");
    }
    return core::make_ok();
}

core::Result<void> record_contribution(Campaign& c,
                                       ContributionLedger& ledger,
                                       const AccountId& who, Amount amount,
                                       UndoLog& undo) {
    // Fail before touching anything if raised would leave the valid range.
    auto total = c.raised + amount;
    if (!total.ok()) return std::move(total).error();

    const bool first = CFUND_TRY(ledger.credit(c.id, who, amount, undo));
    if (first) {
        undo.assign("backer count", c.backer_count, c.backer_count + 1);
    }
    undo.add("raised", c.raised, amount);
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Open -> Funded
// ---------------------------------------------------------------------------

bool goal_reached(const Campaign& c) {
    return !c.completed && c.raised >= c.goal;
}

core::Result<FeeSplit> plan_success_payout(const Campaign& c,
                                           uint32_t fee_bps) {
    const Amount release = CFUND_TRY(c.goal - c.milestone_total());
    if (release > c.custody_balance()) {
        return core::make_error(core::ErrorCode::INSUFFICIENT_FUNDS,
                                tag(c) + " custody cannot cover the payout");
    }
    return split_fee(release, fee_bps);
}

void mark_funded(Campaign& c, const FeeSplit& payout, UndoLog& undo) {
    undo.assign("completed", c.completed, true);
    undo.add("released", c.released, payout.gross);
    undo.add("fees paid", c.fees_paid, payout.fee);
    LOG_DEBUG(core::LogCategory::LIFECYCLE,
              tag(c) + " funded: release " + payout.gross.to_string() +
                  " (fee " + payout.fee.to_string() + ")");
}

// ---------------------------------------------------------------------------
// Open -> Cancelled
// ---------------------------------------------------------------------------

core::Result<void> mark_cancelled(Campaign& c, UndoLog& undo) {
    CFUND_TRY_VOID(require_not_completed(c));
    undo.assign("completed", c.completed, true);
    undo.assign("cancelled", c.cancelled, true);
    LOG_DEBUG(core::LogCategory::LIFECYCLE, tag(c) + " cancelled");
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Goal and deadline
// ---------------------------------------------------------------------------

core::Result<void> modify_goal(Campaign& c, Amount new_goal, int64_t now) {
    CFUND_TRY_VOID(require_open(c, now));
    if (!new_goal.is_valid() || new_goal <= c.raised) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "new goal " + new_goal.to_string() +
                                    " must exceed raised " +
                                    c.raised.to_string());
    }
    if (new_goal < c.milestone_total()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "new goal " + new_goal.to_string() +
                                    " below milestone total " +
                                    c.milestone_total().to_string());
    }
    LOG_DEBUG(core::LogCategory::LIFECYCLE,
              tag(c) + " goal " + c.goal.to_string() + " -> " +
                  new_goal.to_string());
    c.goal = new_goal;
    return core::make_ok();
}

core::Result<int64_t> extend_deadline(Campaign& c, int64_t extra_days,
                                      int64_t max_duration_days) {
    CFUND_TRY_VOID(require_not_completed(c));
    if (extra_days <= 0 || extra_days > 2 * max_duration_days) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "invalid extension of " +
                                    std::to_string(extra_days) + " days");
    }
    const int64_t deadline = c.deadline + extra_days * core::SECONDS_PER_DAY;
    const int64_t cap = 2 * max_duration_days * core::SECONDS_PER_DAY;
    if (deadline - c.created_at > cap) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                tag(c) + " total duration would exceed " +
                                    std::to_string(2 * max_duration_days) +
                                    " days");
    }
    c.deadline = deadline;
    LOG_DEBUG(core::LogCategory::LIFECYCLE,
              tag(c) + " deadline extended to " +
                  core::format_iso8601(deadline));
    return deadline;
}

} // namespace campaign
