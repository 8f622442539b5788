#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/fees.h"
#include "campaign/ledger.h"
#include "campaign/types.h"
#include "campaign/undo.h"
#include "core/error.h"

#include <cstdint>

namespace campaign {

// ---------------------------------------------------------------------------
// Guards
// ---------------------------------------------------------------------------

/// UNAUTHORIZED unless @p caller is the campaign's creator.
[[nodiscard]] core::Result<void> require_creator(const Campaign& c,
                                                 const AccountId& caller);

/// CAMPAIGN_CLOSED once the campaign is funded or cancelled.
[[nodiscard]] core::Result<void> require_not_completed(const Campaign& c);

/// Open = not completed and deadline not passed.
/// CAMPAIGN_CLOSED or DEADLINE_PASSED otherwise.
[[nodiscard]] core::Result<void> require_open(const Campaign& c,
                                              int64_t now);

/// CAMPAIGN_CLOSED unless the campaign reached its goal.
[[nodiscard]] core::Result<void> require_funded(const Campaign& c);

// ---------------------------------------------------------------------------
// Contribution intake
// ---------------------------------------------------------------------------

/// CONTRIBUTION_OUT_OF_BOUNDS unless min <= amount <= max and amount > 0.
[[nodiscard]] core::Result<void> check_contribution_bounds(const Campaign& c,
                                                           Amount amount);

/// Credit @p who in the ledger and add @p amount to raised.  The first
/// credit of an account increments the backer count.
core::Result<void> record_contribution(Campaign& c,
                                       ContributionLedger& ledger,
                                       const AccountId& who, Amount amount,
                                       UndoLog& undo);

// ---------------------------------------------------------------------------
// Open -> Funded
// ---------------------------------------------------------------------------

[[nodiscard]] bool goal_reached(const Campaign& c);

/// The success payout releases the goal portion not reserved by
/// milestones.  Surplus above the goal and milestone reservations stay in
/// custody for withdraw_surplus() and complete_milestone().
[[nodiscard]] core::Result<FeeSplit> plan_success_payout(const Campaign& c,
                                                         uint32_t fee_bps);

/// Set the completion flag and account the released payout.
void mark_funded(Campaign& c, const FeeSplit& payout, UndoLog& undo);

// ---------------------------------------------------------------------------
// Open -> Cancelled
// ---------------------------------------------------------------------------

/// CAMPAIGN_CLOSED if already funded or cancelled; otherwise sets the
/// completion and cancelled flags.
core::Result<void> mark_cancelled(Campaign& c, UndoLog& undo);

// ---------------------------------------------------------------------------
// Goal and deadline
// ---------------------------------------------------------------------------

/// Open only; the new goal must exceed raised and cover all milestones.
core::Result<void> modify_goal(Campaign& c, Amount new_goal, int64_t now);

/// Not completed; total duration from creation is capped at twice
/// @p max_duration_days.  Returns the new deadline.
core::Result<int64_t> extend_deadline(Campaign& c, int64_t extra_days,
                                      int64_t max_duration_days);

} // namespace campaign
