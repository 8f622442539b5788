#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/fees.h"
#include "campaign/types.h"
#include "campaign/undo.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace campaign {

// ---------------------------------------------------------------------------
// Withdrawal policy
// ---------------------------------------------------------------------------

/// Replace the partial-withdrawal rules of a campaign that is not yet
/// completed.  A nonzero ceiling below the amount already withdrawn is
/// rejected.
core::Result<void> configure_withdrawals(Campaign& c,
                                         const WithdrawalSettings& settings);

/// Creator draws @p amount from raised before the campaign completes.
/// Checks, in order: not completed, partial withdrawals enabled,
/// 0 < amount <= raised, interval since the previous withdrawal (the first
/// one is always allowed), ceiling.
core::Result<FeeSplit> withdraw_partial(Campaign& c, Amount amount,
                                        int64_t now, uint32_t fee_bps,
                                        UndoLog& undo);

/// Funded only.  Takes raised - goal out of raised; NO_EXCESS when zero.
core::Result<FeeSplit> withdraw_surplus(Campaign& c, uint32_t fee_bps,
                                        UndoLog& undo);

// ---------------------------------------------------------------------------
// Milestones
// ---------------------------------------------------------------------------

/// Declare a milestone before completion.  The milestone total may not
/// exceed the goal.  Returns the new milestone's index.
core::Result<size_t> add_milestone(Campaign& c, Amount amount,
                                   std::string description,
                                   size_t max_milestones);

/// Funded only.  Each milestone completes once, in any order; the release
/// counts against the withdrawal ceiling and must be covered by custody.
core::Result<FeeSplit> complete_milestone(Campaign& c, size_t index,
                                          uint32_t fee_bps, UndoLog& undo);

} // namespace campaign
