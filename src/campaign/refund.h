#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/ledger.h"
#include "campaign/types.h"
#include "campaign/undo.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace campaign {

/// Set the refundable flag.  CAMPAIGN_CLOSED once completed.
/// @returns true when the flag was newly set, false if already enabled.
core::Result<bool> enable_refunds(Campaign& c);

/// Zero @p who's record and take the refund out of raised.
/// The refunded amount is min(record, raised): partial withdrawals may have
/// left raised below the sum of the records.
/// REFUNDS_UNAVAILABLE unless refundable and not completed;
/// NO_CONTRIBUTION when the record is zero.
core::Result<Amount> take_refund(Campaign& c, ContributionLedger& ledger,
                                 const AccountId& who, UndoLog& undo);

struct SweepEntry {
    AccountId contributor;
    Amount amount;
};

struct SweepBatch {
    std::vector<SweepEntry> refunds;  // nonzero refunds only
    uint64_t processed = 0;           // roster entries visited
    uint64_t remaining = 0;           // roster entries still to visit
};

/// Advance the cancellation sweep of @p c by up to @p max_entries roster
/// entries (0 = all remaining), zeroing each record and decrementing raised.
/// REFUNDS_UNAVAILABLE unless the campaign is cancelled.
core::Result<SweepBatch> sweep_refunds(Campaign& c,
                                       ContributionLedger& ledger,
                                       size_t max_entries, UndoLog& undo);

/// Roster entries of a cancelled campaign not yet visited by the sweep.
[[nodiscard]] uint64_t sweep_remaining(const Campaign& c,
                                       const ContributionLedger& ledger);

} // namespace campaign
