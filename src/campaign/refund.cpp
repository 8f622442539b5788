// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/refund.h"

#include "campaign/lifecycle.h"
#include "core/logging.h"

#include <algorithm>

namespace campaign {

core::Result<bool> enable_refunds(Campaign& c) {
    CFUND_TRY_VOID(require_not_completed(c));
    if (c.refundable) return false;
    c.refundable = true;
    return true;
}

core::Result<Amount> take_refund(Campaign& c, ContributionLedger& ledger,
                                 const AccountId& who, UndoLog& undo) {
    if (!c.refundable || c.completed) {
        return core::make_error(core::ErrorCode::REFUNDS_UNAVAILABLE,
                                "refunds are not enabled for campaign " +
                                    std::to_string(c.id));
    }
    const Amount record = ledger.contribution_of(c.id, who);
    if (record.is_zero()) {
        return core::make_error(core::ErrorCode::NO_CONTRIBUTION,
                                who.str() + " has nothing to refund in "
                                "campaign " + std::to_string(c.id));
    }

    ledger.clear(c.id, who, undo);
    const Amount amount = primitives::min(record, c.raised);
    undo.subtract("raised", c.raised, amount);

    LOG_DEBUG(core::LogCategory::REFUND,
              "campaign " + std::to_string(c.id) + ": refund " +
                  amount.to_string() + " to " + who.str());
    return amount;
}

core::Result<SweepBatch> sweep_refunds(Campaign& c,
                                       ContributionLedger& ledger,
                                       size_t max_entries, UndoLog& undo) {
    if (!c.cancelled) {
        return core::make_error(core::ErrorCode::REFUNDS_UNAVAILABLE,
                                "campaign " + std::to_string(c.id) +
                                    " is not cancelled");
    }

    const auto& roster = ledger.roster(c.id);
    const uint64_t size = roster.size();
    const uint64_t start = std::min<uint64_t>(c.sweep_cursor, size);
    uint64_t end = size;
    if (max_entries != 0) {
        end = start + std::min<uint64_t>(max_entries, size - start);
    }

    SweepBatch batch;
    for (uint64_t i = start; i < end; ++i) {
        // Copy: the roster is owned by the ledger we are mutating.
        const AccountId who = roster[i];
        const Amount record = ledger.clear(c.id, who, undo);
        if (record.is_zero()) continue;

        const Amount amount = primitives::min(record, c.raised);
        undo.subtract("raised", c.raised, amount);
        if (!amount.is_zero()) {
            batch.refunds.push_back(SweepEntry{who, amount});
        }
    }
    undo.assign("sweep cursor", c.sweep_cursor, end);

    batch.processed = end - start;
    batch.remaining = size - end;
    LOG_DEBUG(core::LogCategory::REFUND,
              "campaign " + std::to_string(c.id) + " sweep visited " +
                  std::to_string(batch.processed) + " entries, " +
                  std::to_string(batch.remaining) + " remaining");
    return batch;
}

uint64_t sweep_remaining(const Campaign& c,
                         const ContributionLedger& ledger) {
    const uint64_t size = ledger.roster(c.id).size();
    return c.sweep_cursor >= size ? 0 : size - c.sweep_cursor;
}

} // namespace campaign
