#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/types.h"
#include "campaign/undo.h"
#include "core/error.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace campaign {

// ---------------------------------------------------------------------------
// ContributionLedger -- (campaign, contributor) -> amount plus roster
// ---------------------------------------------------------------------------
// Each campaign has a book holding the cumulative record of every account
// that ever contributed and the roster: the distinct contributors in order
// of their first credit.  The roster never shrinks; a refunded account keeps
// its roster slot with a zero record and is not appended again if it
// contributes a second time.
//
// Every mutator records its inverse in the caller's UndoLog.
// ---------------------------------------------------------------------------
class ContributionLedger {
public:
    struct Book {
        std::unordered_map<AccountId, Amount> records;
        std::vector<AccountId> roster;
    };

    ContributionLedger() = default;

    /// Add @p amount to @p who's record in campaign @p id.
    /// @returns true when @p who was appended to the roster by this credit.
    core::Result<bool> credit(CampaignId id, const AccountId& who,
                              Amount amount, UndoLog& undo);

    /// Zero @p who's record and return the previous value.
    Amount clear(CampaignId id, const AccountId& who, UndoLog& undo);

    /// Current record; zero when absent.
    [[nodiscard]] Amount contribution_of(CampaignId id,
                                         const AccountId& who) const;

    /// Distinct contributors in first-credit order.
    [[nodiscard]] const std::vector<AccountId>& roster(CampaignId id) const;

    /// Sum of all current records of campaign @p id.
    [[nodiscard]] Amount total(CampaignId id) const;

    [[nodiscard]] const std::unordered_map<CampaignId, Book>& books() const {
        return books_;
    }

    /// Replace all books, used when loading a snapshot.
    void restore(std::unordered_map<CampaignId, Book> books);

private:
    std::unordered_map<CampaignId, Book> books_;
};

} // namespace campaign
