// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/ledger.h"

#include "core/logging.h"

#include <algorithm>
#include <iterator>

namespace campaign {

core::Result<bool> ContributionLedger::credit(CampaignId id,
                                              const AccountId& who,
                                              Amount amount, UndoLog& undo) {
    Book& book = books_[id];

    auto it = book.records.find(who);
    const bool first = (it == book.records.end());
    const Amount previous = first ? Amount() : it->second;
    const Amount updated = CFUND_TRY(previous + amount);

    if (first) {
        book.records.emplace(who, updated);
        book.roster.push_back(who);
    } else {
        it->second = updated;
    }

    undo.record("ledger credit " + who.str(),
                [this, id, who, amount, first] {
                    Book& b = books_[id];
                    if (first) {
                        b.records.erase(who);
                        auto pos = std::find(b.roster.rbegin(),
                                             b.roster.rend(), who);
                        if (pos != b.roster.rend()) {
                            b.roster.erase(std::next(pos).base());
                        }
                    } else {
                        b.records[who] -= amount;
                    }
                });

    LOG_TRACE(core::LogCategory::LEDGER,
              "campaign " + std::to_string(id) + ": " + who.str() +
                  " record " + previous.to_string() + " -> " +
                  updated.to_string());
    return first;
}

Amount ContributionLedger::clear(CampaignId id, const AccountId& who,
                                 UndoLog& undo) {
    auto bit = books_.find(id);
    if (bit == books_.end()) return Amount();

    auto it = bit->second.records.find(who);
    if (it == bit->second.records.end() || it->second.is_zero()) {
        return Amount();
    }

    const Amount previous = it->second;
    it->second = Amount();

    undo.record("ledger clear " + who.str(), [this, id, who, previous] {
        books_[id].records[who] += previous;
    });
    return previous;
}

Amount ContributionLedger::contribution_of(CampaignId id,
                                           const AccountId& who) const {
    auto bit = books_.find(id);
    if (bit == books_.end()) return Amount();
    auto it = bit->second.records.find(who);
    return it == bit->second.records.end() ? Amount() : it->second;
}

const std::vector<AccountId>& ContributionLedger::roster(
    CampaignId id) const {
    static const std::vector<AccountId> empty;
    auto it = books_.find(id);
    return it == books_.end() ? empty : it->second.roster;
}

Amount ContributionLedger::total(CampaignId id) const {
    Amount sum;
    auto bit = books_.find(id);
    if (bit == books_.end()) return sum;
    for (const auto& [who, amount] : bit->second.records) {
        sum += amount;
    }
    return sum;
}

void ContributionLedger::restore(std::unordered_map<CampaignId, Book> books) {
    books_ = std::move(books);
}

} // namespace campaign
