// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/undo.h"

#include "core/logging.h"

namespace campaign {

UndoLog::~UndoLog() {
    if (!entries_.empty()) {
        rollback();
    }
}

void UndoLog::record(std::string label, Reverter revert) {
    entries_.push_back(Entry{std::move(label), std::move(revert)});
}

void UndoLog::add(std::string label, primitives::Amount& field,
                  primitives::Amount delta) {
    field += delta;
    record(std::move(label), [&field, delta] { field -= delta; });
}

void UndoLog::subtract(std::string label, primitives::Amount& field,
                       primitives::Amount delta) {
    field -= delta;
    record(std::move(label), [&field, delta] { field += delta; });
}

void UndoLog::rollback() {
    // Detach first: a reverter must never observe a partially drained log.
    std::vector<Entry> entries;
    entries.swap(entries_);

    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        LOG_TRACE(core::LogCategory::LEDGER, "undo: " + it->label);
        it->revert();
    }
}

void UndoLog::commit() noexcept {
    entries_.clear();
}

} // namespace campaign
