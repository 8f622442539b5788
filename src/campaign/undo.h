#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace campaign {

// ---------------------------------------------------------------------------
// UndoLog -- inverse deltas recorded while an operation mutates state
// ---------------------------------------------------------------------------
// Every mutation of the registry or the ledger performed inside an engine
// operation records the closure that reverses it.  If the operation's
// settlement batch fails, rollback() replays the closures newest first and
// the tables return to their state before the operation.
//
// Amounts are restored as deltas ("add 50 back to raised"), so a nested
// operation that committed its own changes to them while the outer one was
// settling keeps them when the outer operation aborts.  Flags and counters
// recorded through assign() are restored by value.
//
// A log that is destroyed while still holding entries rolls them back, so an
// exception thrown mid-operation cannot leave half-applied state behind.
// ---------------------------------------------------------------------------
class UndoLog {
public:
    using Reverter = std::function<void()>;

    UndoLog() = default;
    ~UndoLog();

    UndoLog(const UndoLog&) = delete;
    UndoLog& operator=(const UndoLog&) = delete;

    /// Record the inverse of a mutation that has just been applied.
    void record(std::string label, Reverter revert);

    /// field += delta, recording the matching subtraction.  The caller has
    /// already proved the result is in range.
    void add(std::string label, primitives::Amount& field,
             primitives::Amount delta);

    /// field -= delta, recording the matching addition.
    void subtract(std::string label, primitives::Amount& field,
                  primitives::Amount delta);

    /// Overwrite a flag or counter, recording its previous value.
    template <typename T>
    void assign(std::string label, T& field, T value) {
        T previous = field;
        field = std::move(value);
        record(std::move(label),
               [&field, previous]() mutable { field = std::move(previous); });
    }

    /// Replay all recorded inverses newest first, then clear the log.
    void rollback();

    /// Keep all applied mutations and forget their inverses.
    void commit() noexcept;

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        std::string label;
        Reverter revert;
    };

    std::vector<Entry> entries_;
};

} // namespace campaign
