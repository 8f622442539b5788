#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/types.h"
#include "core/error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace campaign {

// ---------------------------------------------------------------------------
// Payout -- one outbound value movement from custody
// ---------------------------------------------------------------------------
struct Payout {
    Asset asset;
    AccountId recipient;
    Amount amount;

    bool operator==(const Payout&) const = default;
};

/// "<amount> <asset> -> <recipient>"
[[nodiscard]] std::string describe(const Payout& payout);

/// All payouts of one operation, executed all-or-nothing.
using SettlementBatch = std::vector<Payout>;

// ---------------------------------------------------------------------------
// TransferGateway -- the value-transfer substrate
// ---------------------------------------------------------------------------
// The engine only records balances; custody of the actual value lives behind
// this interface.  Implementations may call back into the engine while
// pull() or settle() is running.
// ---------------------------------------------------------------------------
class TransferGateway {
public:
    virtual ~TransferGateway() = default;

    /// Move @p amount of @p asset from @p from into custody.  Called before
    /// any ledger change of a contribution; an error aborts the
    /// contribution.
    virtual core::Result<void> pull(const Asset& asset,
                                    const AccountId& from,
                                    Amount amount) = 0;

    /// Pay every element of @p batch out of custody, or none of them.
    virtual core::Result<void> settle(const SettlementBatch& batch) = 0;
};

// ---------------------------------------------------------------------------
// AccessGate -- platform ownership and pause state
// ---------------------------------------------------------------------------
class AccessGate {
public:
    virtual ~AccessGate() = default;

    [[nodiscard]] virtual bool is_owner(const AccountId& caller) const = 0;
    [[nodiscard]] virtual bool is_paused() const = 0;
};

// ---------------------------------------------------------------------------
// Clock -- current time in Unix seconds
// ---------------------------------------------------------------------------
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual int64_t now() const = 0;
};

/// Wall clock that honours core::MockableClock overrides.
class SystemClock final : public Clock {
public:
    [[nodiscard]] int64_t now() const override;
};

} // namespace campaign
