#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/fees.h"
#include "primitives/account.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace campaign {

inline constexpr int64_t DEFAULT_MAX_DURATION_DAYS = 365;
inline constexpr size_t DEFAULT_MAX_MILESTONES = 32;

// ---------------------------------------------------------------------------
// PlatformSettings -- engine-wide parameters
// ---------------------------------------------------------------------------
// fee_bps, fee_recipient and allowed_tokens change at runtime through the
// administration operations and are persisted in snapshots; the rest comes
// from configuration only.
// ---------------------------------------------------------------------------
struct PlatformSettings {
    uint32_t fee_bps = DEFAULT_PLATFORM_FEE_BPS;
    uint32_t max_fee_bps = DEFAULT_MAX_PLATFORM_FEE_BPS;
    primitives::AccountId fee_recipient{"platform"};
    int64_t max_duration_days = DEFAULT_MAX_DURATION_DAYS;
    size_t max_milestones = DEFAULT_MAX_MILESTONES;

    /// Roster entries refunded per cancellation batch; 0 = unbounded.
    size_t sweep_batch_size = 0;

    std::set<std::string> allowed_tokens;
};

} // namespace campaign
