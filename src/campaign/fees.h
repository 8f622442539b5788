#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "primitives/amount.h"

#include <cstdint>

namespace campaign {

/// Basis points per whole (10000 bps = 100%).
inline constexpr uint32_t BPS_DENOMINATOR = 10'000;

/// Platform fee applied when the configuration does not set one (2.5%).
inline constexpr uint32_t DEFAULT_PLATFORM_FEE_BPS = 250;

/// Upper bound for the configurable platform fee (10%).
inline constexpr uint32_t DEFAULT_MAX_PLATFORM_FEE_BPS = 1'000;

// ---------------------------------------------------------------------------
// FeeSplit -- one gross payout divided into platform fee and creator net
// ---------------------------------------------------------------------------
struct FeeSplit {
    primitives::Amount gross;
    primitives::Amount fee;
    primitives::Amount net;
};

/// Split @p gross at @p bps basis points.
/// fee = floor(gross * bps / 10000), computed without an intermediate
/// product that could overflow; net = gross - fee.
/// Fails with INVALID_PARAMETERS when bps exceeds 10000 or gross is not a
/// valid amount.
[[nodiscard]] core::Result<FeeSplit> split_fee(primitives::Amount gross,
                                               uint32_t bps);

} // namespace campaign
