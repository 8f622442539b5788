// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/fees.h"

namespace campaign {

core::Result<FeeSplit> split_fee(primitives::Amount gross, uint32_t bps) {
    if (bps > BPS_DENOMINATOR) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "fee rate " + std::to_string(bps) +
                                    " bps exceeds 100%");
    }
    if (!gross.is_valid()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "gross amount out of range: " +
                                    gross.to_string());
    }

    // gross <= 1e18, so gross / 10000 * bps stays below 1e18 and the
    // remainder term below 1e8.
    const int64_t g = gross.value();
    const int64_t b = static_cast<int64_t>(bps);
    const int64_t fee = (g / BPS_DENOMINATOR) * b +
                        (g % BPS_DENOMINATOR) * b / BPS_DENOMINATOR;

    FeeSplit split;
    split.gross = gross;
    split.fee = primitives::Amount(fee);
    split.net = primitives::Amount(g - fee);
    return split;
}

} // namespace campaign
