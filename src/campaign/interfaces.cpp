// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/interfaces.h"

#include "core/time.h"

namespace campaign {

std::string describe(const Payout& payout) {
    return payout.amount.to_string() + " " + payout.asset.to_string() +
           " -> " + payout.recipient.str();
}

int64_t SystemClock::now() const {
    return core::MockableClock::now();
}

} // namespace campaign
