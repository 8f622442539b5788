#pragma once

#include "primitives/account.h"
#include "primitives/amount.h"
#include "primitives/asset.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace campaign {

using primitives::AccountId;
using primitives::Amount;
using primitives::Asset;

/// Sequential campaign identifier; the first campaign is 1.
using CampaignId = uint64_t;

inline constexpr CampaignId INVALID_CAMPAIGN = 0;

// ---------------------------------------------------------------------------
// CampaignState -- lifecycle state derived from the flags and the clock
// ---------------------------------------------------------------------------
enum class CampaignState : uint8_t {
    OPEN      = 0,  // accepting contributions
    EXPIRED   = 1,  // deadline passed without reaching the goal
    FUNDED    = 2,  // goal reached, success payout done
    CANCELLED = 3,  // cancelled by the creator, contributors refunded
};

[[nodiscard]] std::string_view campaign_state_string(CampaignState state);

struct Milestone {
    Amount amount;
    std::string description;
    bool completed = false;
};

/// Creator-chosen withdrawal rules. A zero ceiling means "no ceiling".
struct WithdrawalSettings {
    bool partial_enabled = false;
    Amount ceiling;
    int64_t min_interval = 0;  // seconds between partial withdrawals
};

struct WithdrawalPolicy {
    bool partial_enabled = false;
    bool ceiling_enabled = false;
    Amount ceiling;
    Amount total_withdrawn;
    int64_t last_withdrawal_time = 0;
    int64_t min_interval = 0;
};

struct CampaignMetadata {
    std::string title;
    std::string description;
    std::string media_ref;
};

// ---------------------------------------------------------------------------
// Campaign -- one funding goal and its accounting state
// ---------------------------------------------------------------------------
// raised    contributions minus refunds, partial withdrawals and surplus
//           withdrawals.
// released  gross amount paid out of custody to the creator side by the
//           success payout and by milestone releases. Always <= raised.
// ---------------------------------------------------------------------------
struct Campaign {
    CampaignId id = INVALID_CAMPAIGN;
    AccountId creator;

    Amount goal;
    Amount raised;
    Amount min_contribution;
    Amount max_contribution;

    int64_t created_at = 0;
    int64_t deadline = 0;

    CampaignMetadata metadata;
    std::string category;
    bool verified = false;
    bool promoted = false;

    Asset asset;

    bool completed = false;
    bool cancelled = false;
    bool refundable = false;

    uint64_t backer_count = 0;
    Amount released;
    Amount fees_paid;

    WithdrawalPolicy withdrawal;
    std::vector<Milestone> milestones;

    /// Roster position reached by the cancellation refund sweep.
    uint64_t sweep_cursor = 0;

    [[nodiscard]] CampaignState state(int64_t now) const;

    [[nodiscard]] bool is_funded() const { return completed && !cancelled; }

    /// Accepts contributions at @p now.
    [[nodiscard]] bool is_active(int64_t now) const {
        return !completed && now < deadline;
    }

    /// Sum of all declared milestone amounts.
    [[nodiscard]] Amount milestone_total() const;

    /// Funds still held in custody for this campaign (raised - released).
    [[nodiscard]] Amount custody_balance() const;
};

} // namespace campaign
