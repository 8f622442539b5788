#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/types.h"
#include "core/stream.h"
#include "crypto/keccak.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace campaign {

enum class EventKind : uint8_t {
    CAMPAIGN_CREATED      = 0,
    CAMPAIGN_UPDATED      = 1,
    CONTRIBUTION          = 2,
    GOAL_REACHED          = 3,
    PAYOUT                = 4,
    REFUND                = 5,
    CAMPAIGN_CANCELLED    = 6,
    REFUNDS_ENABLED       = 7,
    GOAL_MODIFIED         = 8,
    DEADLINE_EXTENDED     = 9,
    PARTIAL_WITHDRAWAL    = 10,
    SURPLUS_WITHDRAWN     = 11,
    MILESTONE_ADDED       = 12,
    MILESTONE_COMPLETED   = 13,
    OWNERSHIP_TRANSFERRED = 14,
    FUNDING_ASSET_CHANGED = 15,
    CAMPAIGN_VERIFIED     = 16,
    CAMPAIGN_PROMOTED     = 17,
    PLATFORM_FEE_CHANGED  = 18,
};

[[nodiscard]] std::string_view event_kind_string(EventKind kind);

// ---------------------------------------------------------------------------
// Event -- one committed state change
// ---------------------------------------------------------------------------
// Field use varies by kind: `account` is the contributor, recipient or new
// owner; `amount` the gross value moved or the new goal / deadline / rate;
// `fee` the platform share of a payout; `detail` free text such as a
// milestone description or asset name.
// ---------------------------------------------------------------------------
struct Event {
    EventKind kind = EventKind::CAMPAIGN_CREATED;
    CampaignId campaign = INVALID_CAMPAIGN;
    AccountId account;
    Amount amount;
    Amount fee;
    int64_t timestamp = 0;
    std::string detail;
    uint64_t sequence = 0;  // assigned by the journal

    void serialize(core::DataStream& s) const;
    [[nodiscard]] std::string to_string() const;
};

using EventCallback = std::function<void(const Event&)>;
using CallbackId = uint64_t;

// ---------------------------------------------------------------------------
// EventJournal -- ordered event history with a Keccak-256 hash chain
// ---------------------------------------------------------------------------
// head_0 is all zeroes; head_n = keccak256(head_{n-1} || encode(event_n)).
// Two replicas that applied the same operations report the same head.
//
// Subscribers are invoked synchronously on the appending thread after the
// event is recorded.
// ---------------------------------------------------------------------------
class EventJournal {
public:
    EventJournal() = default;

    /// Assign the next sequence number, extend the chain and notify
    /// subscribers.  Returns the recorded event.
    const Event& append(Event event);

    [[nodiscard]] const crypto::Hash256& head() const noexcept {
        return head_;
    }
    [[nodiscard]] const std::vector<Event>& events() const noexcept {
        return events_;
    }
    [[nodiscard]] size_t size() const noexcept { return events_.size(); }

    /// Events of one campaign, oldest first.
    [[nodiscard]] std::vector<Event> events_for(CampaignId id) const;

    /// Recompute the chain from the genesis head and compare.
    [[nodiscard]] bool verify() const;

    /// One chain step.
    [[nodiscard]] static crypto::Hash256 chain(const crypto::Hash256& prev,
                                               const Event& event);

    // -- Subscribers --------------------------------------------------------

    CallbackId subscribe(EventCallback callback);
    void unsubscribe(CallbackId id);
    [[nodiscard]] size_t subscriber_count() const;

private:
    std::vector<Event> events_;
    crypto::Hash256 head_{};

    struct Subscriber {
        CallbackId id;
        EventCallback callback;
    };

    mutable std::mutex subscribers_mutex_;
    std::vector<Subscriber> subscribers_;
    CallbackId next_id_ = 1;
};

} // namespace campaign
