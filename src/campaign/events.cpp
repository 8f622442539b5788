// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/events.h"

#include "core/logging.h"
#include "core/serialize.h"

#include <algorithm>

namespace campaign {

std::string_view event_kind_string(EventKind kind) {
    switch (kind) {
        case EventKind::CAMPAIGN_CREATED:      return "CampaignCreated";
        case EventKind::CAMPAIGN_UPDATED:      return "CampaignUpdated";
        case EventKind::CONTRIBUTION:          return "Contribution";
        case EventKind::GOAL_REACHED:          return "GoalReached";
        case EventKind::PAYOUT:                return "Payout";
        case EventKind::REFUND:                return "Refund";
        case EventKind::CAMPAIGN_CANCELLED:    return "CampaignCancelled";
        case EventKind::REFUNDS_ENABLED:       return "RefundsEnabled";
        case EventKind::GOAL_MODIFIED:         return "GoalModified";
        case EventKind::DEADLINE_EXTENDED:     return "DeadlineExtended";
        case EventKind::PARTIAL_WITHDRAWAL:    return "PartialWithdrawal";
        case EventKind::SURPLUS_WITHDRAWN:     return "SurplusWithdrawn";
        case EventKind::MILESTONE_ADDED:       return "MilestoneAdded";
        case EventKind::MILESTONE_COMPLETED:   return "MilestoneCompleted";
        case EventKind::OWNERSHIP_TRANSFERRED: return "OwnershipTransferred";
        case EventKind::FUNDING_ASSET_CHANGED: return "FundingAssetChanged";
        case EventKind::CAMPAIGN_VERIFIED:     return "CampaignVerified";
        case EventKind::CAMPAIGN_PROMOTED:     return "CampaignPromoted";
        case EventKind::PLATFORM_FEE_CHANGED:  return "PlatformFeeChanged";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Event
// ---------------------------------------------------------------------------

void Event::serialize(core::DataStream& s) const {
    core::ser_write_u64(s, sequence);
    core::ser_write_u8(s, static_cast<uint8_t>(kind));
    core::ser_write_u64(s, campaign);
    core::ser_write_string(s, account.str());
    amount.serialize(s);
    fee.serialize(s);
    core::ser_write_i64(s, timestamp);
    core::ser_write_string(s, detail);
}

std::string Event::to_string() const {
    std::string out = "#" + std::to_string(sequence) + " " +
                      std::string(event_kind_string(kind)) + " campaign=" +
                      std::to_string(campaign);
    if (!account.empty()) out += " account=" + account.str();
    if (!amount.is_zero()) out += " amount=" + amount.to_string();
    if (!fee.is_zero()) out += " fee=" + fee.to_string();
    if (!detail.empty()) out += " detail=\"" + detail + "\"";
    return out;
}

// ---------------------------------------------------------------------------
// EventJournal
// ---------------------------------------------------------------------------

crypto::Hash256 EventJournal::chain(const crypto::Hash256& prev,
                                    const Event& event) {
    core::DataStream s;
    event.serialize(s);

    crypto::Keccak256Hasher hasher;
    hasher.write(prev);
    hasher.write(s.bytes());
    return hasher.finalize();
}

const Event& EventJournal::append(Event event) {
    event.sequence = events_.size();
    head_ = chain(head_, event);
    events_.push_back(std::move(event));

    // Copy: a subscriber that re-enters the engine may append and grow
    // events_ while the remaining subscribers run.
    const Event recorded = events_.back();
    LOG_DEBUG(core::LogCategory::JOURNAL, recorded.to_string());

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard lock(subscribers_mutex_);
        subscribers = subscribers_;
    }
    for (const auto& sub : subscribers) {
        sub.callback(recorded);
    }
    return events_[recorded.sequence];
}

std::vector<Event> EventJournal::events_for(CampaignId id) const {
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.campaign == id) out.push_back(e);
    }
    return out;
}

bool EventJournal::verify() const {
    crypto::Hash256 h{};
    for (const auto& e : events_) {
        h = chain(h, e);
    }
    return h == head_;
}

CallbackId EventJournal::subscribe(EventCallback callback) {
    std::lock_guard lock(subscribers_mutex_);
    const CallbackId id = next_id_++;
    subscribers_.push_back(Subscriber{id, std::move(callback)});
    return id;
}

void EventJournal::unsubscribe(CallbackId id) {
    std::lock_guard lock(subscribers_mutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [id](const Subscriber& s) { return s.id == id; }),
        subscribers_.end());
}

size_t EventJournal::subscriber_count() const {
    std::lock_guard lock(subscribers_mutex_);
    return subscribers_.size();
}

} // namespace campaign
