#include "campaign/types.h"

namespace campaign {

std::string_view campaign_state_string(CampaignState state) {
    switch (state) {
        case CampaignState::OPEN:      return "open";
        case CampaignState::EXPIRED:   return "expired";
        case CampaignState::FUNDED:    return "funded";
        case CampaignState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

CampaignState Campaign::state(int64_t now) const {
    if (cancelled) return CampaignState::CANCELLED;
    if (completed) return CampaignState::FUNDED;
    if (now >= deadline) return CampaignState::EXPIRED;
    return CampaignState::OPEN;
}

Amount Campaign::milestone_total() const {
    Amount total;
    for (const auto& m : milestones) {
        total += m.amount;
    }
    return total;
}

Amount Campaign::custody_balance() const {
    return Amount(raised.value() - released.value());
}

} // namespace campaign
