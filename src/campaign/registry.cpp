// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/registry.h"

#include "core/logging.h"
#include "core/time.h"

#include <algorithm>

namespace campaign {

namespace {

core::Error invalid(std::string message) {
    return core::Error(core::ErrorCode::INVALID_PARAMETERS,
                       std::move(message));
}

} // namespace

core::Result<void> validate_params(const CampaignParams& params,
                                   int64_t max_duration_days) {
    if (!params.goal.is_valid() || params.goal.is_zero()) {
        return invalid("goal must be positive");
    }
    if (!params.min_contribution.is_valid() ||
        params.min_contribution.is_zero()) {
        return invalid("minimum contribution must be positive");
    }
    if (!params.max_contribution.is_valid() ||
        params.max_contribution < params.min_contribution) {
        return invalid("maximum contribution below minimum");
    }
    if (params.duration_days <= 0) {
        return invalid("duration must be positive");
    }
    if (params.duration_days > max_duration_days) {
        return invalid("duration of " + std::to_string(params.duration_days) +
                       " days exceeds the maximum of " +
                       std::to_string(max_duration_days));
    }
    if (params.metadata.title.empty()) {
        return invalid("title must not be empty");
    }
    if (params.asset.is_token() && params.asset.token_id().empty()) {
        return invalid("token asset without id");
    }
    if (!params.withdrawal.ceiling.is_valid() ||
        params.withdrawal.min_interval < 0) {
        return invalid("invalid withdrawal policy");
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// CampaignRegistry
// ---------------------------------------------------------------------------

core::Result<CampaignId> CampaignRegistry::create(
    const AccountId& creator, const CampaignParams& params, int64_t now,
    int64_t max_duration_days) {
    if (!creator.is_valid()) {
        return invalid("invalid creator account");
    }
    CFUND_TRY_VOID(validate_params(params, max_duration_days));

    Campaign c;
    c.id = static_cast<CampaignId>(campaigns_.size()) + 1;
    c.creator = creator;
    c.goal = params.goal;
    c.min_contribution = params.min_contribution;
    c.max_contribution = params.max_contribution;
    c.created_at = now;
    c.deadline = now + params.duration_days * core::SECONDS_PER_DAY;
    c.metadata = params.metadata;
    c.category = params.category;
    c.asset = params.asset;
    c.withdrawal.partial_enabled = params.withdrawal.partial_enabled;
    c.withdrawal.ceiling_enabled = !params.withdrawal.ceiling.is_zero();
    c.withdrawal.ceiling = params.withdrawal.ceiling;
    c.withdrawal.min_interval = params.withdrawal.min_interval;

    campaigns_.push_back(std::move(c));
    const CampaignId id = campaigns_.back().id;
    owned_[creator].push_back(id);

    LOG_DEBUG(core::LogCategory::REGISTRY,
              "campaign " + std::to_string(id) + " registered for " +
                  creator.str());
    return id;
}

core::Result<Campaign*> CampaignRegistry::must_exist(CampaignId id) {
    if (!exists(id)) {
        return core::make_error(core::ErrorCode::CAMPAIGN_NOT_FOUND,
                                "campaign " + std::to_string(id) +
                                    " does not exist");
    }
    return &campaigns_[id - 1];
}

core::Result<const Campaign*> CampaignRegistry::must_exist(
    CampaignId id) const {
    if (!exists(id)) {
        return core::make_error(core::ErrorCode::CAMPAIGN_NOT_FOUND,
                                "campaign " + std::to_string(id) +
                                    " does not exist");
    }
    return &campaigns_[id - 1];
}

Campaign* CampaignRegistry::find(CampaignId id) {
    return exists(id) ? &campaigns_[id - 1] : nullptr;
}

const Campaign* CampaignRegistry::find(CampaignId id) const {
    return exists(id) ? &campaigns_[id - 1] : nullptr;
}

core::Result<void> CampaignRegistry::transfer_ownership(
    CampaignId id, const AccountId& new_owner) {
    Campaign* c = CFUND_TRY(must_exist(id));
    if (!new_owner.is_valid()) {
        return invalid("invalid new owner account");
    }
    if (new_owner == c->creator) {
        return invalid("account already owns campaign " +
                       std::to_string(id));
    }

    auto it = owned_.find(c->creator);
    if (it != owned_.end()) {
        auto& ids = it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) {
            owned_.erase(it);
        }
    }
    owned_[new_owner].push_back(id);

    LOG_INFO(core::LogCategory::REGISTRY,
             "campaign " + std::to_string(id) + " ownership " +
                 c->creator.str() + " -> " + new_owner.str());
    c->creator = new_owner;
    return core::make_ok();
}

std::vector<CampaignId> CampaignRegistry::campaigns_of(
    const AccountId& owner) const {
    auto it = owned_.find(owner);
    if (it == owned_.end()) return {};
    return it->second;
}

void CampaignRegistry::restore(
    std::deque<Campaign> campaigns,
    std::unordered_map<AccountId, std::vector<CampaignId>> owned) {
    campaigns_ = std::move(campaigns);
    owned_ = std::move(owned);
}

} // namespace campaign
