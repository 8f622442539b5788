#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/types.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

namespace campaign {

/// Inputs of createCampaign.
struct CampaignParams {
    Amount goal;
    Amount min_contribution;
    Amount max_contribution;
    int64_t duration_days = 0;
    CampaignMetadata metadata;
    std::string category;
    Asset asset;
    WithdrawalSettings withdrawal;
};

/// Check the creation constraints that do not depend on registry state.
[[nodiscard]] core::Result<void> validate_params(const CampaignParams& params,
                                                 int64_t max_duration_days);

// ---------------------------------------------------------------------------
// CampaignRegistry -- id -> Campaign table and per-account ownership index
// ---------------------------------------------------------------------------
// Identifiers are assigned sequentially from 1 and never reused.  Campaigns
// are never removed, and the backing deque keeps every Campaign at a stable
// address for the registry's lifetime, so callers may hold a Campaign&
// across a settlement that creates further campaigns.
// ---------------------------------------------------------------------------
class CampaignRegistry {
public:
    CampaignRegistry() = default;

    /// Validate @p params and append a new campaign owned by @p creator.
    /// A rejected request does not consume an identifier.
    core::Result<CampaignId> create(const AccountId& creator,
                                    const CampaignParams& params,
                                    int64_t now,
                                    int64_t max_duration_days);

    [[nodiscard]] bool exists(CampaignId id) const noexcept {
        return id >= 1 && id <= campaigns_.size();
    }

    /// The campaign, or CAMPAIGN_NOT_FOUND.
    core::Result<Campaign*> must_exist(CampaignId id);
    core::Result<const Campaign*> must_exist(CampaignId id) const;

    [[nodiscard]] Campaign* find(CampaignId id);
    [[nodiscard]] const Campaign* find(CampaignId id) const;

    /// Move @p id from its creator's index list to @p new_owner's.
    core::Result<void> transfer_ownership(CampaignId id,
                                          const AccountId& new_owner);

    /// Campaign ids owned by @p owner, in acquisition order.
    [[nodiscard]] std::vector<CampaignId> campaigns_of(
        const AccountId& owner) const;

    [[nodiscard]] uint64_t count() const noexcept {
        return campaigns_.size();
    }

    [[nodiscard]] const std::deque<Campaign>& all() const noexcept {
        return campaigns_;
    }

    [[nodiscard]] const std::unordered_map<AccountId,
                                           std::vector<CampaignId>>&
    ownership_index() const noexcept {
        return owned_;
    }

    /// Replace the whole table, used when loading a snapshot.
    void restore(std::deque<Campaign> campaigns,
                 std::unordered_map<AccountId, std::vector<CampaignId>> owned);

private:
    std::deque<Campaign> campaigns_;  // campaigns_[id - 1]
    std::unordered_map<AccountId, std::vector<CampaignId>> owned_;
};

} // namespace campaign
