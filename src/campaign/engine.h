#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/events.h"
#include "campaign/fees.h"
#include "campaign/interfaces.h"
#include "campaign/ledger.h"
#include "campaign/refund.h"
#include "campaign/registry.h"
#include "campaign/settings.h"
#include "campaign/types.h"
#include "core/error.h"
#include "core/sync.h"
#include "crypto/keccak.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace campaign {

/// Read-only view of one campaign.
struct CampaignSummary {
    Campaign campaign;
    CampaignState state = CampaignState::OPEN;
    Amount custody;              // raised - released
    uint64_t contributors = 0;   // roster length
    uint64_t sweep_remaining = 0;
};

// ---------------------------------------------------------------------------
// CampaignEngine -- the public operation set
// ---------------------------------------------------------------------------
// Every operation runs under the engine's recursive mutex as one
// all-or-nothing unit:
//
//   1. checks     pause state, existence, caller role, lifecycle state
//   2. effects    registry / ledger mutations, each recorded in an UndoLog
//   3. interaction one settlement batch handed to the TransferGateway
//   4. commit     events published to the journal and subscribers
//
// If the batch fails the undo log is replayed, staged events are dropped and
// the operation returns TRANSFER_FAILED.
//
// The gateway may call back into the engine on the same thread while it
// settles.  The recursive mutex admits the nested call, which sees the
// outer operation's effects already applied (zeroed records, set flags) and
// so fails its own checks instead of paying twice.  Other threads block
// until the running operation returns.
//
// While the access gate reports "paused" every mutating operation fails
// with PAUSED except request_refund, continue_refund_sweep and the platform
// administration operations.
// ---------------------------------------------------------------------------
class CampaignEngine {
public:
    CampaignEngine(PlatformSettings settings, TransferGateway& gateway,
                   const AccessGate& access, const Clock& clock);

    CampaignEngine(const CampaignEngine&) = delete;
    CampaignEngine& operator=(const CampaignEngine&) = delete;

    // -- Registry -----------------------------------------------------------

    core::Result<CampaignId> create_campaign(const AccountId& caller,
                                             const CampaignParams& params);

    /// Empty fields keep their current value.
    core::Result<void> update_campaign(const AccountId& caller,
                                       CampaignId id,
                                       const CampaignMetadata& update);

    core::Result<void> set_category(const AccountId& caller, CampaignId id,
                                    std::string category);

    core::Result<void> transfer_campaign_ownership(const AccountId& caller,
                                                   CampaignId id,
                                                   const AccountId& new_owner);

    /// Only before the first contribution.
    core::Result<void> change_funding_asset(const AccountId& caller,
                                            CampaignId id,
                                            const Asset& asset);

    // -- Contributions ------------------------------------------------------

    /// Pull @p amount from @p caller and credit it.  Reaching the goal
    /// triggers the success payout inside the same operation.
    core::Result<void> contribute(const AccountId& caller, CampaignId id,
                                  Amount amount);

    // -- Lifecycle ----------------------------------------------------------

    core::Result<void> modify_goal(const AccountId& caller, CampaignId id,
                                   Amount new_goal);

    core::Result<void> extend_deadline(const AccountId& caller,
                                       CampaignId id, int64_t extra_days);

    /// Cancel and refund the first sweep batch.  Returns the number of
    /// roster entries left for continue_refund_sweep().
    core::Result<uint64_t> cancel_campaign(const AccountId& caller,
                                           CampaignId id);

    /// Refund up to @p max_entries further roster entries (0 = all) of a
    /// cancelled campaign.  Any caller.  Returns the entries left.
    core::Result<uint64_t> continue_refund_sweep(const AccountId& caller,
                                                 CampaignId id,
                                                 size_t max_entries);

    // -- Refunds ------------------------------------------------------------

    core::Result<void> enable_refunds(const AccountId& caller,
                                      CampaignId id);

    /// Refund the caller's whole record.  Returns the amount paid.
    core::Result<Amount> request_refund(const AccountId& caller,
                                        CampaignId id);

    // -- Withdrawals and milestones -----------------------------------------

    core::Result<void> configure_withdrawals(
        const AccountId& caller, CampaignId id,
        const WithdrawalSettings& settings);

    core::Result<FeeSplit> withdraw_partial_funds(const AccountId& caller,
                                                  CampaignId id,
                                                  Amount amount);

    core::Result<FeeSplit> withdraw_surplus(const AccountId& caller,
                                            CampaignId id);

    core::Result<size_t> add_milestone(const AccountId& caller,
                                       CampaignId id, Amount amount,
                                       std::string description);

    core::Result<FeeSplit> complete_milestone(const AccountId& caller,
                                              CampaignId id, size_t index);

    // -- Platform administration --------------------------------------------

    core::Result<void> verify_campaign(const AccountId& caller,
                                       CampaignId id, bool verified);

    core::Result<void> promote_campaign(const AccountId& caller,
                                        CampaignId id, bool promoted);

    core::Result<void> set_platform_fee(const AccountId& caller,
                                        uint32_t bps);

    core::Result<void> set_fee_recipient(const AccountId& caller,
                                         const AccountId& recipient);

    core::Result<void> set_token_allowed(const AccountId& caller,
                                         const std::string& token_id,
                                         bool allowed);

    // -- Queries ------------------------------------------------------------

    [[nodiscard]] core::Result<CampaignSummary> summary(CampaignId id) const;

    [[nodiscard]] core::Result<Amount> contribution_of(
        CampaignId id, const AccountId& who) const;

    [[nodiscard]] core::Result<std::vector<AccountId>> contributors(
        CampaignId id) const;

    [[nodiscard]] std::vector<CampaignId> campaigns_of(
        const AccountId& owner) const;

    /// Open campaigns (not completed, deadline not passed).
    [[nodiscard]] std::vector<CampaignId> active_campaigns() const;

    /// Funded campaigns.
    [[nodiscard]] std::vector<CampaignId> successful_campaigns() const;

    [[nodiscard]] std::vector<CampaignId> verified_campaigns() const;

    /// Promoted campaigns that are still open.
    [[nodiscard]] std::vector<CampaignId> promoted_campaigns() const;

    [[nodiscard]] uint64_t campaign_count() const;
    [[nodiscard]] uint32_t platform_fee_bps() const;
    [[nodiscard]] AccountId fee_recipient() const;
    [[nodiscard]] bool is_token_allowed(const std::string& token_id) const;

    // -- Journal ------------------------------------------------------------

    [[nodiscard]] crypto::Hash256 journal_head() const;
    [[nodiscard]] std::vector<Event> events() const;
    [[nodiscard]] std::vector<Event> events_for(CampaignId id) const;
    [[nodiscard]] bool verify_journal() const;

    CallbackId subscribe(EventCallback callback);
    void unsubscribe(CallbackId id);

    // -- Persistence --------------------------------------------------------

    [[nodiscard]] core::Result<void> save_snapshot(
        const std::filesystem::path& path) const;

    /// Replace all campaign state with the snapshot's.  On any error the
    /// engine is left untouched.  Not allowed from inside an operation.
    core::Result<void> load_snapshot(const std::filesystem::path& path);

private:
    struct Operation;

    // Checks
    core::Result<void> require_running() const;
    core::Result<void> require_platform_owner(const AccountId& caller) const;
    core::Result<void> require_asset_allowed(const Asset& asset) const;
    core::Result<Campaign*> creator_campaign(const AccountId& caller,
                                             CampaignId id);

    // Staging
    core::Result<void> stage_contribution(Operation& op, Campaign& c,
                                          const AccountId& who,
                                          Amount amount);
    void stage_refunds(Operation& op, const Campaign& c,
                       const SweepBatch& batch) const;

    // Commit / abort
    core::Result<void> commit(Operation& op);
    void add_fee_payouts(Operation& op, const Campaign& c,
                         const FeeSplit& split) const;
    Event make_event(EventKind kind, CampaignId id) const;
    void return_pulled(const Asset& asset, const AccountId& who,
                       Amount amount);

    std::vector<CampaignId> select(
        bool (*pred)(const Campaign&, int64_t)) const;

    PlatformSettings settings_;
    TransferGateway& gateway_;
    const AccessGate& access_;
    const Clock& clock_;

    CampaignRegistry registry_;
    ContributionLedger ledger_;
    EventJournal journal_;

    mutable core::RecursiveMutex mutex_{"campaign-engine"};
};

} // namespace campaign
