// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/engine.h"

#include "campaign/lifecycle.h"
#include "campaign/snapshot.h"
#include "campaign/undo.h"
#include "campaign/withdrawal.h"
#include "core/logging.h"
#include "core/time.h"

namespace campaign {

namespace {

std::string tag(CampaignId id) {
    return "campaign " + std::to_string(id);
}

} // namespace

// ---------------------------------------------------------------------------
// Operation -- one all-or-nothing unit of work
// ---------------------------------------------------------------------------
// Dropping an Operation without commit() rolls its undo log back, so an
// early CFUND_TRY return after the first mutation still leaves the tables
// untouched.
// ---------------------------------------------------------------------------
struct CampaignEngine::Operation {
    explicit Operation(std::string n) : name(std::move(n)) {}

    std::string name;
    UndoLog undo;
    SettlementBatch payouts;
    std::vector<Event> events;
};

CampaignEngine::CampaignEngine(PlatformSettings settings,
                               TransferGateway& gateway,
                               const AccessGate& access, const Clock& clock)
    : settings_(std::move(settings)),
      gateway_(gateway),
      access_(access),
      clock_(clock) {
    LOG_INFO(core::LogCategory::CONFIG,
             "campaign engine: fee " + std::to_string(settings_.fee_bps) +
                 " bps to " + settings_.fee_recipient.str() +
                 ", max duration " +
                 std::to_string(settings_.max_duration_days) + " days");
}

// ===================================================================
// Checks
// ===================================================================

core::Result<void> CampaignEngine::require_running() const {
    if (access_.is_paused()) {
        return core::make_error(core::ErrorCode::PAUSED,
                                "platform is paused");
    }
    return core::make_ok();
}

core::Result<void> CampaignEngine::require_platform_owner(
    const AccountId& caller) const {
    if (!access_.is_owner(caller)) {
        return core::make_error(core::ErrorCode::UNAUTHORIZED,
                                caller.str() + " is not the platform owner");
    }
    return core::make_ok();
}

core::Result<void> CampaignEngine::require_asset_allowed(
    const Asset& asset) const {
    if (asset.is_token() && !settings_.allowed_tokens.count(asset.token_id())) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "token '" + asset.token_id() +
                                    "' is not allowed");
    }
    return core::make_ok();
}

core::Result<Campaign*> CampaignEngine::creator_campaign(
    const AccountId& caller, CampaignId id) {
    Campaign* c = CFUND_TRY(registry_.must_exist(id));
    CFUND_TRY_VOID(require_creator(*c, caller));
    return c;
}

// ===================================================================
// Staging and commit
// ===================================================================

Event CampaignEngine::make_event(EventKind kind, CampaignId id) const {
    Event e;
    e.kind = kind;
    e.campaign = id;
    e.timestamp = clock_.now();
    return e;
}

void CampaignEngine::add_fee_payouts(Operation& op, const Campaign& c,
                                     const FeeSplit& split) const {
    if (!split.net.is_zero()) {
        op.payouts.push_back(Payout{c.asset, c.creator, split.net});
    }
    if (!split.fee.is_zero()) {
        op.payouts.push_back(
            Payout{c.asset, settings_.fee_recipient, split.fee});
    }
}

core::Result<void> CampaignEngine::stage_contribution(Operation& op,
                                                      Campaign& c,
                                                      const AccountId& who,
                                                      Amount amount) {
    CFUND_TRY_VOID(record_contribution(c, ledger_, who, amount, op.undo));

    Event contributed = make_event(EventKind::CONTRIBUTION, c.id);
    contributed.account = who;
    contributed.amount = amount;
    op.events.push_back(std::move(contributed));

    if (!goal_reached(c)) return core::make_ok();

    const FeeSplit payout =
        CFUND_TRY(plan_success_payout(c, settings_.fee_bps));
    mark_funded(c, payout, op.undo);
    add_fee_payouts(op, c, payout);

    Event reached = make_event(EventKind::GOAL_REACHED, c.id);
    reached.amount = c.raised;
    op.events.push_back(std::move(reached));

    Event paid = make_event(EventKind::PAYOUT, c.id);
    paid.account = c.creator;
    paid.amount = payout.net;
    paid.fee = payout.fee;
    op.events.push_back(std::move(paid));
    return core::make_ok();
}

void CampaignEngine::stage_refunds(Operation& op, const Campaign& c,
                                   const SweepBatch& batch) const {
    for (const auto& entry : batch.refunds) {
        op.payouts.push_back(Payout{c.asset, entry.contributor, entry.amount});

        Event refunded = make_event(EventKind::REFUND, c.id);
        refunded.account = entry.contributor;
        refunded.amount = entry.amount;
        op.events.push_back(std::move(refunded));
    }
}

core::Result<void> CampaignEngine::commit(Operation& op) {
    if (!op.payouts.empty()) {
        auto settled = gateway_.settle(op.payouts);
        if (!settled.ok()) {
            op.undo.rollback();
            op.events.clear();
            LOG_WARN(core::LogCategory::TRANSFER,
                     op.name + " aborted: " + settled.error().message());
            return core::make_error(core::ErrorCode::TRANSFER_FAILED,
                                    op.name + ": " +
                                        settled.error().message());
        }
        for (const auto& p : op.payouts) {
            LOG_INFO(core::LogCategory::TRANSFER,
                     op.name + ": paid " + describe(p));
        }
    }

    op.undo.commit();
    for (auto& e : op.events) {
        journal_.append(std::move(e));
    }
    op.events.clear();
    return core::make_ok();
}

void CampaignEngine::return_pulled(const Asset& asset, const AccountId& who,
                                   Amount amount) {
    auto returned = gateway_.settle({Payout{asset, who, amount}});
    if (!returned.ok()) {
        LOG_ERROR(core::LogCategory::TRANSFER,
                  "could not return " + amount.to_string() + " " +
                      asset.to_string() + " to " + who.str() + ": " +
                      returned.error().message());
    }
}

// ===================================================================
// Registry
// ===================================================================

core::Result<CampaignId> CampaignEngine::create_campaign(
    const AccountId& caller, const CampaignParams& params) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    CFUND_TRY_VOID(require_asset_allowed(params.asset));

    const CampaignId id = CFUND_TRY(registry_.create(
        caller, params, clock_.now(), settings_.max_duration_days));

    Operation op("create " + tag(id));
    Event created = make_event(EventKind::CAMPAIGN_CREATED, id);
    created.account = caller;
    created.amount = params.goal;
    created.detail = params.metadata.title;
    op.events.push_back(std::move(created));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::REGISTRY,
             "created " + tag(id) + " '" + params.metadata.title +
                 "' by " + caller.str() + ", goal " +
                 params.goal.to_string() + " " + params.asset.to_string());
    return id;
}

core::Result<void> CampaignEngine::update_campaign(
    const AccountId& caller, CampaignId id, const CampaignMetadata& update) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    CFUND_TRY_VOID(require_not_completed(*c));

    if (!update.title.empty()) c->metadata.title = update.title;
    if (!update.description.empty()) {
        c->metadata.description = update.description;
    }
    if (!update.media_ref.empty()) c->metadata.media_ref = update.media_ref;

    Operation op("update " + tag(id));
    Event updated = make_event(EventKind::CAMPAIGN_UPDATED, id);
    updated.detail = c->metadata.title;
    op.events.push_back(std::move(updated));
    return commit(op);
}

core::Result<void> CampaignEngine::set_category(const AccountId& caller,
                                                CampaignId id,
                                                std::string category) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    c->category = std::move(category);

    Operation op("categorize " + tag(id));
    Event updated = make_event(EventKind::CAMPAIGN_UPDATED, id);
    updated.detail = "category=" + c->category;
    op.events.push_back(std::move(updated));
    return commit(op);
}

core::Result<void> CampaignEngine::transfer_campaign_ownership(
    const AccountId& caller, CampaignId id, const AccountId& new_owner) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    CFUND_TRY_VOID(creator_campaign(caller, id));
    CFUND_TRY_VOID(registry_.transfer_ownership(id, new_owner));

    Operation op("transfer " + tag(id));
    Event moved = make_event(EventKind::OWNERSHIP_TRANSFERRED, id);
    moved.account = new_owner;
    moved.detail = caller.str();
    op.events.push_back(std::move(moved));
    return commit(op);
}

core::Result<void> CampaignEngine::change_funding_asset(
    const AccountId& caller, CampaignId id, const Asset& asset) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    CFUND_TRY_VOID(require_not_completed(*c));
    if (c->backer_count != 0 || !c->raised.is_zero()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                tag(id) + " already received contributions");
    }
    CFUND_TRY_VOID(require_asset_allowed(asset));
    c->asset = asset;

    Operation op("re-asset " + tag(id));
    Event changed = make_event(EventKind::FUNDING_ASSET_CHANGED, id);
    changed.detail = asset.to_string();
    op.events.push_back(std::move(changed));
    return commit(op);
}

// ===================================================================
// Contributions
// ===================================================================

core::Result<void> CampaignEngine::contribute(const AccountId& caller,
                                              CampaignId id, Amount amount) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    if (!caller.is_valid()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "invalid contributor account");
    }
    Campaign* c = CFUND_TRY(registry_.must_exist(id));
    CFUND_TRY_VOID(require_open(*c, clock_.now()));
    CFUND_TRY_VOID(check_contribution_bounds(*c, amount));
    {
        auto total = c->raised + amount;
        if (!total.ok()) return std::move(total).error();
    }

    const Asset asset = c->asset;
    auto pulled = gateway_.pull(asset, caller, amount);
    if (!pulled.ok()) {
        LOG_DEBUG(core::LogCategory::LEDGER,
                  "pull for " + tag(id) + " failed: " +
                      pulled.error().message());
        return core::make_error(core::ErrorCode::TRANSFER_FAILED,
                                "pull from " + caller.str() + ": " +
                                    pulled.error().message());
    }

    // The gateway may have re-entered the engine while pulling, so the
    // lifecycle checks run again against the current state.
    Operation op("contribution to " + tag(id));
    core::Result<void> staged = require_open(*c, clock_.now());
    if (staged.ok() && c->asset != asset) {
        staged = core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                  tag(id) + " funding asset changed");
    }
    if (staged.ok()) {
        staged = stage_contribution(op, *c, caller, amount);
    }
    if (!staged.ok()) {
        op.undo.rollback();
        return_pulled(asset, caller, amount);
        return staged;
    }

    auto committed = commit(op);
    if (!committed.ok()) {
        return_pulled(asset, caller, amount);
        return committed;
    }

    LOG_INFO(core::LogCategory::LEDGER,
             tag(id) + ": " + caller.str() + " contributed " +
                 amount.to_string() + ", raised " + c->raised.to_string() +
                 "/" + c->goal.to_string());
    if (c->completed) {
        LOG_INFO(core::LogCategory::LIFECYCLE, tag(id) + " funded");
    }
    return core::make_ok();
}

// ===================================================================
// Lifecycle
// ===================================================================

core::Result<void> CampaignEngine::modify_goal(const AccountId& caller,
                                               CampaignId id,
                                               Amount new_goal) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    CFUND_TRY_VOID(campaign::modify_goal(*c, new_goal, clock_.now()));

    Operation op("modify goal of " + tag(id));
    Event modified = make_event(EventKind::GOAL_MODIFIED, id);
    modified.amount = new_goal;
    op.events.push_back(std::move(modified));
    return commit(op);
}

core::Result<void> CampaignEngine::extend_deadline(const AccountId& caller,
                                                   CampaignId id,
                                                   int64_t extra_days) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    const int64_t deadline = CFUND_TRY(campaign::extend_deadline(
        *c, extra_days, settings_.max_duration_days));

    Operation op("extend " + tag(id));
    Event extended = make_event(EventKind::DEADLINE_EXTENDED, id);
    extended.detail = core::format_iso8601(deadline);
    op.events.push_back(std::move(extended));
    return commit(op);
}

core::Result<uint64_t> CampaignEngine::cancel_campaign(
    const AccountId& caller, CampaignId id) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));

    Operation op("cancel " + tag(id));
    const Amount raised_before = c->raised;
    CFUND_TRY_VOID(mark_cancelled(*c, op.undo));

    Event cancelled = make_event(EventKind::CAMPAIGN_CANCELLED, id);
    cancelled.amount = raised_before;
    op.events.push_back(std::move(cancelled));

    const SweepBatch batch = CFUND_TRY(
        sweep_refunds(*c, ledger_, settings_.sweep_batch_size, op.undo));
    stage_refunds(op, *c, batch);
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::LIFECYCLE,
             tag(id) + " cancelled by " + caller.str() + ", refunded " +
                 std::to_string(batch.refunds.size()) + " contributors, " +
                 std::to_string(batch.remaining) + " pending");
    return batch.remaining;
}

core::Result<uint64_t> CampaignEngine::continue_refund_sweep(
    const AccountId& caller, CampaignId id, size_t max_entries) {
    LOCK(mutex_);
    Campaign* c = CFUND_TRY(registry_.must_exist(id));
    if (!c->cancelled) {
        return core::make_error(core::ErrorCode::REFUNDS_UNAVAILABLE,
                                tag(id) + " is not cancelled");
    }
    if (sweep_remaining(*c, ledger_) == 0) return uint64_t{0};

    Operation op("refund sweep of " + tag(id));
    const SweepBatch batch =
        CFUND_TRY(sweep_refunds(*c, ledger_, max_entries, op.undo));
    stage_refunds(op, *c, batch);
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::REFUND,
             tag(id) + " sweep by " + caller.str() + ": " +
                 std::to_string(batch.refunds.size()) + " refunds, " +
                 std::to_string(batch.remaining) + " pending");
    return batch.remaining;
}

// ===================================================================
// Refunds
// ===================================================================

core::Result<void> CampaignEngine::enable_refunds(const AccountId& caller,
                                                  CampaignId id) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    const bool changed = CFUND_TRY(campaign::enable_refunds(*c));
    if (!changed) return core::make_ok();

    Operation op("enable refunds of " + tag(id));
    op.events.push_back(make_event(EventKind::REFUNDS_ENABLED, id));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::REFUND, tag(id) + " refunds enabled");
    return core::make_ok();
}

core::Result<Amount> CampaignEngine::request_refund(const AccountId& caller,
                                                    CampaignId id) {
    LOCK(mutex_);
    Campaign* c = CFUND_TRY(registry_.must_exist(id));

    Operation op("refund from " + tag(id));
    const Amount amount =
        CFUND_TRY(take_refund(*c, ledger_, caller, op.undo));
    if (!amount.is_zero()) {
        op.payouts.push_back(Payout{c->asset, caller, amount});
    }

    Event refunded = make_event(EventKind::REFUND, id);
    refunded.account = caller;
    refunded.amount = amount;
    op.events.push_back(std::move(refunded));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::REFUND,
             tag(id) + ": refunded " + amount.to_string() + " to " +
                 caller.str());
    return amount;
}

// ===================================================================
// Withdrawals and milestones
// ===================================================================

core::Result<void> CampaignEngine::configure_withdrawals(
    const AccountId& caller, CampaignId id,
    const WithdrawalSettings& settings) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));
    CFUND_TRY_VOID(campaign::configure_withdrawals(*c, settings));

    Operation op("configure withdrawals of " + tag(id));
    Event updated = make_event(EventKind::CAMPAIGN_UPDATED, id);
    updated.amount = settings.ceiling;
    updated.detail = settings.partial_enabled ? "withdrawals=on"
                                              : "withdrawals=off";
    op.events.push_back(std::move(updated));
    return commit(op);
}

core::Result<FeeSplit> CampaignEngine::withdraw_partial_funds(
    const AccountId& caller, CampaignId id, Amount amount) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));

    Operation op("partial withdrawal from " + tag(id));
    const FeeSplit split = CFUND_TRY(withdraw_partial(
        *c, amount, clock_.now(), settings_.fee_bps, op.undo));
    add_fee_payouts(op, *c, split);

    Event withdrawn = make_event(EventKind::PARTIAL_WITHDRAWAL, id);
    withdrawn.account = c->creator;
    withdrawn.amount = split.gross;
    withdrawn.fee = split.fee;
    op.events.push_back(std::move(withdrawn));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::WITHDRAW,
             tag(id) + ": partial withdrawal " + split.gross.to_string() +
                 " (fee " + split.fee.to_string() + "), withdrawn " +
                 c->withdrawal.total_withdrawn.to_string());
    return split;
}

core::Result<FeeSplit> CampaignEngine::withdraw_surplus(
    const AccountId& caller, CampaignId id) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));

    Operation op("surplus withdrawal from " + tag(id));
    const FeeSplit split =
        CFUND_TRY(campaign::withdraw_surplus(*c, settings_.fee_bps, op.undo));
    add_fee_payouts(op, *c, split);

    Event withdrawn = make_event(EventKind::SURPLUS_WITHDRAWN, id);
    withdrawn.account = c->creator;
    withdrawn.amount = split.gross;
    withdrawn.fee = split.fee;
    op.events.push_back(std::move(withdrawn));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::WITHDRAW,
             tag(id) + ": surplus " + split.gross.to_string() + " (fee " +
                 split.fee.to_string() + ")");
    return split;
}

core::Result<size_t> CampaignEngine::add_milestone(const AccountId& caller,
                                                   CampaignId id,
                                                   Amount amount,
                                                   std::string description) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));

    Operation op("add milestone to " + tag(id));
    Event added = make_event(EventKind::MILESTONE_ADDED, id);
    added.amount = amount;
    added.detail = description;

    const size_t index = CFUND_TRY(campaign::add_milestone(
        *c, amount, std::move(description), settings_.max_milestones));
    op.events.push_back(std::move(added));
    CFUND_TRY_VOID(commit(op));
    return index;
}

core::Result<FeeSplit> CampaignEngine::complete_milestone(
    const AccountId& caller, CampaignId id, size_t index) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_running());
    Campaign* c = CFUND_TRY(creator_campaign(caller, id));

    Operation op("milestone " + std::to_string(index) + " of " + tag(id));
    const FeeSplit split = CFUND_TRY(campaign::complete_milestone(
        *c, index, settings_.fee_bps, op.undo));
    add_fee_payouts(op, *c, split);

    Event completed = make_event(EventKind::MILESTONE_COMPLETED, id);
    completed.account = c->creator;
    completed.amount = split.gross;
    completed.fee = split.fee;
    completed.detail = c->milestones[index].description;
    op.events.push_back(std::move(completed));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::WITHDRAW,
             tag(id) + ": milestone " + std::to_string(index) +
                 " released " + split.gross.to_string());
    return split;
}

// ===================================================================
// Platform administration
// ===================================================================

core::Result<void> CampaignEngine::verify_campaign(const AccountId& caller,
                                                   CampaignId id,
                                                   bool verified) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_platform_owner(caller));
    Campaign* c = CFUND_TRY(registry_.must_exist(id));
    c->verified = verified;

    Operation op("verify " + tag(id));
    Event e = make_event(EventKind::CAMPAIGN_VERIFIED, id);
    e.detail = verified ? "true" : "false";
    op.events.push_back(std::move(e));
    return commit(op);
}

core::Result<void> CampaignEngine::promote_campaign(const AccountId& caller,
                                                    CampaignId id,
                                                    bool promoted) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_platform_owner(caller));
    Campaign* c = CFUND_TRY(registry_.must_exist(id));
    c->promoted = promoted;

    Operation op("promote " + tag(id));
    Event e = make_event(EventKind::CAMPAIGN_PROMOTED, id);
    e.detail = promoted ? "true" : "false";
    op.events.push_back(std::move(e));
    return commit(op);
}

core::Result<void> CampaignEngine::set_platform_fee(const AccountId& caller,
                                                    uint32_t bps) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_platform_owner(caller));
    if (bps > settings_.max_fee_bps) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "fee " + std::to_string(bps) +
                                    " bps above maximum " +
                                    std::to_string(settings_.max_fee_bps));
    }
    const uint32_t previous = settings_.fee_bps;
    settings_.fee_bps = bps;

    Operation op("set platform fee");
    Event e = make_event(EventKind::PLATFORM_FEE_CHANGED, INVALID_CAMPAIGN);
    e.account = caller;
    e.amount = Amount(bps);
    e.detail = "previous=" + std::to_string(previous);
    op.events.push_back(std::move(e));
    CFUND_TRY_VOID(commit(op));

    LOG_INFO(core::LogCategory::CONFIG,
             "platform fee " + std::to_string(previous) + " -> " +
                 std::to_string(bps) + " bps");
    return core::make_ok();
}

core::Result<void> CampaignEngine::set_fee_recipient(
    const AccountId& caller, const AccountId& recipient) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_platform_owner(caller));
    if (!recipient.is_valid()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "invalid fee recipient");
    }
    LOG_INFO(core::LogCategory::CONFIG,
             "fee recipient " + settings_.fee_recipient.str() + " -> " +
                 recipient.str());
    settings_.fee_recipient = recipient;
    return core::make_ok();
}

core::Result<void> CampaignEngine::set_token_allowed(
    const AccountId& caller, const std::string& token_id, bool allowed) {
    LOCK(mutex_);
    CFUND_TRY_VOID(require_platform_owner(caller));
    if (token_id.empty()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "empty token id");
    }
    if (allowed) {
        settings_.allowed_tokens.insert(token_id);
    } else {
        settings_.allowed_tokens.erase(token_id);
    }
    LOG_INFO(core::LogCategory::CONFIG,
             "token " + token_id + (allowed ? " allowed" : " disallowed"));
    return core::make_ok();
}

// ===================================================================
// Queries
// ===================================================================

core::Result<CampaignSummary> CampaignEngine::summary(CampaignId id) const {
    LOCK(mutex_);
    const Campaign* c = CFUND_TRY(registry_.must_exist(id));

    CampaignSummary s;
    s.campaign = *c;
    s.state = c->state(clock_.now());
    s.custody = c->custody_balance();
    s.contributors = ledger_.roster(id).size();
    s.sweep_remaining = c->cancelled ? sweep_remaining(*c, ledger_) : 0;
    return s;
}

core::Result<Amount> CampaignEngine::contribution_of(
    CampaignId id, const AccountId& who) const {
    LOCK(mutex_);
    CFUND_TRY_VOID(registry_.must_exist(id));
    return ledger_.contribution_of(id, who);
}

core::Result<std::vector<AccountId>> CampaignEngine::contributors(
    CampaignId id) const {
    LOCK(mutex_);
    CFUND_TRY_VOID(registry_.must_exist(id));
    return ledger_.roster(id);
}

std::vector<CampaignId> CampaignEngine::campaigns_of(
    const AccountId& owner) const {
    LOCK(mutex_);
    return registry_.campaigns_of(owner);
}

std::vector<CampaignId> CampaignEngine::select(
    bool (*pred)(const Campaign&, int64_t)) const {
    LOCK(mutex_);
    const int64_t now = clock_.now();
    std::vector<CampaignId> out;
    for (const auto& c : registry_.all()) {
        if (pred(c, now)) out.push_back(c.id);
    }
    return out;
}

std::vector<CampaignId> CampaignEngine::active_campaigns() const {
    return select([](const Campaign& c, int64_t now) {
        return c.state(now) == CampaignState::OPEN;
    });
}

std::vector<CampaignId> CampaignEngine::successful_campaigns() const {
    return select([](const Campaign& c, int64_t) { return c.is_funded(); });
}

std::vector<CampaignId> CampaignEngine::verified_campaigns() const {
    return select([](const Campaign& c, int64_t) { return c.verified; });
}

std::vector<CampaignId> CampaignEngine::promoted_campaigns() const {
    return select([](const Campaign& c, int64_t now) {
        return c.promoted && c.state(now) == CampaignState::OPEN;
    });
}

uint64_t CampaignEngine::campaign_count() const {
    LOCK(mutex_);
    return registry_.count();
}

uint32_t CampaignEngine::platform_fee_bps() const {
    LOCK(mutex_);
    return settings_.fee_bps;
}

AccountId CampaignEngine::fee_recipient() const {
    LOCK(mutex_);
    return settings_.fee_recipient;
}

bool CampaignEngine::is_token_allowed(const std::string& token_id) const {
    LOCK(mutex_);
    return settings_.allowed_tokens.count(token_id) != 0;
}

// ===================================================================
// Journal
// ===================================================================

crypto::Hash256 CampaignEngine::journal_head() const {
    LOCK(mutex_);
    return journal_.head();
}

std::vector<Event> CampaignEngine::events() const {
    LOCK(mutex_);
    return journal_.events();
}

std::vector<Event> CampaignEngine::events_for(CampaignId id) const {
    LOCK(mutex_);
    return journal_.events_for(id);
}

bool CampaignEngine::verify_journal() const {
    LOCK(mutex_);
    return journal_.verify();
}

CallbackId CampaignEngine::subscribe(EventCallback callback) {
    return journal_.subscribe(std::move(callback));
}

void CampaignEngine::unsubscribe(CallbackId id) {
    journal_.unsubscribe(id);
}

// ===================================================================
// Persistence
// ===================================================================

core::Result<void> CampaignEngine::save_snapshot(
    const std::filesystem::path& path) const {
    LOCK(mutex_);
    return write_snapshot(path, settings_, registry_, ledger_);
}

core::Result<void> CampaignEngine::load_snapshot(
    const std::filesystem::path& path) {
    LOCK(mutex_);
    if (mutex_.depth() > 1) {
        return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                "cannot load a snapshot inside an operation");
    }

    SnapshotState state = CFUND_TRY(read_snapshot(path));
    if (state.settings.fee_bps > settings_.max_fee_bps) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "snapshot fee " +
                                    std::to_string(state.settings.fee_bps) +
                                    " bps above configured maximum");
    }

    const size_t count = state.campaigns.size();
    registry_.restore(std::move(state.campaigns), std::move(state.owned));
    ledger_.restore(std::move(state.books));
    settings_.fee_bps = state.settings.fee_bps;
    settings_.fee_recipient = std::move(state.settings.fee_recipient);
    settings_.allowed_tokens = std::move(state.settings.allowed_tokens);

    LOG_INFO(core::LogCategory::STORAGE,
             "loaded " + std::to_string(count) + " campaigns from " +
                 path.string());
    return core::make_ok();
}

} // namespace campaign
