// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// End-to-end tests for CampaignEngine running against the in-memory
// custody, the owner access gate and a mocked clock.

#include "test_framework.h"

#include "campaign/access.h"
#include "campaign/custody.h"
#include "campaign/engine.h"
#include "core/time.h"

#include <cstdint>
#include <string>
#include <vector>

using campaign::CampaignEngine;
using campaign::CampaignId;
using campaign::CampaignState;
using campaign::EventKind;
using primitives::AccountId;
using primitives::Amount;
using primitives::Asset;

namespace {

constexpr int64_t NOW = 1'700'000'000;
constexpr int64_t DAY = core::SECONDS_PER_DAY;

const AccountId ADMIN("admin");
const AccountId ALICE("alice");
const AccountId BOB("bob");
const AccountId CAROL("carol");
const AccountId DAVE("dave");
const AccountId ERIN("erin");
const AccountId PLATFORM("platform");

const Asset NATIVE = Asset::native();

struct Harness {
    explicit Harness(campaign::PlatformSettings settings = {})
        : gate(ADMIN), engine(std::move(settings), custody, gate, clock) {
        core::MockableClock::set_mock_time(NOW);
    }
    ~Harness() { core::MockableClock::set_mock_time(0); }

    CampaignId create(int64_t goal = 1000, int64_t max = 1000,
                      const AccountId& creator = ALICE) {
        campaign::CampaignParams p;
        p.goal = Amount(goal);
        p.min_contribution = Amount(10);
        p.max_contribution = Amount(max);
        p.duration_days = 30;
        p.metadata.title = "solar roof";
        auto id = engine.create_campaign(creator, p);
        CHECK_OK(id);
        return id.value_or(campaign::INVALID_CAMPAIGN);
    }

    void fund_wallet(const AccountId& who, int64_t amount,
                     const Asset& asset = NATIVE) {
        custody.deposit(asset, who, Amount(amount));
    }

    Amount wallet(const AccountId& who) const {
        return custody.wallet_balance(NATIVE, who);
    }

    campaign::CampaignSummary summary(CampaignId id) const {
        auto s = engine.summary(id);
        CHECK_OK(s);
        return s.ok() ? s.value() : campaign::CampaignSummary{};
    }

    /// Sum of every campaign's custody balance.
    Amount booked() const {
        Amount total;
        for (CampaignId id = 1; id <= engine.campaign_count(); ++id) {
            total += summary(id).custody;
        }
        return total;
    }

    std::vector<EventKind> kinds() const {
        std::vector<EventKind> out;
        for (const auto& e : engine.events()) out.push_back(e.kind);
        return out;
    }

    campaign::InMemoryCustody custody;
    campaign::OwnerAccessGate gate;
    campaign::SystemClock clock;
    CampaignEngine engine;
};

} // anonymous namespace

// ============================================================================
// Registry operations
// ============================================================================

TEST_CASE(Engine, create_and_query) {
    Harness h;
    const CampaignId id = h.create();
    CHECK_EQ(id, 1u);
    CHECK_EQ(h.engine.campaign_count(), 1u);

    auto s = h.summary(id);
    CHECK(s.state == CampaignState::OPEN);
    CHECK_EQ(s.campaign.creator, ALICE);
    CHECK_EQ(s.campaign.deadline, NOW + 30 * DAY);
    CHECK(s.custody.is_zero());
    CHECK_EQ(s.contributors, 0u);

    CHECK_EQ(h.engine.campaigns_of(ALICE).size(), 1u);
    CHECK_EQ(h.engine.active_campaigns().size(), 1u);
    CHECK(h.engine.successful_campaigns().empty());

    auto events = h.engine.events();
    CHECK_EQ(events.size(), 1u);
    CHECK(events[0].kind == EventKind::CAMPAIGN_CREATED);
    CHECK_EQ(events[0].campaign, id);

    CHECK_EQ(h.engine.summary(7).code(), core::ErrorCode::CAMPAIGN_NOT_FOUND);
    CHECK_EQ(h.engine.contributors(7).code(),
             core::ErrorCode::CAMPAIGN_NOT_FOUND);
}

TEST_CASE(Engine, update_metadata_and_category) {
    Harness h;
    const CampaignId id = h.create();

    campaign::CampaignMetadata update;
    update.description = "panels for the library";
    CHECK_EQ(h.engine.update_campaign(BOB, id, update).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.update_campaign(ALICE, id, update));
    CHECK_OK(h.engine.set_category(ALICE, id, "energy"));

    auto s = h.summary(id);
    CHECK_EQ(s.campaign.metadata.title, "solar roof");
    CHECK_EQ(s.campaign.metadata.description, "panels for the library");
    CHECK_EQ(s.campaign.category, "energy");
    CHECK_EQ(h.engine.events_for(id).size(), 3u);
}

TEST_CASE(Engine, ownership_transfer) {
    Harness h;
    const CampaignId id = h.create();

    CHECK_EQ(h.engine.transfer_campaign_ownership(BOB, id, BOB).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.transfer_campaign_ownership(ALICE, id, BOB));

    CHECK(h.engine.campaigns_of(ALICE).empty());
    CHECK_EQ(h.engine.campaigns_of(BOB).size(), 1u);
    CHECK_EQ(h.engine.cancel_campaign(ALICE, id).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.cancel_campaign(BOB, id));
}

TEST_CASE(Engine, token_campaigns_need_allowlist) {
    Harness h;
    const Asset usdc = Asset::token("usdc");

    campaign::CampaignParams p;
    p.goal = Amount(1000);
    p.min_contribution = Amount(10);
    p.max_contribution = Amount(1000);
    p.duration_days = 30;
    p.metadata.title = "token drive";
    p.asset = usdc;

    CHECK_EQ(h.engine.create_campaign(ALICE, p).code(),
             core::ErrorCode::INVALID_PARAMETERS);
    CHECK_EQ(h.engine.set_token_allowed(CAROL, "usdc", true).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.set_token_allowed(ADMIN, "usdc", true));
    CHECK(h.engine.is_token_allowed("usdc"));

    const CampaignId id = h.engine.create_campaign(ALICE, p).value();
    h.fund_wallet(CAROL, 500, usdc);
    h.fund_wallet(CAROL, 500);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(200)));

    CHECK_EQ(h.custody.wallet_balance(usdc, CAROL), Amount(300));
    CHECK_EQ(h.wallet(CAROL), Amount(500));
    CHECK_EQ(h.custody.held(usdc), Amount(200));
    CHECK(h.custody.held(NATIVE).is_zero());
}

TEST_CASE(Engine, change_funding_asset_before_contributions) {
    Harness h;
    CHECK_OK(h.engine.set_token_allowed(ADMIN, "usdc", true));
    const CampaignId fresh = h.create();
    const CampaignId backed = h.create();

    CHECK_EQ(h.engine.change_funding_asset(ALICE, fresh,
                                           Asset::token("dai")).code(),
             core::ErrorCode::INVALID_PARAMETERS);
    CHECK_OK(h.engine.change_funding_asset(ALICE, fresh,
                                           Asset::token("usdc")));
    CHECK(h.summary(fresh).campaign.asset.is_token());

    h.fund_wallet(CAROL, 100);
    CHECK_OK(h.engine.contribute(CAROL, backed, Amount(50)));
    CHECK_EQ(h.engine.change_funding_asset(ALICE, backed,
                                           Asset::token("usdc")).code(),
             core::ErrorCode::INVALID_PARAMETERS);
}

// ============================================================================
// Contributions and the success payout
// ============================================================================

TEST_CASE(Engine, contribute_moves_value_into_custody) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 500);

    CHECK_OK(h.engine.contribute(CAROL, id, Amount(200)));
    CHECK_EQ(h.wallet(CAROL), Amount(300));
    CHECK_EQ(h.custody.held(NATIVE), Amount(200));
    CHECK_EQ(h.engine.contribution_of(id, CAROL).value(), Amount(200));

    auto s = h.summary(id);
    CHECK_EQ(s.campaign.raised, Amount(200));
    CHECK_EQ(s.campaign.backer_count, 1u);
    CHECK_EQ(s.custody, Amount(200));
    CHECK_EQ(h.booked(), h.custody.held(NATIVE));
}

TEST_CASE(Engine, contribution_rejections_leave_no_trace) {
    Harness h;
    const CampaignId id = h.create(1000, 500);
    h.fund_wallet(CAROL, 1000);

    CHECK_EQ(h.engine.contribute(CAROL, id, Amount(5)).code(),
             core::ErrorCode::CONTRIBUTION_OUT_OF_BOUNDS);
    CHECK_EQ(h.engine.contribute(CAROL, id, Amount(501)).code(),
             core::ErrorCode::CONTRIBUTION_OUT_OF_BOUNDS);
    CHECK_EQ(h.engine.contribute(CAROL, 9, Amount(50)).code(),
             core::ErrorCode::CAMPAIGN_NOT_FOUND);
    CHECK_EQ(h.engine.contribute(AccountId(), id, Amount(50)).code(),
             core::ErrorCode::INVALID_PARAMETERS);

    // DAVE has no funds, so the pull fails.
    CHECK_EQ(h.engine.contribute(DAVE, id, Amount(50)).code(),
             core::ErrorCode::TRANSFER_FAILED);

    CHECK_EQ(h.wallet(CAROL), Amount(1000));
    CHECK(h.custody.held(NATIVE).is_zero());
    CHECK(h.summary(id).campaign.raised.is_zero());
    CHECK(h.engine.contributors(id).value().empty());
    CHECK_EQ(h.engine.events().size(), 1u);

    core::MockableClock::advance(31 * DAY);
    CHECK_EQ(h.engine.contribute(CAROL, id, Amount(50)).code(),
             core::ErrorCode::DEADLINE_PASSED);
    CHECK(h.summary(id).state == CampaignState::EXPIRED);
    CHECK(h.engine.active_campaigns().empty());
}

TEST_CASE(Engine, goal_reached_pays_creator_and_platform) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 600);
    h.fund_wallet(DAVE, 600);

    CHECK_OK(h.engine.contribute(CAROL, id, Amount(600)));
    CHECK_OK(h.engine.contribute(DAVE, id, Amount(500)));

    // Release the goal: fee 25, net 975.  The surplus stays in custody.
    CHECK_EQ(h.wallet(ALICE), Amount(975));
    CHECK_EQ(h.wallet(PLATFORM), Amount(25));
    CHECK_EQ(h.custody.held(NATIVE), Amount(100));
    CHECK_EQ(h.booked(), h.custody.held(NATIVE));

    auto s = h.summary(id);
    CHECK(s.state == CampaignState::FUNDED);
    CHECK_EQ(s.campaign.released, Amount(1000));
    CHECK_EQ(s.campaign.fees_paid, Amount(25));
    CHECK_EQ(h.engine.successful_campaigns().size(), 1u);

    auto kinds = h.kinds();
    CHECK_EQ(kinds.size(), 5u);
    CHECK(kinds[1] == EventKind::CONTRIBUTION);
    CHECK(kinds[2] == EventKind::CONTRIBUTION);
    CHECK(kinds[3] == EventKind::GOAL_REACHED);
    CHECK(kinds[4] == EventKind::PAYOUT);
    auto payout = h.engine.events().back();
    CHECK_EQ(payout.account, ALICE);
    CHECK_EQ(payout.amount, Amount(975));
    CHECK_EQ(payout.fee, Amount(25));

    CHECK_EQ(h.engine.contribute(DAVE, id, Amount(50)).code(),
             core::ErrorCode::CAMPAIGN_CLOSED);
    CHECK_EQ(h.wallet(DAVE), Amount(100));

    // Surplus of 100: fee 2, net 98.
    auto surplus = h.engine.withdraw_surplus(ALICE, id);
    CHECK_OK(surplus);
    CHECK_EQ(surplus.value().fee, Amount(2));
    CHECK_EQ(h.wallet(ALICE), Amount(1073));
    CHECK_EQ(h.wallet(PLATFORM), Amount(27));
    CHECK(h.custody.held(NATIVE).is_zero());
    CHECK_EQ(h.engine.withdraw_surplus(ALICE, id).code(),
             core::ErrorCode::NO_EXCESS);
}

TEST_CASE(Engine, failed_payout_rolls_back_contribution) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 1000);

    h.custody.fail_next_settlements(1);
    CHECK_EQ(h.engine.contribute(CAROL, id, Amount(1000)).code(),
             core::ErrorCode::TRANSFER_FAILED);

    // The pulled value went back and nothing was booked.
    CHECK_EQ(h.wallet(CAROL), Amount(1000));
    CHECK(h.custody.held(NATIVE).is_zero());
    auto s = h.summary(id);
    CHECK(s.state == CampaignState::OPEN);
    CHECK(s.campaign.raised.is_zero());
    CHECK_EQ(s.campaign.backer_count, 0u);
    CHECK(h.engine.contributors(id).value().empty());
    CHECK_EQ(h.engine.events().size(), 1u);
    CHECK(h.engine.verify_journal());

    CHECK_OK(h.engine.contribute(CAROL, id, Amount(1000)));
    CHECK(h.summary(id).state == CampaignState::FUNDED);
    CHECK_EQ(h.wallet(ALICE), Amount(975));
}

TEST_CASE(Engine, rejected_recipient_aborts_whole_batch) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 1000);

    h.custody.reject_recipient(ALICE);
    CHECK_EQ(h.engine.contribute(CAROL, id, Amount(1000)).code(),
             core::ErrorCode::TRANSFER_FAILED);
    CHECK(h.wallet(PLATFORM).is_zero());
    CHECK_EQ(h.wallet(CAROL), Amount(1000));

    // Only the return of the pulled value was ever paid out.
    auto history = h.custody.history();
    CHECK_EQ(history.size(), 1u);
    CHECK_EQ(history[0].recipient, CAROL);
    CHECK_EQ(history[0].amount, Amount(1000));

    h.custody.reject_recipient(ALICE, false);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(1000)));
    CHECK_EQ(h.wallet(PLATFORM), Amount(25));
}

// ============================================================================
// Refunds and cancellation
// ============================================================================

TEST_CASE(Engine, refund_flow) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 500);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(300)));

    CHECK_EQ(h.engine.request_refund(CAROL, id).code(),
             core::ErrorCode::REFUNDS_UNAVAILABLE);
    CHECK_EQ(h.engine.enable_refunds(CAROL, id).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.enable_refunds(ALICE, id));

    auto refunded = h.engine.request_refund(CAROL, id);
    CHECK_OK(refunded);
    CHECK_EQ(refunded.value(), Amount(300));
    CHECK_EQ(h.wallet(CAROL), Amount(500));
    CHECK(h.custody.held(NATIVE).is_zero());
    CHECK_EQ(h.engine.request_refund(CAROL, id).code(),
             core::ErrorCode::NO_CONTRIBUTION);
    CHECK_EQ(h.engine.request_refund(DAVE, id).code(),
             core::ErrorCode::NO_CONTRIBUTION);

    // Still open: CAROL may back it again without a second roster entry.
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(100)));
    CHECK_EQ(h.engine.contributors(id).value().size(), 1u);
    CHECK_EQ(h.booked(), h.custody.held(NATIVE));
}

TEST_CASE(Engine, refund_after_expiry) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 500);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(400)));

    core::MockableClock::advance(30 * DAY);
    CHECK(h.summary(id).state == CampaignState::EXPIRED);
    CHECK_OK(h.engine.enable_refunds(ALICE, id));
    CHECK_EQ(h.engine.request_refund(CAROL, id).value(), Amount(400));
    CHECK_EQ(h.wallet(CAROL), Amount(500));
}

TEST_CASE(Engine, cancel_refunds_everyone) {
    Harness h;
    const CampaignId id = h.create();
    for (const auto& who : {CAROL, DAVE, ERIN}) {
        h.fund_wallet(who, 300);
        CHECK_OK(h.engine.contribute(who, id, Amount(100)));
    }

    CHECK_EQ(h.engine.cancel_campaign(BOB, id).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_EQ(h.engine.cancel_campaign(ALICE, id).value(), 0u);

    for (const auto& who : {CAROL, DAVE, ERIN}) {
        CHECK_EQ(h.wallet(who), Amount(300));
    }
    CHECK(h.custody.held(NATIVE).is_zero());
    auto s = h.summary(id);
    CHECK(s.state == CampaignState::CANCELLED);
    CHECK(s.campaign.raised.is_zero());
    CHECK_EQ(s.sweep_remaining, 0u);

    // CAMPAIGN_CANCELLED followed by one refund per contributor.
    auto events = h.engine.events_for(id);
    CHECK_EQ(events.size(), 8u);
    CHECK(events[4].kind == EventKind::CAMPAIGN_CANCELLED);
    CHECK_EQ(events[4].amount, Amount(300));
    CHECK(events[7].kind == EventKind::REFUND);
    CHECK_EQ(events[7].account, ERIN);

    CHECK_EQ(h.engine.cancel_campaign(ALICE, id).code(),
             core::ErrorCode::CAMPAIGN_CLOSED);
    CHECK_EQ(h.engine.request_refund(CAROL, id).code(),
             core::ErrorCode::REFUNDS_UNAVAILABLE);
}

TEST_CASE(Engine, cancel_sweeps_in_batches) {
    campaign::PlatformSettings settings;
    settings.sweep_batch_size = 2;
    Harness h(settings);
    const CampaignId id = h.create();
    const std::vector<AccountId> backers = {
        AccountId("b1"), AccountId("b2"), AccountId("b3"),
        AccountId("b4"), AccountId("b5")};
    for (const auto& who : backers) {
        h.fund_wallet(who, 20);
        CHECK_OK(h.engine.contribute(who, id, Amount(20)));
    }

    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 0).code(),
             core::ErrorCode::REFUNDS_UNAVAILABLE);

    CHECK_EQ(h.engine.cancel_campaign(ALICE, id).value(), 3u);
    CHECK_EQ(h.summary(id).sweep_remaining, 3u);
    CHECK_EQ(h.wallet(backers[1]), Amount(20));
    CHECK(h.wallet(backers[2]).is_zero());
    CHECK_EQ(h.custody.held(NATIVE), Amount(60));
    CHECK_EQ(h.booked(), h.custody.held(NATIVE));

    // Anyone may push the sweep forward.
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 2).value(), 1u);
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 0).value(), 0u);
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 0).value(), 0u);

    for (const auto& who : backers) {
        CHECK_EQ(h.wallet(who), Amount(20));
    }
    CHECK(h.custody.held(NATIVE).is_zero());
    CHECK_EQ(h.summary(id).sweep_remaining, 0u);
}

TEST_CASE(Engine, unbounded_sweep_finishes_pending_refunds) {
    campaign::PlatformSettings settings;
    settings.sweep_batch_size = 1;
    Harness h(settings);
    const CampaignId id = h.create();
    for (const auto& who : {CAROL, DAVE, ERIN}) {
        h.fund_wallet(who, 10);
        CHECK_OK(h.engine.contribute(who, id, Amount(10)));
    }

    CHECK_EQ(h.engine.cancel_campaign(ALICE, id).value(), 2u);
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, SIZE_MAX).value(), 0u);
    for (const auto& who : {CAROL, DAVE, ERIN}) {
        CHECK_EQ(h.wallet(who), Amount(10));
    }
    CHECK_EQ(h.summary(id).sweep_remaining, 0u);
    CHECK(h.custody.held(NATIVE).is_zero());
}

TEST_CASE(Engine, failed_sweep_keeps_cursor) {
    campaign::PlatformSettings settings;
    settings.sweep_batch_size = 1;
    Harness h(settings);
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 50);
    h.fund_wallet(DAVE, 50);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(50)));
    CHECK_OK(h.engine.contribute(DAVE, id, Amount(50)));
    CHECK_EQ(h.engine.cancel_campaign(ALICE, id).value(), 1u);

    h.custody.reject_recipient(DAVE);
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 0).code(),
             core::ErrorCode::TRANSFER_FAILED);
    CHECK_EQ(h.summary(id).sweep_remaining, 1u);
    CHECK_EQ(h.engine.contribution_of(id, DAVE).value(), Amount(50));

    h.custody.reject_recipient(DAVE, false);
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 0).value(), 0u);
    CHECK_EQ(h.wallet(DAVE), Amount(50));
}

// ============================================================================
// Re-entrant gateways
// ============================================================================

TEST_CASE(Engine, reentrant_refund_pays_once) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 400);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(400)));
    CHECK_OK(h.engine.enable_refunds(ALICE, id));

    bool fired = false;
    core::ErrorCode nested = core::ErrorCode::NONE;
    h.custody.set_payout_hook([&](const campaign::Payout& p) {
        if (fired || p.recipient != CAROL) return;
        fired = true;
        nested = h.engine.request_refund(CAROL, id).code();
    });

    CHECK_EQ(h.engine.request_refund(CAROL, id).value(), Amount(400));
    CHECK(fired);
    CHECK_EQ(nested, core::ErrorCode::NO_CONTRIBUTION);
    CHECK_EQ(h.wallet(CAROL), Amount(400));
    CHECK(h.custody.held(NATIVE).is_zero());
}

TEST_CASE(Engine, reentrant_contribution_during_payout) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 1000);
    h.fund_wallet(DAVE, 100);

    bool fired = false;
    core::ErrorCode nested = core::ErrorCode::NONE;
    h.custody.set_payout_hook([&](const campaign::Payout& p) {
        if (fired || p.recipient != ALICE) return;
        fired = true;
        nested = h.engine.contribute(DAVE, id, Amount(100)).code();
    });

    CHECK_OK(h.engine.contribute(CAROL, id, Amount(1000)));
    CHECK(fired);
    CHECK_EQ(nested, core::ErrorCode::CAMPAIGN_CLOSED);
    CHECK_EQ(h.wallet(DAVE), Amount(100));
    CHECK_EQ(h.summary(id).campaign.raised, Amount(1000));
}

TEST_CASE(Engine, reentrant_sweep_refunds_each_backer_once) {
    campaign::PlatformSettings settings;
    settings.sweep_batch_size = 1;
    Harness h(settings);
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 70);
    h.fund_wallet(DAVE, 30);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(70)));
    CHECK_OK(h.engine.contribute(DAVE, id, Amount(30)));

    bool fired = false;
    h.custody.set_payout_hook([&](const campaign::Payout& p) {
        if (fired || p.recipient != CAROL) return;
        fired = true;
        CHECK_EQ(h.engine.continue_refund_sweep(ERIN, id, 0).value(), 0u);
    });

    CHECK_OK(h.engine.cancel_campaign(ALICE, id));
    CHECK(fired);
    CHECK_EQ(h.wallet(CAROL), Amount(70));
    CHECK_EQ(h.wallet(DAVE), Amount(30));
    CHECK(h.custody.held(NATIVE).is_zero());
    CHECK_EQ(h.summary(id).sweep_remaining, 0u);
    CHECK(h.engine.verify_journal());
}

TEST_CASE(Engine, load_refused_inside_operation) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 100);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(100)));
    CHECK_OK(h.engine.enable_refunds(ALICE, id));

    core::ErrorCode nested = core::ErrorCode::NONE;
    h.custody.set_payout_hook([&](const campaign::Payout&) {
        nested = h.engine.load_snapshot("/nonexistent/state.dat").code();
    });
    CHECK_OK(h.engine.request_refund(CAROL, id));
    CHECK_EQ(nested, core::ErrorCode::INTERNAL_ERROR);
}

// ============================================================================
// Withdrawals and milestones
// ============================================================================

TEST_CASE(Engine, partial_withdrawals) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 1000);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(400)));

    campaign::WithdrawalSettings policy{true, Amount(500), DAY};
    CHECK_EQ(h.engine.configure_withdrawals(BOB, id, policy).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.configure_withdrawals(ALICE, id, policy));

    auto first = h.engine.withdraw_partial_funds(ALICE, id, Amount(200));
    CHECK_OK(first);
    CHECK_EQ(first.value().fee, Amount(5));
    CHECK_EQ(h.wallet(ALICE), Amount(195));
    CHECK_EQ(h.wallet(PLATFORM), Amount(5));
    CHECK_EQ(h.custody.held(NATIVE), Amount(200));
    CHECK_EQ(h.booked(), h.custody.held(NATIVE));

    CHECK_EQ(h.engine.withdraw_partial_funds(ALICE, id, Amount(100)).code(),
             core::ErrorCode::INTERVAL_NOT_ELAPSED);
    core::MockableClock::advance(DAY);
    CHECK_EQ(h.engine.withdraw_partial_funds(ALICE, id, Amount(300)).code(),
             core::ErrorCode::INSUFFICIENT_FUNDS);
    CHECK_OK(h.engine.withdraw_partial_funds(ALICE, id, Amount(200)));

    core::MockableClock::advance(DAY);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(300)));
    CHECK_EQ(h.engine.withdraw_partial_funds(ALICE, id, Amount(150)).code(),
             core::ErrorCode::WITHDRAWAL_LIMIT_EXCEEDED);
    CHECK_EQ(h.summary(id).campaign.withdrawal.total_withdrawn, Amount(400));
    CHECK_EQ(h.engine.withdraw_partial_funds(CAROL, id, Amount(50)).code(),
             core::ErrorCode::UNAUTHORIZED);
}

TEST_CASE(Engine, milestones_hold_back_funds) {
    Harness h;
    const CampaignId id = h.create();
    CHECK_EQ(h.engine.add_milestone(ALICE, id, Amount(400), "permits").value(),
             0u);
    CHECK_EQ(h.engine.add_milestone(BOB, id, Amount(100), "x").code(),
             core::ErrorCode::UNAUTHORIZED);

    h.fund_wallet(CAROL, 1000);
    CHECK_EQ(h.engine.complete_milestone(ALICE, id, 0).code(),
             core::ErrorCode::CAMPAIGN_CLOSED);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(1000)));

    // 600 released at funding, 400 held for the milestone.
    CHECK_EQ(h.wallet(ALICE), Amount(585));
    CHECK_EQ(h.wallet(PLATFORM), Amount(15));
    CHECK_EQ(h.custody.held(NATIVE), Amount(400));

    auto done = h.engine.complete_milestone(ALICE, id, 0);
    CHECK_OK(done);
    CHECK_EQ(done.value().net, Amount(390));
    CHECK_EQ(h.wallet(ALICE), Amount(975));
    CHECK(h.custody.held(NATIVE).is_zero());
    CHECK(h.summary(id).campaign.milestones[0].completed);

    CHECK_EQ(h.engine.complete_milestone(ALICE, id, 0).code(),
             core::ErrorCode::INVALID_PARAMETERS);
    CHECK_EQ(h.engine.complete_milestone(ALICE, id, 1).code(),
             core::ErrorCode::INVALID_PARAMETERS);
}

TEST_CASE(Engine, goal_and_deadline_changes) {
    Harness h;
    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 500);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(500)));

    CHECK_EQ(h.engine.modify_goal(ALICE, id, Amount(400)).code(),
             core::ErrorCode::INVALID_PARAMETERS);
    CHECK_EQ(h.engine.modify_goal(BOB, id, Amount(2000)).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.modify_goal(ALICE, id, Amount(2000)));
    CHECK_EQ(h.summary(id).campaign.goal, Amount(2000));

    CHECK_OK(h.engine.extend_deadline(ALICE, id, 10));
    CHECK_EQ(h.summary(id).campaign.deadline, NOW + 40 * DAY);
    CHECK_EQ(h.engine.extend_deadline(ALICE, id, 0).code(),
             core::ErrorCode::INVALID_PARAMETERS);

    auto kinds = h.kinds();
    CHECK(kinds[kinds.size() - 2] == EventKind::GOAL_MODIFIED);
    CHECK(kinds.back() == EventKind::DEADLINE_EXTENDED);
}

// ============================================================================
// Platform administration and pause
// ============================================================================

TEST_CASE(Engine, platform_fee_administration) {
    Harness h;
    CHECK_EQ(h.engine.platform_fee_bps(), 250u);
    CHECK_EQ(h.engine.set_platform_fee(CAROL, 100).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_EQ(h.engine.set_platform_fee(ADMIN, 1001).code(),
             core::ErrorCode::INVALID_PARAMETERS);
    CHECK_OK(h.engine.set_platform_fee(ADMIN, 500));
    CHECK_EQ(h.engine.platform_fee_bps(), 500u);

    auto changed = h.engine.events().back();
    CHECK(changed.kind == EventKind::PLATFORM_FEE_CHANGED);
    CHECK_EQ(changed.campaign, campaign::INVALID_CAMPAIGN);

    const AccountId treasury("treasury");
    CHECK_EQ(h.engine.set_fee_recipient(CAROL, treasury).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.set_fee_recipient(ADMIN, treasury));
    CHECK_EQ(h.engine.fee_recipient(), treasury);

    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 1000);
    CHECK_OK(h.engine.contribute(CAROL, id, Amount(1000)));
    CHECK_EQ(h.wallet(treasury), Amount(50));
    CHECK_EQ(h.wallet(ALICE), Amount(950));
    CHECK(h.wallet(PLATFORM).is_zero());
}

TEST_CASE(Engine, listing_queries) {
    Harness h;
    const CampaignId a = h.create();
    const CampaignId b = h.create(500, 500, BOB);

    CHECK_EQ(h.engine.verify_campaign(CAROL, a, true).code(),
             core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.engine.verify_campaign(ADMIN, a, true));
    CHECK_OK(h.engine.promote_campaign(ADMIN, a, true));
    CHECK_OK(h.engine.promote_campaign(ADMIN, b, true));

    CHECK_EQ(h.engine.verified_campaigns().size(), 1u);
    CHECK_EQ(h.engine.promoted_campaigns().size(), 2u);

    // Funding closes b, so it drops out of the promoted list.
    h.fund_wallet(CAROL, 500);
    CHECK_OK(h.engine.contribute(CAROL, b, Amount(500)));
    auto promoted = h.engine.promoted_campaigns();
    CHECK_EQ(promoted.size(), 1u);
    CHECK_EQ(promoted[0], a);
    CHECK_EQ(h.engine.successful_campaigns().size(), 1u);
    CHECK_EQ(h.engine.successful_campaigns()[0], b);
    CHECK_EQ(h.engine.active_campaigns().size(), 1u);
}

TEST_CASE(Engine, pause_blocks_mutators) {
    campaign::PlatformSettings settings;
    settings.sweep_batch_size = 1;
    Harness h(settings);
    const CampaignId open = h.create();
    const CampaignId cancelled = h.create();
    h.fund_wallet(CAROL, 1000);
    h.fund_wallet(DAVE, 1000);
    CHECK_OK(h.engine.contribute(CAROL, open, Amount(100)));
    CHECK_OK(h.engine.enable_refunds(ALICE, open));
    CHECK_OK(h.engine.contribute(CAROL, cancelled, Amount(100)));
    CHECK_OK(h.engine.contribute(DAVE, cancelled, Amount(100)));
    CHECK_EQ(h.engine.cancel_campaign(ALICE, cancelled).value(), 1u);

    CHECK_EQ(h.gate.pause(CAROL).code(), core::ErrorCode::UNAUTHORIZED);
    CHECK_OK(h.gate.pause(ADMIN));

    campaign::CampaignParams p;
    p.goal = Amount(100);
    p.min_contribution = Amount(1);
    p.max_contribution = Amount(100);
    p.duration_days = 1;
    p.metadata.title = "paused";
    CHECK_EQ(h.engine.create_campaign(ALICE, p).code(),
             core::ErrorCode::PAUSED);
    CHECK_EQ(h.engine.contribute(DAVE, open, Amount(50)).code(),
             core::ErrorCode::PAUSED);
    CHECK_EQ(h.engine.modify_goal(ALICE, open, Amount(5000)).code(),
             core::ErrorCode::PAUSED);
    CHECK_EQ(h.engine.cancel_campaign(ALICE, open).code(),
             core::ErrorCode::PAUSED);

    // Exits for contributors and administration stay available.
    CHECK_EQ(h.engine.request_refund(CAROL, open).value(), Amount(100));
    CHECK_EQ(h.engine.continue_refund_sweep(ERIN, cancelled, 0).value(), 0u);
    CHECK_OK(h.engine.verify_campaign(ADMIN, open, true));
    CHECK_OK(h.engine.promote_campaign(ADMIN, open, true));
    CHECK_EQ(h.wallet(CAROL), Amount(1000));
    CHECK_EQ(h.wallet(DAVE), Amount(1000));

    CHECK_OK(h.gate.unpause(ADMIN));
    CHECK_OK(h.engine.contribute(DAVE, open, Amount(50)));
}

// ============================================================================
// Journal through the engine
// ============================================================================

TEST_CASE(Engine, subscribers_see_committed_events_only) {
    Harness h;
    std::vector<EventKind> seen;
    const auto sub = h.engine.subscribe(
        [&seen](const campaign::Event& e) { seen.push_back(e.kind); });

    const CampaignId id = h.create();
    h.fund_wallet(CAROL, 1000);
    h.custody.fail_next_settlements(1);
    CHECK_EQ(h.engine.contribute(CAROL, id, Amount(1000)).code(),
             core::ErrorCode::TRANSFER_FAILED);
    CHECK_EQ(seen.size(), 1u);

    CHECK_OK(h.engine.contribute(CAROL, id, Amount(1000)));
    CHECK_EQ(seen.size(), 4u);
    CHECK(seen.back() == EventKind::PAYOUT);

    h.engine.unsubscribe(sub);
    CHECK_OK(h.engine.verify_campaign(ADMIN, id, true));
    CHECK_EQ(seen.size(), 4u);
    CHECK_EQ(h.engine.events().size(), 5u);
}

TEST_CASE(Engine, replicas_agree_on_journal_head) {
    auto run = [](Harness& h) {
        const CampaignId id = h.create();
        h.fund_wallet(CAROL, 1000);
        CHECK_OK(h.engine.contribute(CAROL, id, Amount(300)));
        CHECK_OK(h.engine.contribute(CAROL, id, Amount(700)));
        CHECK(h.engine.verify_journal());
    };

    crypto::Hash256 first_head{};
    {
        Harness h;
        const crypto::Hash256 empty = h.engine.journal_head();
        run(h);
        first_head = h.engine.journal_head();
        CHECK(first_head != empty);
    }
    {
        Harness h;
        run(h);
        CHECK(h.engine.journal_head() == first_head);
        CHECK_OK(h.engine.verify_campaign(ADMIN, 1, true));
        CHECK(h.engine.journal_head() != first_head);
    }
}
