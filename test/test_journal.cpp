// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the event journal and its hash chain.

#include "test_framework.h"

#include "campaign/events.h"
#include "crypto/keccak.h"

#include <string>
#include <vector>

using campaign::Event;
using campaign::EventJournal;
using campaign::EventKind;
using primitives::AccountId;
using primitives::Amount;

namespace {

Event contribution(campaign::CampaignId id, const char* who, int64_t amount) {
    Event e;
    e.kind = EventKind::CONTRIBUTION;
    e.campaign = id;
    e.account = AccountId(who);
    e.amount = Amount(amount);
    e.timestamp = 1'700'000'000;
    return e;
}

} // anonymous namespace

TEST_CASE(Journal, append_assigns_sequence_and_extends_chain) {
    EventJournal journal;
    const crypto::Hash256 genesis{};
    CHECK(journal.head() == genesis);
    CHECK(journal.verify());

    Event first = contribution(1, "carol", 100);
    first.sequence = 42;  // overwritten
    const Event& recorded = journal.append(first);
    CHECK_EQ(recorded.sequence, 0u);

    const crypto::Hash256 after_one = journal.head();
    CHECK(after_one != genesis);
    CHECK(after_one == EventJournal::chain(genesis, journal.events()[0]));

    journal.append(contribution(2, "dave", 50));
    CHECK_EQ(journal.size(), 2u);
    CHECK_EQ(journal.events()[1].sequence, 1u);
    CHECK(journal.head() ==
          EventJournal::chain(after_one, journal.events()[1]));
    CHECK(journal.verify());
}

TEST_CASE(Journal, head_depends_on_order_and_content) {
    EventJournal a;
    EventJournal b;
    EventJournal c;

    a.append(contribution(1, "carol", 100));
    a.append(contribution(1, "dave", 50));
    b.append(contribution(1, "carol", 100));
    b.append(contribution(1, "dave", 50));
    c.append(contribution(1, "dave", 50));
    c.append(contribution(1, "carol", 100));

    CHECK(a.head() == b.head());
    CHECK(a.head() != c.head());

    EventJournal d;
    d.append(contribution(1, "carol", 100));
    d.append(contribution(1, "dave", 51));
    CHECK(a.head() != d.head());
}

TEST_CASE(Journal, events_for_filters_by_campaign) {
    EventJournal journal;
    journal.append(contribution(1, "carol", 100));
    journal.append(contribution(2, "carol", 10));
    journal.append(contribution(1, "dave", 30));

    auto first = journal.events_for(1);
    CHECK_EQ(first.size(), 2u);
    CHECK_EQ(first[0].sequence, 0u);
    CHECK_EQ(first[1].sequence, 2u);
    CHECK_EQ(journal.events_for(2).size(), 1u);
    CHECK(journal.events_for(3).empty());
}

TEST_CASE(Journal, subscribers) {
    EventJournal journal;
    std::vector<uint64_t> seen_a;
    std::vector<uint64_t> seen_b;

    const auto a = journal.subscribe(
        [&seen_a](const Event& e) { seen_a.push_back(e.sequence); });
    journal.subscribe(
        [&seen_b](const Event& e) { seen_b.push_back(e.sequence); });
    CHECK_EQ(journal.subscriber_count(), 2u);

    journal.append(contribution(1, "carol", 100));
    journal.unsubscribe(a);
    CHECK_EQ(journal.subscriber_count(), 1u);
    journal.append(contribution(1, "dave", 50));

    CHECK_EQ(seen_a.size(), 1u);
    CHECK_EQ(seen_b.size(), 2u);
    CHECK_EQ(seen_b[1], 1u);
}

TEST_CASE(Journal, subscriber_may_append) {
    EventJournal journal;
    std::vector<std::string> seen;
    journal.subscribe([&](const Event& e) {
        seen.push_back(e.account.str());
        // Echo the first event once; the copy handed to us stays valid
        // while the journal grows.
        if (e.sequence == 0) {
            Event echo = e;
            echo.account = AccountId("echo");
            journal.append(echo);
            CHECK_EQ(e.account.str(), "carol");
        }
    });

    journal.append(contribution(1, "carol", 100));
    CHECK_EQ(journal.size(), 2u);
    CHECK_EQ(seen.size(), 2u);
    CHECK_EQ(seen[0], "carol");
    CHECK_EQ(seen[1], "echo");
    CHECK(journal.verify());
}

TEST_CASE(Journal, event_to_string) {
    Event e = contribution(3, "carol", 250);
    e.fee = Amount(6);
    e.detail = "first";
    const std::string text = e.to_string();
    CHECK(text.find("Contribution") != std::string::npos);
    CHECK(text.find("campaign=3") != std::string::npos);
    CHECK(text.find("account=carol") != std::string::npos);
    CHECK(text.find("amount=250") != std::string::npos);
    CHECK(text.find("fee=6") != std::string::npos);
    CHECK(text.find("detail=\"first\"") != std::string::npos);

    CHECK_EQ(campaign::event_kind_string(EventKind::PLATFORM_FEE_CHANGED),
             "PlatformFeeChanged");
}
