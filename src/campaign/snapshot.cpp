// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "campaign/snapshot.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/keccak.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

namespace campaign {

namespace {

constexpr std::array<uint8_t, 4> MAGIC = {'C', 'F', 'S', 'N'};
constexpr size_t CHECKSUM_SIZE = 32;

// -- Encoding helpers -------------------------------------------------------

void write_asset(core::DataStream& s, const Asset& asset) {
    core::ser_write_u8(s, asset.is_native() ? 0 : 1);
    if (asset.is_token()) {
        core::ser_write_string(s, asset.token_id());
    }
}

void write_campaign(core::DataStream& s, const Campaign& c) {
    core::ser_write_u64(s, c.id);
    core::ser_write_string(s, c.creator.str());
    c.goal.serialize(s);
    c.raised.serialize(s);
    c.min_contribution.serialize(s);
    c.max_contribution.serialize(s);
    core::ser_write_i64(s, c.created_at);
    core::ser_write_i64(s, c.deadline);
    core::ser_write_string(s, c.metadata.title);
    core::ser_write_string(s, c.metadata.description);
    core::ser_write_string(s, c.metadata.media_ref);
    core::ser_write_string(s, c.category);
    core::ser_write_bool(s, c.verified);
    core::ser_write_bool(s, c.promoted);
    write_asset(s, c.asset);
    core::ser_write_bool(s, c.completed);
    core::ser_write_bool(s, c.cancelled);
    core::ser_write_bool(s, c.refundable);
    core::ser_write_u64(s, c.backer_count);
    c.released.serialize(s);
    c.fees_paid.serialize(s);

    const auto& w = c.withdrawal;
    core::ser_write_bool(s, w.partial_enabled);
    core::ser_write_bool(s, w.ceiling_enabled);
    w.ceiling.serialize(s);
    w.total_withdrawn.serialize(s);
    core::ser_write_i64(s, w.last_withdrawal_time);
    core::ser_write_i64(s, w.min_interval);

    core::ser_write_u64(s, c.milestones.size());
    for (const auto& m : c.milestones) {
        m.amount.serialize(s);
        core::ser_write_string(s, m.description);
        core::ser_write_bool(s, m.completed);
    }
    core::ser_write_u64(s, c.sweep_cursor);
}

// -- Decoding helpers -------------------------------------------------------
// Structural violations throw std::runtime_error; decode_snapshot() turns
// every throw into STORAGE_CORRUPT.

[[noreturn]] void corrupt(const std::string& what) {
    throw std::runtime_error(what);
}

AccountId read_account(core::DataStream& s, bool allow_empty = false) {
    std::string name = core::ser_read_string(s);
    if (allow_empty && name.empty()) return AccountId();
    auto id = AccountId::from_string(name);
    if (!id.ok()) corrupt("invalid account '" + name + "'");
    return std::move(id).value();
}

Amount read_amount(core::DataStream& s) {
    Amount a = Amount::deserialize(s);
    if (!a.is_valid()) corrupt("amount out of range");
    return a;
}

Asset read_asset(core::DataStream& s) {
    switch (core::ser_read_u8(s)) {
        case 0:
            return Asset::native();
        case 1: {
            std::string token = core::ser_read_string(s);
            if (token.empty()) corrupt("empty token id");
            return Asset::token(std::move(token));
        }
        default:
            corrupt("unknown asset tag");
    }
}

Campaign read_campaign(core::DataStream& s) {
    Campaign c;
    c.id = core::ser_read_u64(s);
    c.creator = read_account(s);
    c.goal = read_amount(s);
    c.raised = read_amount(s);
    c.min_contribution = read_amount(s);
    c.max_contribution = read_amount(s);
    c.created_at = core::ser_read_i64(s);
    c.deadline = core::ser_read_i64(s);
    c.metadata.title = core::ser_read_string(s);
    c.metadata.description = core::ser_read_string(s);
    c.metadata.media_ref = core::ser_read_string(s);
    c.category = core::ser_read_string(s);
    c.verified = core::ser_read_bool(s);
    c.promoted = core::ser_read_bool(s);
    c.asset = read_asset(s);
    c.completed = core::ser_read_bool(s);
    c.cancelled = core::ser_read_bool(s);
    c.refundable = core::ser_read_bool(s);
    c.backer_count = core::ser_read_u64(s);
    c.released = read_amount(s);
    c.fees_paid = read_amount(s);

    auto& w = c.withdrawal;
    w.partial_enabled = core::ser_read_bool(s);
    w.ceiling_enabled = core::ser_read_bool(s);
    w.ceiling = read_amount(s);
    w.total_withdrawn = read_amount(s);
    w.last_withdrawal_time = core::ser_read_i64(s);
    w.min_interval = core::ser_read_i64(s);

    const uint64_t milestones = core::ser_read_count(s);
    for (uint64_t i = 0; i < milestones; ++i) {
        Milestone m;
        m.amount = read_amount(s);
        m.description = core::ser_read_string(s);
        m.completed = core::ser_read_bool(s);
        c.milestones.push_back(std::move(m));
    }
    c.sweep_cursor = core::ser_read_u64(s);

    if (c.released > c.raised) corrupt("released exceeds raised");
    if (c.cancelled && !c.completed) corrupt("cancelled but not completed");
    if (c.milestone_total() > c.goal) corrupt("milestones exceed goal");
    return c;
}

} // namespace

// ---------------------------------------------------------------------------
// encode_snapshot
// ---------------------------------------------------------------------------

std::vector<uint8_t> encode_snapshot(const PlatformSettings& settings,
                                     const CampaignRegistry& registry,
                                     const ContributionLedger& ledger) {
    core::DataStream s;
    s.write(MAGIC);
    core::ser_write_u32(s, SNAPSHOT_VERSION);

    core::ser_write_u32(s, settings.fee_bps);
    core::ser_write_string(s, settings.fee_recipient.str());
    core::ser_write_u64(s, settings.allowed_tokens.size());
    for (const auto& token : settings.allowed_tokens) {
        core::ser_write_string(s, token);
    }

    core::ser_write_u64(s, registry.count());
    for (const auto& c : registry.all()) {
        write_campaign(s, c);
    }

    // Books in campaign id order so equal states encode identically.
    std::vector<CampaignId> book_ids;
    for (const auto& [id, book] : ledger.books()) book_ids.push_back(id);
    std::sort(book_ids.begin(), book_ids.end());

    core::ser_write_u64(s, book_ids.size());
    for (CampaignId id : book_ids) {
        const auto& book = ledger.books().at(id);
        core::ser_write_u64(s, id);
        core::ser_write_u64(s, book.roster.size());
        for (const auto& who : book.roster) {
            core::ser_write_string(s, who.str());
            auto it = book.records.find(who);
            const Amount record =
                it == book.records.end() ? Amount() : it->second;
            record.serialize(s);
        }
    }

    std::vector<AccountId> owners;
    for (const auto& [owner, ids] : registry.ownership_index()) {
        owners.push_back(owner);
    }
    std::sort(owners.begin(), owners.end());

    core::ser_write_u64(s, owners.size());
    for (const auto& owner : owners) {
        const auto& ids = registry.ownership_index().at(owner);
        core::ser_write_string(s, owner.str());
        core::ser_write_u64(s, ids.size());
        for (CampaignId id : ids) core::ser_write_u64(s, id);
    }

    const crypto::Hash256 checksum = crypto::keccak256(s.bytes());
    s.write(checksum);
    return s.release();
}

// ---------------------------------------------------------------------------
// decode_snapshot
// ---------------------------------------------------------------------------

core::Result<SnapshotState> decode_snapshot(std::span<const uint8_t> data) {
    if (data.size() < MAGIC.size() + 4 + CHECKSUM_SIZE) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                "snapshot truncated");
    }
    if (!std::equal(MAGIC.begin(), MAGIC.end(), data.begin())) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                "not a cfund snapshot");
    }

    const auto body = data.first(data.size() - CHECKSUM_SIZE);
    const auto trailer = data.last(CHECKSUM_SIZE);
    const crypto::Hash256 expected = crypto::keccak256(body);
    if (!std::equal(expected.begin(), expected.end(), trailer.begin())) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                "snapshot checksum mismatch");
    }

    core::DataStream s(body.subspan(MAGIC.size()));
    SnapshotState state;

    try {
        const uint32_t version = core::ser_read_u32(s);
        if (version != SNAPSHOT_VERSION) {
            corrupt("unsupported snapshot version " +
                    std::to_string(version));
        }

        state.settings.fee_bps = core::ser_read_u32(s);
        if (state.settings.fee_bps > BPS_DENOMINATOR) {
            corrupt("fee rate out of range");
        }
        state.settings.fee_recipient = read_account(s);
        const uint64_t tokens = core::ser_read_count(s);
        for (uint64_t i = 0; i < tokens; ++i) {
            state.settings.allowed_tokens.insert(core::ser_read_string(s));
        }

        const uint64_t count = core::ser_read_count(s);
        for (uint64_t i = 0; i < count; ++i) {
            Campaign c = read_campaign(s);
            if (c.id != i + 1) corrupt("campaign ids out of sequence");
            state.campaigns.push_back(std::move(c));
        }

        const uint64_t books = core::ser_read_count(s);
        for (uint64_t i = 0; i < books; ++i) {
            const CampaignId id = core::ser_read_u64(s);
            if (id < 1 || id > count || state.books.count(id)) {
                corrupt("bad ledger book id");
            }
            ContributionLedger::Book book;
            const uint64_t entries = core::ser_read_count(s);
            for (uint64_t j = 0; j < entries; ++j) {
                AccountId who = read_account(s);
                Amount record = read_amount(s);
                if (!book.records.emplace(who, record).second) {
                    corrupt("duplicate roster entry");
                }
                book.roster.push_back(std::move(who));
            }
            if (state.campaigns[id - 1].backer_count != book.roster.size()) {
                corrupt("backer count does not match roster");
            }
            state.books.emplace(id, std::move(book));
        }

        const uint64_t owners = core::ser_read_count(s);
        std::unordered_set<CampaignId> indexed;
        for (uint64_t i = 0; i < owners; ++i) {
            AccountId owner = read_account(s);
            const uint64_t ids = core::ser_read_count(s);
            std::vector<CampaignId> owned;
            for (uint64_t j = 0; j < ids; ++j) {
                const CampaignId id = core::ser_read_u64(s);
                if (id < 1 || id > count ||
                    state.campaigns[id - 1].creator != owner ||
                    !indexed.insert(id).second) {
                    corrupt("ownership index inconsistent");
                }
                owned.push_back(id);
            }
            state.owned.emplace(std::move(owner), std::move(owned));
        }
        if (indexed.size() != count) {
            corrupt("ownership index incomplete");
        }

        if (!s.eof()) corrupt("trailing bytes after payload");
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                std::string("snapshot: ") + e.what());
    }
    return state;
}

// ---------------------------------------------------------------------------
// File I/O
// ---------------------------------------------------------------------------

core::Result<void> write_snapshot(const std::filesystem::path& path,
                                  const PlatformSettings& settings,
                                  const CampaignRegistry& registry,
                                  const ContributionLedger& ledger) {
    const std::vector<uint8_t> bytes =
        encode_snapshot(settings, registry, ledger);
    const std::string_view content(
        reinterpret_cast<const char*>(bytes.data()), bytes.size());

    if (!core::fs::write_file(path, content)) {
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                "cannot write snapshot " + path.string());
    }
    LOG_INFO(core::LogCategory::STORAGE,
             "wrote snapshot " + path.string() + " (" +
                 std::to_string(registry.count()) + " campaigns, " +
                 std::to_string(bytes.size()) + " bytes)");
    return core::make_ok();
}

core::Result<SnapshotState> read_snapshot(const std::filesystem::path& path) {
    if (!core::fs::file_exists(path)) {
        return core::make_error(core::ErrorCode::STORAGE_NOT_FOUND,
                                "no snapshot at " + path.string());
    }
    auto content = core::fs::read_file(path);
    if (!content) {
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                "cannot read snapshot " + path.string());
    }
    const std::span<const uint8_t> bytes(
        reinterpret_cast<const uint8_t*>(content->data()), content->size());

    auto state = decode_snapshot(bytes);
    if (!state.ok()) {
        LOG_ERROR(core::LogCategory::STORAGE,
                  path.string() + ": " + state.error().message());
    }
    return state;
}

} // namespace campaign
