#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Engine snapshots
// ---------------------------------------------------------------------------
// File layout (all integers little-endian):
//   magic "CFSN" | version u32 | payload | keccak256(magic..payload) (32)
//
// Payload:
//   fee_bps u32 | fee_recipient str | allowed token count u64 | tokens str*
//   campaign count u64 | campaigns (ids 1..n in order)
//   book count u64 | (campaign id u64 | roster count u64 |
//                     (account str | record i64)*)*
//   owner count u64 | (account str | id count u64 | ids u64*)*
//
// Records are written in roster order so that loading restores the roster
// exactly.  A snapshot that fails the checksum or any structural check is
// reported as STORAGE_CORRUPT.
// ---------------------------------------------------------------------------

#include "campaign/ledger.h"
#include "campaign/registry.h"
#include "campaign/settings.h"
#include "core/error.h"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <span>
#include <unordered_map>
#include <vector>

namespace campaign {

inline constexpr uint32_t SNAPSHOT_VERSION = 1;

/// Everything a snapshot restores.
struct SnapshotState {
    PlatformSettings settings;
    std::deque<Campaign> campaigns;
    std::unordered_map<CampaignId, ContributionLedger::Book> books;
    std::unordered_map<AccountId, std::vector<CampaignId>> owned;
};

[[nodiscard]] std::vector<uint8_t> encode_snapshot(
    const PlatformSettings& settings,
    const CampaignRegistry& registry,
    const ContributionLedger& ledger);

/// Decode and validate.  The configuration-only fields of the returned
/// settings keep their defaults.
[[nodiscard]] core::Result<SnapshotState> decode_snapshot(
    std::span<const uint8_t> data);

/// Encode and write atomically.  STORAGE_ERROR on I/O failure.
[[nodiscard]] core::Result<void> write_snapshot(
    const std::filesystem::path& path,
    const PlatformSettings& settings,
    const CampaignRegistry& registry,
    const ContributionLedger& ledger);

/// STORAGE_NOT_FOUND when the file is missing, STORAGE_CORRUPT when it
/// does not decode.
[[nodiscard]] core::Result<SnapshotState> read_snapshot(
    const std::filesystem::path& path);

} // namespace campaign
