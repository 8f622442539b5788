#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Engine configuration -- maps core::Config keys onto EngineConfig.
//
// Keys (command line "-key=value" or one "key=value" per line in the file
// named by -conf; the command line wins):
//   platformfee      fee in basis points                     (250)
//   maxplatformfee   upper bound for setPlatformFee           (1000)
//   feerecipient     account receiving platform fees          (platform)
//   owner            platform owner account                   (admin)
//   maxdurationdays  longest campaign duration                (365)
//   maxmilestones    milestones per campaign                  (32)
//   sweepbatch       refunds per cancellation batch, 0 = all  (0)
//   allowtoken       token id accepted as funding asset, repeatable
//   loglevel         trace|debug|info|warn|error|fatal|off    (info)
//   logcategories    comma-separated category names           (all)
//   logfile          log file path, empty = no file
//   printtoconsole   log to stderr                            (1)
// ---------------------------------------------------------------------------

#ifndef CFUND_NODE_CONFIG_H
#define CFUND_NODE_CONFIG_H

#include "campaign/settings.h"
#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "primitives/account.h"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace node {

/// Longest campaign duration the configuration accepts (10 years).
inline constexpr int64_t MAX_CONFIG_DURATION_DAYS = 3650;

/// Largest milestone count the configuration accepts.
inline constexpr int64_t MAX_CONFIG_MILESTONES = 1024;

struct EngineConfig {
    campaign::PlatformSettings platform;
    primitives::AccountId owner{"admin"};

    core::LogLevel log_level = core::LogLevel::INFO;
    uint32_t log_categories = static_cast<uint32_t>(core::LogCategory::ALL);
    std::filesystem::path log_file;
    bool print_to_console = true;
};

/// Build an EngineConfig from parsed arguments and file values.
/// Every malformed or out-of-range value fails with INVALID_PARAMETERS.
[[nodiscard]] core::Result<EngineConfig> load_engine_config(
    const core::Config& config);

/// Parse a log level name (case-insensitive).
[[nodiscard]] core::Result<core::LogLevel> parse_log_level(
    std::string_view name);

} // namespace node

#endif // CFUND_NODE_CONFIG_H
