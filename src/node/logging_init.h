#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization for the campaign engine.
//
// Configures the global Logger singleton from EngineConfig:
//   - Sets the log level threshold.
//   - Restricts log categories to the configured bitmask.
//   - Opens the log file (if any) with size-based rotation.
//   - Enables or disables console (stderr) logging.
// ---------------------------------------------------------------------------

#ifndef CFUND_NODE_LOGGING_INIT_H
#define CFUND_NODE_LOGGING_INIT_H

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace node {
struct EngineConfig;
} // namespace node

namespace node {

/// Apply @p config to the Logger.  Fails with STORAGE_ERROR when the
/// configured log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const EngineConfig& config);

// ---------------------------------------------------------------------------
// Log file rotation
// ---------------------------------------------------------------------------

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024;  // 10 MB

/// Rename @p log_path to "<name>.1" if it is at least @p max_size bytes,
/// replacing any previous rotated file.
/// @returns true if rotation was performed.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

/// Startup banner written to the log once logging is configured.
[[nodiscard]] std::string get_startup_banner(const EngineConfig& config);

// ---------------------------------------------------------------------------
// Category helpers
// ---------------------------------------------------------------------------

/// Parse a comma-separated list of category names into a bitmask.
///
/// Recognised names (case-insensitive):
///   registry, ledger, lifecycle, withdraw, refund, transfer, journal,
///   config, storage, lock, all, none
///
/// An empty list means "all".  Unknown names fail with INVALID_PARAMETERS.
[[nodiscard]] core::Result<uint32_t> parse_log_categories(
    std::string_view category_str);

} // namespace node

#endif // CFUND_NODE_LOGGING_INIT_H
