// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/logging_init.h"
#include "node/config.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"

#include <cctype>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace node {

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

namespace {

/// Case-insensitive equality.
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Trim leading and trailing whitespace.
std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

/// Parse a single category name to a LogCategory bitmask value.
std::optional<core::LogCategory> parse_single_category(
    std::string_view name) {
    if (iequals(name, "registry"))  return core::LogCategory::REGISTRY;
    if (iequals(name, "ledger"))    return core::LogCategory::LEDGER;
    if (iequals(name, "lifecycle")) return core::LogCategory::LIFECYCLE;
    if (iequals(name, "withdraw"))  return core::LogCategory::WITHDRAW;
    if (iequals(name, "refund"))    return core::LogCategory::REFUND;
    if (iequals(name, "transfer"))  return core::LogCategory::TRANSFER;
    if (iequals(name, "journal"))   return core::LogCategory::JOURNAL;
    if (iequals(name, "config"))    return core::LogCategory::CONFIG;
    if (iequals(name, "storage"))   return core::LogCategory::STORAGE;
    if (iequals(name, "lock"))      return core::LogCategory::LOCK;
    if (iequals(name, "all"))       return core::LogCategory::ALL;
    if (iequals(name, "none"))      return core::LogCategory::NONE;
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const EngineConfig& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(config.log_level);
    logger.set_categories(static_cast<core::LogCategory>(config.log_categories));
    logger.set_print_to_console(config.print_to_console);

    if (config.log_file.empty()) {
        logger.set_print_to_file(false);
    } else {
        const auto& log_path = config.log_file;
        if (log_path.has_parent_path() &&
            !core::fs::ensure_directory(log_path.parent_path())) {
            return core::make_error(
                core::ErrorCode::STORAGE_ERROR,
                "cannot create log directory " +
                    log_path.parent_path().string());
        }

        rotate_log_file(log_path, MAX_LOG_FILE_SIZE);

        if (!logger.set_log_file(log_path)) {
            return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                    "cannot open log file " +
                                        log_path.string());
        }
        logger.set_print_to_file(true);
    }

    LOG_INFO(core::LogCategory::CONFIG, get_startup_banner(config));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// rotate_log_file
// ---------------------------------------------------------------------------

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(log_path, ec);
    if (ec || size < max_size) {
        return false;
    }

    std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    if (std::filesystem::exists(rotated_path, ec)) {
        std::filesystem::remove(rotated_path, ec);
        if (ec) {
            LOG_WARN(core::LogCategory::STORAGE,
                     "Failed to remove old rotated log: " +
                     rotated_path.string());
        }
    }

    if (!core::fs::rename_safe(log_path, rotated_path)) {
        LOG_WARN(core::LogCategory::STORAGE,
                 "Failed to rotate log file: " + log_path.string());
        return false;
    }

    LOG_INFO(core::LogCategory::STORAGE,
             "Rotated log file: " + log_path.string() +
             " -> " + rotated_path.string() +
             " (was " + std::to_string(size / (1024 * 1024)) + " MB)");
    return true;
}

// ---------------------------------------------------------------------------
// get_startup_banner
// ---------------------------------------------------------------------------

std::string get_startup_banner(const EngineConfig& config) {
    std::ostringstream ss;
    const auto& platform = config.platform;

    ss << "\n"
       << "============================================================\n"
       << "  cfund campaign engine\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Compiler: "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "Unknown"
#endif
       << " | C++ " << __cplusplus << "\n"
       << "  Owner: " << config.owner.str() << "\n"
       << "  Platform fee: " << platform.fee_bps << " bps (max "
       << platform.max_fee_bps << ") -> " << platform.fee_recipient.str()
       << "\n"
       << "  Max duration: " << platform.max_duration_days << " days\n"
       << "  Max milestones: " << platform.max_milestones << "\n"
       << "  Sweep batch: ";
    if (platform.sweep_batch_size == 0) {
        ss << "unbounded";
    } else {
        ss << platform.sweep_batch_size;
    }
    ss << "\n"
       << "  Allowed tokens: " << platform.allowed_tokens.size() << "\n"
       << "  Log level: " << core::log_level_string(config.log_level) << "\n"
       << "  Started: " << core::format_iso8601(core::get_time()) << "\n"
       << "============================================================\n";

    return ss.str();
}

// ---------------------------------------------------------------------------
// parse_log_categories
// ---------------------------------------------------------------------------

core::Result<uint32_t> parse_log_categories(std::string_view category_str) {
    category_str = trim_ws(category_str);
    if (category_str.empty()) {
        return static_cast<uint32_t>(core::LogCategory::ALL);
    }

    uint32_t result = 0;
    size_t start = 0;
    while (start <= category_str.size()) {
        size_t comma = category_str.find(',', start);
        if (comma == std::string_view::npos) {
            comma = category_str.size();
        }

        std::string_view token =
            trim_ws(category_str.substr(start, comma - start));
        if (!token.empty()) {
            auto cat = parse_single_category(token);
            if (!cat.has_value()) {
                return core::make_error(
                    core::ErrorCode::INVALID_PARAMETERS,
                    "unknown log category '" + std::string(token) + "'");
            }
            result |= static_cast<uint32_t>(*cat);
        }

        start = comma + 1;
    }

    return result;
}

} // namespace node
