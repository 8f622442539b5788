// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/config.h"
#include "node/logging_init.h"

#include "campaign/fees.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

namespace {

/// Case-insensitive equality check.
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

core::Error bad_value(std::string_view key, const std::string& value,
                      std::string_view expected) {
    return core::Error(core::ErrorCode::INVALID_PARAMETERS,
                       "-" + std::string(key) + "=" + value + ": expected " +
                           std::string(expected));
}

/// Integer value of @p key in [lo, hi], or @p default_val when unset.
core::Result<int64_t> read_int(const core::Config& config,
                               std::string_view key, int64_t default_val,
                               int64_t lo, int64_t hi) {
    auto val = config.get(key);
    if (!val.has_value()) return default_val;

    int64_t result = 0;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size() || result < lo ||
        result > hi) {
        return bad_value(key, s,
                         "integer in [" + std::to_string(lo) + ", " +
                             std::to_string(hi) + "]");
    }
    return result;
}

core::Result<primitives::AccountId> read_account(
    const core::Config& config, std::string_view key,
    const primitives::AccountId& default_val) {
    auto val = config.get(key);
    if (!val.has_value()) return default_val;

    auto id = primitives::AccountId::from_string(*val);
    if (!id.ok()) return bad_value(key, *val, "account id");
    return id;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse_log_level
// ---------------------------------------------------------------------------

core::Result<core::LogLevel> parse_log_level(std::string_view sv) {
    if (iequals(sv, "trace"))   return core::LogLevel::TRACE;
    if (iequals(sv, "debug"))   return core::LogLevel::DEBUG;
    if (iequals(sv, "info"))    return core::LogLevel::INFO;
    if (iequals(sv, "warn") || iequals(sv, "warning"))
                                return core::LogLevel::WARN;
    if (iequals(sv, "error") || iequals(sv, "err"))
                                return core::LogLevel::ERR;
    if (iequals(sv, "fatal"))   return core::LogLevel::FATAL;
    if (iequals(sv, "off") || iequals(sv, "none"))
                                return core::LogLevel::OFF;
    return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                            "unknown log level '" + std::string(sv) + "'");
}

// ---------------------------------------------------------------------------
// load_engine_config
// ---------------------------------------------------------------------------

core::Result<EngineConfig> load_engine_config(const core::Config& config) {
    EngineConfig out;
    auto& platform = out.platform;

    const int64_t max_fee = CFUND_TRY(read_int(
        config, core::CONF_MAX_PLATFORM_FEE,
        campaign::DEFAULT_MAX_PLATFORM_FEE_BPS, 0,
        campaign::BPS_DENOMINATOR));
    const int64_t fee = CFUND_TRY(read_int(
        config, core::CONF_PLATFORM_FEE,
        std::min<int64_t>(campaign::DEFAULT_PLATFORM_FEE_BPS, max_fee), 0,
        max_fee));
    platform.max_fee_bps = static_cast<uint32_t>(max_fee);
    platform.fee_bps = static_cast<uint32_t>(fee);

    platform.fee_recipient = CFUND_TRY(read_account(
        config, core::CONF_FEE_RECIPIENT, platform.fee_recipient));
    out.owner = CFUND_TRY(read_account(config, core::CONF_OWNER, out.owner));

    platform.max_duration_days = CFUND_TRY(read_int(
        config, core::CONF_MAX_DURATION, campaign::DEFAULT_MAX_DURATION_DAYS,
        1, MAX_CONFIG_DURATION_DAYS));
    platform.max_milestones = static_cast<size_t>(CFUND_TRY(read_int(
        config, core::CONF_MAX_MILESTONES,
        static_cast<int64_t>(campaign::DEFAULT_MAX_MILESTONES), 0,
        MAX_CONFIG_MILESTONES)));
    platform.sweep_batch_size = static_cast<size_t>(CFUND_TRY(read_int(
        config, core::CONF_SWEEP_BATCH, 0, 0, INT64_MAX)));

    for (const auto& token : config.get_list(core::CONF_ALLOW_TOKEN)) {
        if (token.empty()) {
            return bad_value(core::CONF_ALLOW_TOKEN, token, "token id");
        }
        platform.allowed_tokens.insert(token);
    }

    if (auto level = config.get(core::CONF_LOGLEVEL)) {
        out.log_level = CFUND_TRY(parse_log_level(*level));
    }
    if (auto categories = config.get(core::CONF_LOGCATEGORIES)) {
        out.log_categories = CFUND_TRY(parse_log_categories(*categories));
    }
    out.log_file = config.get_or(core::CONF_LOGFILE, "");
    if (auto console = config.get(core::CONF_PRINTTOCONSOLE)) {
        auto flag = core::parse_bool(*console);
        if (!flag.has_value()) {
            return bad_value(core::CONF_PRINTTOCONSOLE, *console, "boolean");
        }
        out.print_to_console = *flag;
    }

    return out;
}

} // namespace node
