#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Common configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONFIG          = "conf";
inline constexpr const char* CONF_PLATFORM_FEE    = "platformfee";
inline constexpr const char* CONF_MAX_PLATFORM_FEE = "maxplatformfee";
inline constexpr const char* CONF_FEE_RECIPIENT   = "feerecipient";
inline constexpr const char* CONF_OWNER           = "owner";
inline constexpr const char* CONF_MAX_DURATION    = "maxdurationdays";
inline constexpr const char* CONF_MAX_MILESTONES  = "maxmilestones";
inline constexpr const char* CONF_SWEEP_BATCH     = "sweepbatch";
inline constexpr const char* CONF_ALLOW_TOKEN     = "allowtoken";
inline constexpr const char* CONF_LOGLEVEL        = "loglevel";
inline constexpr const char* CONF_LOGCATEGORIES   = "logcategories";
inline constexpr const char* CONF_LOGFILE         = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE  = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  programmatic set()
// Multi-value keys (e.g. -allowtoken=a -allowtoken=b) are accumulated into a
// vector accessible via get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Positional arguments are returned in order for the caller.
    std::vector<std::string> parse_args(int argc, char* argv[]);

    /// Parse an INI-style configuration file ("key=value" per line, '#'
    /// comments, blank lines ignored, whitespace trimmed).
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// All values for @p key, CLI values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;
    ValueMap set_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

/// Parse a boolean string. Returns std::nullopt for unrecognised input.
[[nodiscard]] std::optional<bool> parse_bool(std::string_view sv);

} // namespace core
