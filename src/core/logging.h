#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CFUND_CORE_LOGGING_H
#define CFUND_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    REGISTRY   = 1u << 0,
    LEDGER     = 1u << 1,
    LIFECYCLE  = 1u << 2,
    WITHDRAW   = 1u << 3,
    REFUND     = 1u << 4,
    TRANSFER   = 1u << 5,
    JOURNAL    = 1u << 6,
    CONFIG     = 1u << 7,
    STORAGE    = 1u << 8,
    LOCK       = 1u << 9,
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the name of the lowest set bit of @p cat, "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    /// Replaces the whole enabled-category mask.
    void set_categories(LogCategory mask);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the output log file in append mode. An empty
    /// path closes the current file. Returns false if the file could not
    /// be opened; file logging is disabled in that case.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    /// Writes one formatted log line. Callers go through the LOG_* macros,
    /// which perform the will_log() check first.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::filesystem::path log_file_path_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Usage:
//   LOG_INFO(core::LogCategory::LEDGER, "credited " + who);
// ---------------------------------------------------------------------------

#define CFUND_LOG_AT(lvl, cat, msg)                                       \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) CFUND_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) CFUND_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  CFUND_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  CFUND_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) CFUND_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) CFUND_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // CFUND_CORE_LOGGING_H
