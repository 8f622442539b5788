#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace core {

inline constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

/// Returns current Unix timestamp in seconds since epoch.
int64_t get_time();

/// Formats a Unix timestamp (seconds) as ISO 8601: "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

// ---------------------------------------------------------------------------
// MockableClock - a clock that can be overridden for deterministic runs.
// ---------------------------------------------------------------------------

class MockableClock {
public:
    /// Returns the mock time if set (non-zero), otherwise real wall-clock time.
    static int64_t now();

    /// Sets the mock time. Pass 0 to disable mocking and revert to real time.
    static void set_mock_time(int64_t t);

    /// Advances the mock time by @p seconds (starting from real time when
    /// mocking is not active).
    static void advance(int64_t seconds);

    /// Returns the current mock time value (0 means not mocking).
    static int64_t get_mock_time();

private:
    static inline std::atomic<int64_t> mock_time_{0};
};

} // namespace core
