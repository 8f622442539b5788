#include "core/time.h"

#include <array>
#include <chrono>
#include <ctime>

namespace core {

int64_t get_time()
{
    using namespace std::chrono;
    return duration_cast<seconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

std::string format_iso8601(int64_t timestamp)
{
    std::time_t tt = static_cast<std::time_t>(timestamp);
    std::tm utc{};

#ifdef _WIN32
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif

    // "YYYY-MM-DDTHH:MM:SSZ" is exactly 20 characters + null.
    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf.data());
}

// ---------------------------------------------------------------------------
// MockableClock
// ---------------------------------------------------------------------------

int64_t MockableClock::now()
{
    int64_t mock = mock_time_.load(std::memory_order_relaxed);
    if (mock != 0) {
        return mock;
    }
    return get_time();
}

void MockableClock::set_mock_time(int64_t t)
{
    mock_time_.store(t, std::memory_order_relaxed);
}

void MockableClock::advance(int64_t seconds)
{
    mock_time_.store(now() + seconds, std::memory_order_relaxed);
}

int64_t MockableClock::get_mock_time()
{
    return mock_time_.load(std::memory_order_relaxed);
}

} // namespace core
