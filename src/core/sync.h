#pragma once

// Copyright (c) FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace core {

// ---------------------------------------------------------------------------
// RecursiveMutex
// ---------------------------------------------------------------------------

/// Named wrapper around std::recursive_mutex that tracks the owning thread
/// and the current nesting depth.  The owning thread may re-acquire the lock
/// (a callback re-entering the component that holds it); every other thread
/// blocks until the outermost unlock.
class RecursiveMutex {
public:
    explicit RecursiveMutex(std::string_view name = "")
        : name_(name)
    {
    }

    ~RecursiveMutex() = default;

    RecursiveMutex(const RecursiveMutex&) = delete;
    RecursiveMutex& operator=(const RecursiveMutex&) = delete;

    void lock();
    void unlock();
    bool try_lock();

    /// Nesting depth seen by the calling thread: 0 when it does not hold
    /// the lock, 1 for the outermost acquisition, >1 when re-entered.
    [[nodiscard]] uint32_t depth() const noexcept;

    [[nodiscard]] bool held_by_current_thread() const noexcept {
        return owner_.load(std::memory_order_acquire) ==
               std::this_thread::get_id();
    }

    const std::string& name() const noexcept { return name_; }

private:
    std::recursive_mutex mutex_;
    std::string name_;
    std::atomic<std::thread::id> owner_{};
    uint32_t depth_ = 0;  // only touched by the owning thread
};

// ---------------------------------------------------------------------------
// RecursiveLock  (scoped guard for core::RecursiveMutex)
// ---------------------------------------------------------------------------

class RecursiveLock {
public:
    explicit RecursiveLock(RecursiveMutex& mtx)
        : mutex_(mtx)
    {
        mutex_.lock();
    }

    ~RecursiveLock()
    {
        mutex_.unlock();
    }

    RecursiveLock(const RecursiveLock&) = delete;
    RecursiveLock& operator=(const RecursiveLock&) = delete;

    /// True when this guard re-entered a lock its thread already held.
    bool reentered() const noexcept { return mutex_.depth() > 1; }

private:
    RecursiveMutex& mutex_;
};

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

#define CORE_SYNC_CAT_(a, b)  a##b
#define CORE_SYNC_CAT(a, b)   CORE_SYNC_CAT_(a, b)

/// Scoped lock; the guard variable is named after the source line so two
/// LOCK()s in the same scope do not collide.
#define LOCK(cs) \
    core::RecursiveLock CORE_SYNC_CAT(cs_guard_, __LINE__)(cs)

}  // namespace core
