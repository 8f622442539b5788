// Copyright (c) FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"
#include "core/logging.h"

namespace core {

void RecursiveMutex::lock()
{
    mutex_.lock();
    owner_.store(std::this_thread::get_id(), std::memory_order_release);
    ++depth_;
    if (depth_ > 1) {
        LOG_TRACE(LogCategory::LOCK,
                  "re-entered '" + name_ + "' at depth " +
                  std::to_string(depth_));
    }
}

void RecursiveMutex::unlock()
{
    if (--depth_ == 0) {
        owner_.store(std::thread::id{}, std::memory_order_release);
    }
    mutex_.unlock();
}

bool RecursiveMutex::try_lock()
{
    if (!mutex_.try_lock()) {
        return false;
    }
    owner_.store(std::this_thread::get_id(), std::memory_order_release);
    ++depth_;
    return true;
}

uint32_t RecursiveMutex::depth() const noexcept
{
    // depth_ is only meaningful to the thread that owns the mutex.
    return held_by_current_thread() ? depth_ : 0;
}

}  // namespace core
