#pragma once

///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <condition_variable>
#include <mutex>

namespace bridgecraft::async
{
    /// @brief Flag a thread can block on until another thread sets it.
    /// @details set() notifies while holding the lock, so a waiter that wakes up
    /// may destroy the signal as soon as wait() returns.
    class event_signal
    {
    public:
        event_signal() = default;
        event_signal(const event_signal &) = delete;
        event_signal &operator=(const event_signal &) = delete;

        void set()
        {
            std::lock_guard lock(guard);
            flag = true;
            changed.notify_all();
        }

        void reset()
        {
            std::lock_guard lock(guard);
            flag = false;
        }

        bool is_set() const
        {
            std::lock_guard lock(guard);
            return flag;
        }

        void wait() const
        {
            std::unique_lock lock(guard);
            changed.wait(lock, [this]
                         { return flag; });
        }

    private:
        mutable std::mutex guard;
        mutable std::condition_variable changed;
        bool flag = false;
    };
}
