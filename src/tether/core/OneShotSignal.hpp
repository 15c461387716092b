#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tether
{

/**
 * @brief Monotonic cross-thread notification.
 *
 * One writer sets the signal, any number of threads observe it. Once set it stays
 * set, so a waiter that arrives late returns immediately.
 */
class OneShotSignal
{
public:
    OneShotSignal() = default;
    OneShotSignal(const OneShotSignal&) = delete;
    OneShotSignal& operator=(const OneShotSignal&) = delete;

    /// Sets the signal and wakes every waiter. Setting twice is a no-op.
    void Set();

    bool IsSet() const;

    /// Blocks until the signal is set.
    void Wait() const;

    /// Returns true if the signal was set before the timeout elapsed.
    bool WaitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool set_ = false;
};

} // namespace tether
