#include "OneShotSignal.hpp"

namespace tether
{

void OneShotSignal::Set()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (set_)
            return;
        set_ = true;
    }
    cv_.notify_all();
}

bool OneShotSignal::IsSet() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

void OneShotSignal::Wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return set_; });
}

bool OneShotSignal::WaitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return set_; });
}

} // namespace tether
