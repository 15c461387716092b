#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tether
{

using SubscriptionId = std::uint64_t;

/**
 * @brief Thread-safe callback list.
 *
 * Invoke copies the callbacks under the lock and calls them outside it, so a
 * callback may subscribe or unsubscribe without deadlocking.
 */
template <typename... Args>
class SubscriberList
{
public:
    using Callback = std::function<void(Args...)>;

    SubscriptionId Subscribe(Callback callback)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_id_++;
        entries_.emplace_back(id, std::move(callback));
        return id;
    }

    bool Unsubscribe(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it)
        {
            if (it->first == id)
            {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    void Clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::vector<Callback> Snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Callback> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_)
            out.push_back(entry.second);
        return out;
    }

    void Invoke(Args... args) const
    {
        for (const auto& callback : Snapshot())
        {
            if (callback)
                callback(args...);
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Callback>> entries_;
    SubscriptionId next_id_ = 1;
};

} // namespace tether
