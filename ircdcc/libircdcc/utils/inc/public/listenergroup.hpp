#ifndef IRCDCC_UTILS_LISTENERGROUP_HPP_
#define IRCDCC_UTILS_LISTENERGROUP_HPP_

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace ircdcc::utils
{
/**
 * Weakly held listeners, notified in registration order. A listener that was destroyed
 * without being removed is skipped and forgotten at the next notification.
 */
template<typename Listener>
class ListenerGroup
{
public:
    bool add(const std::shared_ptr<Listener> &listener)
    {
        if (!listener)
        {
            return false;
        }

        std::lock_guard lock {mutex_};
        if (find(listener.get()) != listeners_.end())
        {
            return false;
        }
        listeners_.emplace_back(listener);
        return true;
    }

    bool remove(const std::shared_ptr<Listener> &listener)
    {
        std::lock_guard lock {mutex_};
        auto            it = find(listener.get());
        if (it == listeners_.end())
        {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard lock {mutex_};
        return listeners_.size();
    }

    // Called without the lock held, so listeners may add or remove themselves
    template<typename Method, typename... Args>
    void notify(Method method, const Args &... args)
    {
        for (const auto &listener : live_listeners())
        {
            (listener.get()->*method)(args...);
        }
    }

private:
    using Entry = std::weak_ptr<Listener>;

    typename std::vector<Entry>::iterator find(const Listener *listener)
    {
        return std::find_if(listeners_.begin(), listeners_.end(),
            [listener](const Entry &entry) { return entry.lock().get() == listener; });
    }

    std::vector<std::shared_ptr<Listener>> live_listeners()
    {
        std::vector<std::shared_ptr<Listener>> live;

        std::lock_guard lock {mutex_};
        live.reserve(listeners_.size());
        listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                             [](const Entry &entry) { return entry.expired(); }),
            listeners_.end());
        for (const auto &entry : listeners_)
        {
            if (auto listener = entry.lock())
            {
                live.push_back(std::move(listener));
            }
        }
        return live;
    }

    std::vector<Entry> listeners_;
    mutable std::mutex mutex_;
};
}  // namespace ircdcc::utils

#endif  // IRCDCC_UTILS_LISTENERGROUP_HPP_
