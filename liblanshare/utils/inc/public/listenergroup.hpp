#ifndef LANSHARE_UTILS_LISTENERGROUP_HPP_
#define LANSHARE_UTILS_LISTENERGROUP_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace lanshare::utils
{
/// Weakly referenced set of listeners. Notifications are dispatched outside the internal lock,
/// so a listener may (un)register listeners from inside a notification.
template<typename T>
class ListenerGroup
{
public:
    using Listener          = T;
    using SharedPtrListener = std::shared_ptr<Listener>;
    using WeakPtrListener   = std::weak_ptr<Listener>;

    bool add(const SharedPtrListener &listener)
    {
        if (!listener)
        {
            return false;
        }
        std::lock_guard lock {mutex_};
        return listeners_.try_emplace(listener.get(), listener).second;
    }

    bool remove(const SharedPtrListener &listener)
    {
        std::lock_guard lock {mutex_};
        return listeners_.erase(listener.get()) != 0;
    }

    template<typename M, typename... Args>
    void notify(M method, const Args &...args)
    {
        for (auto &listener : alive_listeners())
        {
            ((*listener).*method)(args...);
        }
    }

private:
    std::vector<SharedPtrListener> alive_listeners()
    {
        std::vector<SharedPtrListener> listeners_copy;

        std::lock_guard lock {mutex_};
        listeners_copy.reserve(listeners_.size());
        for (auto it = listeners_.begin(); it != listeners_.end();)
        {
            auto listener = it->second.lock();
            if (listener)
            {
                listeners_copy.push_back(std::move(listener));
                ++it;
            }
            else
            {
                it = listeners_.erase(it);
            }
        }

        return listeners_copy;
    }

    using Key = const void *;
    std::map<Key, WeakPtrListener> listeners_;
    std::mutex                     mutex_;
};
}  // namespace lanshare::utils

#endif  // LANSHARE_UTILS_LISTENERGROUP_HPP_
