#include "eventhubimpl.hpp"

#include <vector>

#include <glog/logging.h>

#include "eventsink.hpp"
#include "executer.hpp"

namespace lanshare::events
{
EventHubImpl::EventHubImpl(std::shared_ptr<utils::Executer> io_executer, size_t queue_size)
    : io_executer_ {std::move(io_executer)}
    , queue_size_ {queue_size == 0 ? 1 : queue_size}
    , running_ {false}
    , next_handle_ {invalid_handle + 1}
{}

EventHubImpl::~EventHubImpl()
{
    stop();
}

void EventHubImpl::start()
{
    std::lock_guard lock {mutex_};
    running_ = true;
}

void EventHubImpl::stop()
{
    decltype(running_jobs_) running_jobs_copy;
    decltype(subscribers_)  subscribers;
    {
        std::lock_guard lock {mutex_};
        if (!running_)
        {
            return;
        }
        running_          = false;
        running_jobs_copy = running_jobs_;
        subscribers.swap(subscribers_);
    }

    for (const auto &completion_token : running_jobs_copy)
    {
        completion_token.cancel();
        completion_token.wait_for_completion();
    }

    {
        std::lock_guard lock {mutex_};
        running_jobs_.clear();
    }

    for (auto &[handle, subscriber] : subscribers)
    {
        subscriber.sink->close();
    }
}

EventHub::SubscriptionHandle EventHubImpl::subscribe(std::shared_ptr<EventSink> sink)
{
    if (!sink)
    {
        return invalid_handle;
    }

    std::lock_guard lock {mutex_};
    auto            handle = next_handle_++;
    subscribers_[handle].sink = std::move(sink);
    LOG(INFO) << "Event subscriber " << handle << " added, " << subscribers_.size() << " in total";
    return handle;
}

bool EventHubImpl::unsubscribe(SubscriptionHandle handle)
{
    std::shared_ptr<EventSink> sink;
    {
        std::lock_guard lock {mutex_};
        auto            it = subscribers_.find(handle);
        if (it == subscribers_.end())
        {
            return false;
        }
        sink = std::move(it->second.sink);
        subscribers_.erase(it);
    }

    LOG(INFO) << "Event subscriber " << handle << " removed";
    sink->close();
    return true;
}

void EventHubImpl::publish(const Event &event)
{
    std::vector<std::shared_ptr<EventSink>> dropped;

    {
        std::lock_guard lock {mutex_};
        if (!running_)
        {
            LOG(WARNING) << "Event hub not running, dropping " << event.type << " event";
            return;
        }

        for (auto it = subscribers_.begin(); it != subscribers_.end();)
        {
            auto &[handle, subscriber] = *it;
            if (subscriber.queue.size() >= queue_size_)
            {
                LOG(WARNING) << "Event subscriber " << handle << " fell " << queue_size_
                             << " events behind, dropping it";
                dropped.push_back(std::move(subscriber.sink));
                it = subscribers_.erase(it);
                continue;
            }

            subscriber.queue.push_back(event);
            if (!subscriber.draining)
            {
                schedule_drain(handle, subscriber);
            }
            ++it;
        }
    }

    for (const auto &sink : dropped)
    {
        sink->close();
    }
}

size_t EventHubImpl::subscriber_count() const
{
    std::lock_guard lock {mutex_};
    return subscribers_.size();
}

void EventHubImpl::schedule_drain(SubscriptionHandle handle, Subscriber &subscriber)
{
    subscriber.draining = true;
    running_jobs_.insert(io_executer_->add_job(
        [this, handle](const utils::CompletionToken &completion_token) {
            drain(handle, completion_token);
        }));
}

void EventHubImpl::drain(SubscriptionHandle handle, const utils::CompletionToken &completion_token)
{
    for (;;)
    {
        std::shared_ptr<EventSink> sink;
        Event                      event;
        {
            std::lock_guard lock {mutex_};
            auto            it = subscribers_.find(handle);
            if (it == subscribers_.end() || completion_token.is_cancelled() ||
                it->second.queue.empty())
            {
                if (it != subscribers_.end())
                {
                    it->second.draining = false;
                }
                running_jobs_.erase(completion_token);
                return;
            }

            event = std::move(it->second.queue.front());
            it->second.queue.pop_front();
            sink = it->second.sink;
        }

        if (!sink->deliver(event))
        {
            LOG(WARNING) << "Delivery to event subscriber " << handle << " failed, dropping it";

            bool removed;
            {
                std::lock_guard lock {mutex_};
                removed = subscribers_.erase(handle) != 0;
                running_jobs_.erase(completion_token);
            }
            if (removed)
            {
                sink->close();
            }
            return;
        }
    }
}
}  // namespace lanshare::events
