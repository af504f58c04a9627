#ifndef LANSHARE_EVENTS_EVENTHUBIMPL_HPP_
#define LANSHARE_EVENTS_EVENTHUBIMPL_HPP_

#include <deque>
#include <map>
#include <mutex>
#include <set>

#include "completiontoken.hpp"
#include "eventhub.hpp"

namespace lanshare::utils
{
class Executer;
}  // namespace lanshare::utils

namespace lanshare::events
{
class EventHubImpl : public EventHub
{
public:
    /// Each subscriber owns a queue of at most queue_size events, drained by a job on
    /// io_executer.
    EventHubImpl(std::shared_ptr<utils::Executer> io_executer, size_t queue_size);
    ~EventHubImpl() override;

    void start() override;
    void stop() override;

    SubscriptionHandle   subscribe(std::shared_ptr<EventSink> sink) override;
    bool                 unsubscribe(SubscriptionHandle handle) override;
    void                 publish(const Event &event) override;
    [[nodiscard]] size_t subscriber_count() const override;

private:
    struct Subscriber
    {
        std::shared_ptr<EventSink> sink;
        std::deque<Event>          queue;
        bool                       draining = false;
    };

    void drain(SubscriptionHandle handle, const utils::CompletionToken &completion_token);
    /// Must be called with mutex_ held.
    void schedule_drain(SubscriptionHandle handle, Subscriber &subscriber);

    const std::shared_ptr<utils::Executer>   io_executer_;
    const size_t                             queue_size_;
    bool                                     running_;
    SubscriptionHandle                       next_handle_;
    std::map<SubscriptionHandle, Subscriber> subscribers_;
    std::set<utils::CompletionToken>         running_jobs_;
    mutable std::mutex                       mutex_;
};
}  // namespace lanshare::events

#endif  // LANSHARE_EVENTS_EVENTHUBIMPL_HPP_
