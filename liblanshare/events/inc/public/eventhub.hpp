#ifndef LANSHARE_EVENTS_EVENTHUB_HPP_
#define LANSHARE_EVENTS_EVENTHUB_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>

#include "event.hpp"

namespace lanshare::events
{
// Forward declarations
class EventSink;

/// Fans events out to subscribers. Every subscriber sees events in publish order; a subscriber
/// that falls behind or fails a delivery is dropped.
class EventHub
{
public:
    using SubscriptionHandle = uint64_t;

    static constexpr SubscriptionHandle invalid_handle = 0;

    virtual ~EventHub() = default;

    virtual void start() = 0;
    virtual void stop()  = 0;

    virtual SubscriptionHandle subscribe(std::shared_ptr<EventSink> sink) = 0;
    virtual bool               unsubscribe(SubscriptionHandle handle)     = 0;
    /// Never blocks on a subscriber.
    virtual void                 publish(const Event &event) = 0;
    [[nodiscard]] virtual size_t subscriber_count() const    = 0;
};
}  // namespace lanshare::events

#endif  // LANSHARE_EVENTS_EVENTHUB_HPP_
