#ifndef LANSHARE_EVENTS_EVENTSINK_HPP_
#define LANSHARE_EVENTS_EVENTSINK_HPP_

#include "event.hpp"

namespace lanshare::events
{
/// Receiving end of a hub subscription.
class EventSink
{
public:
    virtual ~EventSink() = default;

    /// May block. Returning false ends the subscription.
    virtual bool deliver(const Event &event) = 0;
    /// Called once when the subscription ends, whichever side ended it.
    virtual void close() = 0;
};
}  // namespace lanshare::events

#endif  // LANSHARE_EVENTS_EVENTSINK_HPP_
