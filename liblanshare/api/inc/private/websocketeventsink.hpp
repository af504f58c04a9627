#ifndef LANSHARE_API_WEBSOCKETEVENTSINK_HPP_
#define LANSHARE_API_WEBSOCKETEVENTSINK_HPP_

#include <chrono>
#include <memory>

#include "eventsink.hpp"

namespace lanshare::network
{
class WebSocketSession;
}  // namespace lanshare::network

namespace lanshare
{
/// Forwards hub events to a connected observer as text frames.
class WebSocketEventSink : public events::EventSink
{
public:
    WebSocketEventSink(std::shared_ptr<network::WebSocketSession> session,
        std::chrono::milliseconds                                 write_timeout);

    bool deliver(const events::Event &event) override;
    void close() override;

private:
    const std::shared_ptr<network::WebSocketSession> session_;
    const std::chrono::milliseconds                  write_timeout_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_WEBSOCKETEVENTSINK_HPP_
