#include "websocketeventsink.hpp"

#include "websocketsession.hpp"

namespace lanshare
{
WebSocketEventSink::WebSocketEventSink(
    std::shared_ptr<network::WebSocketSession> session, std::chrono::milliseconds write_timeout)
    : session_ {std::move(session)}
    , write_timeout_ {write_timeout}
{}

bool WebSocketEventSink::deliver(const events::Event &event)
{
    return session_->send_text(event.to_wire_format(), write_timeout_);
}

void WebSocketEventSink::close()
{
    session_->close();
}
}  // namespace lanshare
