#ifndef LANSHARE_NETWORK_WEBSOCKETSESSION_HPP_
#define LANSHARE_NETWORK_WEBSOCKETSESSION_HPP_

#include <chrono>
#include <functional>
#include <string>

#include "address.hpp"

namespace lanshare::network
{
/// Server side of an accepted WebSocket connection. Incoming frames are read and discarded, only
/// their absence (a closed connection) is observed.
class WebSocketSession
{
public:
    using CloseCallback = std::function<void()>;

    virtual ~WebSocketSession() = default;

    /// Blocks until the frame is written or the timeout expires. At most one call at a time.
    virtual bool send_text(const std::string &text, std::chrono::milliseconds timeout) = 0;
    virtual void close()                                                                = 0;
    [[nodiscard]] virtual bool     is_open() const                                      = 0;
    [[nodiscard]] virtual Endpoint remote_endpoint() const                              = 0;

    /// Invoked once, from a transport thread, when the peer goes away.
    virtual void set_close_callback(CloseCallback &&callback) = 0;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_WEBSOCKETSESSION_HPP_
