#ifndef LANSHARE_NETWORK_HTTPSERVER_HPP_
#define LANSHARE_NETWORK_HTTPSERVER_HPP_

#include <functional>
#include <memory>
#include <string>

#include "httpmessages.hpp"

namespace lanshare::network
{
// Forward declarations
class WebSocketSession;

class HTTPServer
{
public:
    using RequestHandler   = std::function<HTTPResponse(const HTTPRequest &)>;
    using WebSocketHandler = std::function<void(std::shared_ptr<WebSocketSession>)>;

    virtual ~HTTPServer() = default;

    /// Handlers must be installed before start().
    virtual void set_request_handler(RequestHandler &&handler)                         = 0;
    virtual void set_websocket_handler(std::string path, WebSocketHandler &&handler) = 0;

    virtual bool start() = 0;
    virtual void stop()  = 0;

    /// Port actually bound, useful when the server was configured with port 0.
    [[nodiscard]] virtual unsigned short local_port() const = 0;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_HTTPSERVER_HPP_
