#ifndef LANSHARE_NETWORK_HTTPSERVERIMPL_HPP_
#define LANSHARE_NETWORK_HTTPSERVERIMPL_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include <boost/asio.hpp>

#include "httpserver.hpp"

namespace lanshare::utils
{
class Executer;
}  // namespace lanshare::utils

namespace lanshare::network
{
// Forward declarations
class WebSocketSessionImpl;

/// Accepts connections on the io_context and parses requests asynchronously. Request handlers run
/// on handler_executer, so they may block.
class HTTPServerImpl : public HTTPServer
{
public:
    HTTPServerImpl(boost::asio::io_context &io_ctx,
        std::shared_ptr<utils::Executer>    handler_executer, unsigned short port,
        size_t max_body_size, std::chrono::milliseconds read_timeout);
    ~HTTPServerImpl() override;

    void set_request_handler(RequestHandler &&handler) override;
    void set_websocket_handler(std::string path, WebSocketHandler &&handler) override;

    bool                         start() override;
    void                         stop() override;
    [[nodiscard]] unsigned short local_port() const override;

private:
    void track(const std::shared_ptr<WebSocketSessionImpl> &session);

    boost::asio::io_context &                        io_ctx_;
    const std::shared_ptr<utils::Executer>           handler_executer_;
    const unsigned short                             port_;
    const size_t                                     max_body_size_;
    const std::chrono::milliseconds                  read_timeout_;
    boost::asio::ip::tcp::acceptor                   acceptor_;
    RequestHandler                                   request_handler_;
    std::string                                      websocket_path_;
    WebSocketHandler                                 websocket_handler_;
    std::vector<std::weak_ptr<WebSocketSessionImpl>> websocket_sessions_;
    std::mutex                                       mutex_;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_HTTPSERVERIMPL_HPP_
