#ifndef LANSHARE_NETWORK_WEBSOCKETSESSIONIMPL_HPP_
#define LANSHARE_NETWORK_WEBSOCKETSESSIONIMPL_HPP_

#include <atomic>
#include <memory>
#include <mutex>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "websocketsession.hpp"

namespace lanshare::network
{
class WebSocketSessionImpl
    : public WebSocketSession
    , public std::enable_shared_from_this<WebSocketSessionImpl>
{
public:
    using UpgradeRequest = boost::beast::http::request<boost::beast::http::vector_body<uint8_t>>;
    using OpenCallback   = std::function<void(std::shared_ptr<WebSocketSession>)>;

    WebSocketSessionImpl(boost::beast::tcp_stream &&stream, const Endpoint &remote_endpoint);

    /// Completes the handshake for the given upgrade request, then calls on_open and starts
    /// reading.
    void run(UpgradeRequest request, OpenCallback &&on_open);

    bool               send_text(const std::string &text, std::chrono::milliseconds timeout) override;
    void               close() override;
    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] Endpoint remote_endpoint() const override;
    void                   set_close_callback(CloseCallback &&callback) override;

private:
    void read_loop();
    void on_closed();

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer                                 read_buffer_;
    const Endpoint                                            remote_endpoint_;
    std::atomic_bool                                          open_;
    CloseCallback                                             close_callback_;
    std::mutex                                                mutex_;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_WEBSOCKETSESSIONIMPL_HPP_
