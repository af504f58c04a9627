#include "websocketsessionimpl.hpp"

#include <future>

#include <boost/asio.hpp>
#include <glog/logging.h>

namespace lanshare::network
{
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;

WebSocketSessionImpl::WebSocketSessionImpl(
    beast::tcp_stream &&stream, const Endpoint &remote_endpoint)
    : ws_ {std::move(stream)}
    , remote_endpoint_ {remote_endpoint}
    , open_ {false}
{}

void WebSocketSessionImpl::run(UpgradeRequest request, OpenCallback &&on_open)
{
    // The websocket stream has its own keep-alive and timeout policy
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

    auto req = std::make_shared<UpgradeRequest>(std::move(request));
    ws_.async_accept(*req, [self = shared_from_this(), req, on_open = std::move(on_open)](
                               const beast::error_code &ec) {
        if (ec)
        {
            LOG(WARNING) << "WebSocket handshake with "
                         << conversion::to_string(self->remote_endpoint_)
                         << " failed: " << ec.message();
            return;
        }

        self->open_ = true;
        LOG(INFO) << "WebSocket client connected: " << conversion::to_string(self->remote_endpoint_);
        on_open(self);
        self->read_loop();
    });
}

bool WebSocketSessionImpl::send_text(const std::string &text, std::chrono::milliseconds timeout)
{
    if (!open_)
    {
        return false;
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future  = promise->get_future();
    auto payload = std::make_shared<std::string>(text);

    boost::asio::post(ws_.get_executor(), [self = shared_from_this(), promise, payload] {
        self->ws_.text(true);
        self->ws_.async_write(boost::asio::buffer(*payload),
            [self, promise, payload](const beast::error_code &ec, size_t /*bytes_written*/) {
                if (ec)
                {
                    LOG(WARNING) << "WebSocket write to "
                                 << conversion::to_string(self->remote_endpoint_)
                                 << " failed: " << ec.message();
                }
                promise->set_value(!ec);
            });
    });

    if (future.wait_for(timeout) != std::future_status::ready)
    {
        LOG(WARNING) << "WebSocket write to " << conversion::to_string(remote_endpoint_)
                     << " timed out";
        return false;
    }
    return future.get();
}

void WebSocketSessionImpl::close()
{
    if (!open_.exchange(false))
    {
        return;
    }

    boost::asio::post(ws_.get_executor(), [self = shared_from_this()] {
        self->ws_.async_close(websocket::close_code::going_away,
            [self](const beast::error_code &ec) {
                if (ec)
                {
                    LOG(INFO) << "WebSocket close: " << ec.message();
                }
            });
    });
}

bool WebSocketSessionImpl::is_open() const
{
    return open_;
}

Endpoint WebSocketSessionImpl::remote_endpoint() const
{
    return remote_endpoint_;
}

void WebSocketSessionImpl::set_close_callback(CloseCallback &&callback)
{
    std::lock_guard lock {mutex_};
    close_callback_ = std::move(callback);
}

void WebSocketSessionImpl::read_loop()
{
    ws_.async_read(read_buffer_,
        [self = shared_from_this()](const beast::error_code &ec, size_t /*bytes_read*/) {
            if (ec)
            {
                if (ec != websocket::error::closed)
                {
                    LOG(INFO) << "WebSocket read from "
                              << conversion::to_string(self->remote_endpoint_) << ": "
                              << ec.message();
                }
                self->on_closed();
                return;
            }
            self->read_buffer_.consume(self->read_buffer_.size());
            self->read_loop();
        });
}

void WebSocketSessionImpl::on_closed()
{
    open_ = false;

    CloseCallback callback;
    {
        std::lock_guard lock {mutex_};
        callback = std::move(close_callback_);
        close_callback_ = nullptr;
    }

    LOG(INFO) << "WebSocket client disconnected: " << conversion::to_string(remote_endpoint_);
    if (callback)
    {
        callback();
    }
}
}  // namespace lanshare::network
