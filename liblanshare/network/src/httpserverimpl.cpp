#include "httpserverimpl.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <glog/logging.h>

#include "executer.hpp"
#include "websocketsessionimpl.hpp"

namespace lanshare::network
{
namespace
{
namespace beast = boost::beast;
namespace http  = boost::beast::http;

using Body = http::vector_body<uint8_t>;

struct SessionContext
{
    std::shared_ptr<utils::Executer>                                   executer;
    HTTPServer::RequestHandler                                         request_handler;
    std::string                                                        websocket_path;
    HTTPServer::WebSocketHandler                                       websocket_handler;
    std::function<void(const std::shared_ptr<WebSocketSessionImpl> &)> on_websocket;
    size_t                                                             max_body_size = 0;
    std::chrono::milliseconds                                          read_timeout {};
};

std::string path_of(beast::string_view target)
{
    auto path = std::string {target};
    auto q    = path.find('?');
    if (q != std::string::npos)
    {
        path.resize(q);
    }
    return path;
}

HTTPRequest to_request(http::request<Body> &&req, const Endpoint &from)
{
    HTTPRequest request;
    switch (req.method())
    {
        case http::verb::get: request.method = HTTPMethod::GET; break;
        case http::verb::post: request.method = HTTPMethod::POST; break;
        default: request.method = HTTPMethod::OTHER; break;
    }
    request.target = std::string {req.target()};
    for (const auto &field : req)
    {
        std::string name {field.name_string()};
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return char(std::tolower(c)); });
        request.headers[name] = std::string {field.value()};
    }
    request.body = std::move(req.body());
    request.from = from;
    return request;
}

/// One HTTP/1.1 connection. Reads requests until the client closes or asks not to keep alive.
class HTTPSession : public std::enable_shared_from_this<HTTPSession>
{
public:
    HTTPSession(boost::asio::ip::tcp::socket &&socket, std::shared_ptr<SessionContext> ctx,
        const Endpoint &remote)
        : stream_ {std::move(socket)}
        , ctx_ {std::move(ctx)}
        , remote_ {remote}
    {}

    void read_next()
    {
        parser_.emplace();
        parser_->body_limit(ctx_->max_body_size);
        stream_.expires_after(ctx_->read_timeout);

        http::async_read(stream_, buffer_, *parser_,
            [self = shared_from_this()](const beast::error_code &ec, size_t /*bytes_read*/) {
                self->on_read(ec);
            });
    }

private:
    void on_read(const beast::error_code &ec)
    {
        if (ec == http::error::end_of_stream)
        {
            shutdown();
            return;
        }
        if (ec)
        {
            if (ec != beast::error::timeout)
            {
                LOG(WARNING) << "Reading request from " << conversion::to_string(remote_)
                             << " failed: " << ec.message();
            }
            shutdown();
            return;
        }

        auto req = parser_->release();

        if (beast::websocket::is_upgrade(req))
        {
            if (!ctx_->websocket_handler || path_of(req.target()) != ctx_->websocket_path)
            {
                LOG(WARNING) << "Unexpected WebSocket upgrade for " << req.target();
                shutdown();
                return;
            }
            auto session = std::make_shared<WebSocketSessionImpl>(std::move(stream_), remote_);
            ctx_->on_websocket(session);
            auto handler = ctx_->websocket_handler;
            session->run(std::move(req), std::move(handler));
            return;
        }

        bool keep_alive = req.keep_alive();
        auto version    = req.version();
        auto request    = std::make_shared<HTTPRequest>(to_request(std::move(req), remote_));

        ctx_->executer->add_job(
            [self = shared_from_this(), request, keep_alive, version](
                const utils::CompletionToken &token) {
                if (token.is_cancelled())
                {
                    return;
                }
                auto response = self->ctx_->request_handler
                                    ? self->ctx_->request_handler(*request)
                                    : HTTPResponse {500, "text/plain", {}, {}};
                boost::asio::post(self->stream_.get_executor(),
                    [self, response = std::move(response), keep_alive, version]() mutable {
                        self->write(std::move(response), keep_alive, version);
                    });
            });
    }

    void write(HTTPResponse &&response, bool keep_alive, unsigned version)
    {
        auto res = std::make_shared<http::response<Body>>(
            static_cast<http::status>(response.status), version);
        res->set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res->set(http::field::content_type, response.content_type);
        for (const auto &[name, value] : response.headers)
        {
            res->set(name, value);
        }
        res->body() = std::move(response.body);
        res->keep_alive(keep_alive);
        res->prepare_payload();

        stream_.expires_after(ctx_->read_timeout);
        http::async_write(stream_, *res,
            [self = shared_from_this(), res](const beast::error_code &ec, size_t /*written*/) {
                if (ec)
                {
                    LOG(WARNING) << "Writing response to " << conversion::to_string(self->remote_)
                                 << " failed: " << ec.message();
                    self->shutdown();
                    return;
                }
                if (!res->keep_alive())
                {
                    self->shutdown();
                    return;
                }
                self->read_next();
            });
    }

    void shutdown()
    {
        beast::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream                         stream_;
    beast::flat_buffer                        buffer_;
    std::optional<http::request_parser<Body>> parser_;
    const std::shared_ptr<SessionContext>     ctx_;
    const Endpoint                            remote_;
};

void accept_loop(boost::asio::io_context &io_ctx, boost::asio::ip::tcp::acceptor &acceptor,
    std::shared_ptr<SessionContext> ctx)
{
    acceptor.async_accept(boost::asio::make_strand(io_ctx),
        [&io_ctx, &acceptor, ctx](
            const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket) {
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                {
                    LOG(WARNING) << "Accept failed: " << ec.message();
                }
                return;
            }

            boost::system::error_code ec_remote;
            auto                      remote = socket.remote_endpoint(ec_remote);
            if (!ec_remote)
            {
                Endpoint from {remote.address().to_v4().to_uint(), remote.port()};
                std::make_shared<HTTPSession>(std::move(socket), ctx, from)->read_next();
            }

            accept_loop(io_ctx, acceptor, ctx);
        });
}
}  // namespace

HTTPServerImpl::HTTPServerImpl(boost::asio::io_context &io_ctx,
    std::shared_ptr<utils::Executer> handler_executer, unsigned short port, size_t max_body_size,
    std::chrono::milliseconds read_timeout)
    : io_ctx_ {io_ctx}
    , handler_executer_ {std::move(handler_executer)}
    , port_ {port}
    , max_body_size_ {max_body_size}
    , read_timeout_ {read_timeout}
    , acceptor_ {io_ctx_}
{}

HTTPServerImpl::~HTTPServerImpl()
{
    stop();
}

void HTTPServerImpl::set_request_handler(RequestHandler &&handler)
{
    request_handler_ = std::move(handler);
}

void HTTPServerImpl::set_websocket_handler(std::string path, WebSocketHandler &&handler)
{
    websocket_path_    = std::move(path);
    websocket_handler_ = std::move(handler);
}

bool HTTPServerImpl::start()
{
    boost::asio::ip::tcp::endpoint endpoint {boost::asio::ip::tcp::v4(), port_};
    boost::system::error_code      ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
    {
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec)
    {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec)
    {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec)
    {
        LOG(ERROR) << "Cannot listen on port " << port_ << ": " << ec.message();
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    auto ctx               = std::make_shared<SessionContext>();
    ctx->executer          = handler_executer_;
    ctx->request_handler   = request_handler_;
    ctx->websocket_path    = websocket_path_;
    ctx->websocket_handler = websocket_handler_;
    ctx->on_websocket      = [this](const std::shared_ptr<WebSocketSessionImpl> &session) {
        track(session);
    };
    ctx->max_body_size = max_body_size_;
    ctx->read_timeout  = read_timeout_;

    LOG(INFO) << "HTTP server listening on port " << local_port();
    accept_loop(io_ctx_, acceptor_, std::move(ctx));
    return true;
}

void HTTPServerImpl::stop()
{
    boost::system::error_code ec;
    acceptor_.close(ec);

    std::vector<std::weak_ptr<WebSocketSessionImpl>> sessions;
    {
        std::lock_guard lock {mutex_};
        sessions.swap(websocket_sessions_);
    }
    for (const auto &weak_session : sessions)
    {
        if (auto session = weak_session.lock())
        {
            session->close();
        }
    }
}

unsigned short HTTPServerImpl::local_port() const
{
    boost::system::error_code ec;
    auto                      endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void HTTPServerImpl::track(const std::shared_ptr<WebSocketSessionImpl> &session)
{
    std::lock_guard lock {mutex_};
    websocket_sessions_.erase(std::remove_if(websocket_sessions_.begin(),
                                  websocket_sessions_.end(),
                                  [](const auto &weak_session) { return weak_session.expired(); }),
        websocket_sessions_.end());
    websocket_sessions_.push_back(session);
}
}  // namespace lanshare::network
