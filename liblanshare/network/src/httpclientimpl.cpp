#include "httpclientimpl.hpp"

#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <glog/logging.h>

namespace lanshare::network
{
namespace
{
namespace beast = boost::beast;
namespace http  = boost::beast::http;

using Body = http::vector_body<uint8_t>;

/// State of one request/response exchange, kept alive by the completion handlers.
struct Exchange
{
    Exchange(boost::asio::io_context &io_ctx, size_t body_limit)
        : stream {io_ctx}
    {
        parser.body_limit(body_limit);
    }

    void finish(bool transport_ok, const std::string &error_message = {})
    {
        HTTPResult result;
        result.transport_ok = transport_ok;
        if (transport_ok)
        {
            auto &res     = parser.get();
            result.status = res.result_int();
            result.body   = std::move(res.body());
        }
        else
        {
            LOG(INFO) << "Request " << target << " to " << conversion::to_string(to)
                      << " failed: " << error_message;
        }

        beast::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        promise.set_value(std::move(result));
    }

    beast::tcp_stream           stream;
    beast::flat_buffer          buffer;
    http::request<Body>         request;
    http::response_parser<Body> parser;
    std::promise<HTTPResult>    promise;
    Endpoint                    to;
    std::string                 target;
};

http::verb to_verb(HTTPMethod method)
{
    switch (method)
    {
        case HTTPMethod::GET: return http::verb::get;
        case HTTPMethod::POST: return http::verb::post;
        default: return http::verb::unknown;
    }
}
}  // namespace

HTTPClientImpl::HTTPClientImpl(boost::asio::io_context &io_ctx, size_t max_response_body_size)
    : io_ctx_ {io_ctx}
    , max_response_body_size_ {max_response_body_size}
{}

std::future<HTTPResult> HTTPClientImpl::send(
    const Endpoint &to, HTTPRequest request, std::chrono::milliseconds timeout)
{
    auto exchange    = std::make_shared<Exchange>(io_ctx_, max_response_body_size_);
    auto future      = exchange->promise.get_future();
    exchange->to     = to;
    exchange->target = request.target;

    auto &req = exchange->request;
    req.version(11);
    req.method(to_verb(request.method));
    req.target(request.target);
    req.set(http::field::host, conversion::to_string(to));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto &[name, value] : request.headers)
    {
        req.set(name, value);
    }
    req.body() = std::move(request.body);
    req.prepare_payload();

    boost::asio::ip::tcp::endpoint remote {boost::asio::ip::address_v4 {to.address}, to.port};

    exchange->stream.expires_after(timeout);
    exchange->stream.async_connect(remote, [exchange](const beast::error_code &ec_connect) {
        if (ec_connect)
        {
            exchange->finish(false, ec_connect.message());
            return;
        }

        http::async_write(exchange->stream, exchange->request,
            [exchange](const beast::error_code &ec_write, size_t /*bytes_transferred*/) {
                if (ec_write)
                {
                    exchange->finish(false, ec_write.message());
                    return;
                }

                http::async_read(exchange->stream, exchange->buffer, exchange->parser,
                    [exchange](const beast::error_code &ec_read, size_t /*bytes_transferred*/) {
                        if (ec_read)
                        {
                            exchange->finish(false, ec_read.message());
                            return;
                        }
                        exchange->finish(true);
                    });
            });
    });

    return future;
}
}  // namespace lanshare::network
