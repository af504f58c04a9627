#ifndef LANSHARE_NETWORK_HTTPCLIENTIMPL_HPP_
#define LANSHARE_NETWORK_HTTPCLIENTIMPL_HPP_

#include <boost/asio.hpp>

#include "httpclient.hpp"

namespace lanshare::network
{
class HTTPClientImpl : public HTTPClient
{
public:
    HTTPClientImpl(boost::asio::io_context &io_ctx, size_t max_response_body_size);

    std::future<HTTPResult> send(
        const Endpoint &to, HTTPRequest request, std::chrono::milliseconds timeout) override;

private:
    boost::asio::io_context &io_ctx_;
    const size_t             max_response_body_size_;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_HTTPCLIENTIMPL_HPP_
