#ifndef LANSHARE_NETWORK_HTTPCLIENT_HPP_
#define LANSHARE_NETWORK_HTTPCLIENT_HPP_

#include <chrono>
#include <future>

#include "address.hpp"
#include "httpmessages.hpp"

namespace lanshare::network
{
class HTTPClient
{
public:
    virtual ~HTTPClient() = default;

    /// The whole exchange (connect, write, read) is bounded by timeout. The returned future
    /// always becomes ready, with transport_ok = false on any transport failure.
    virtual std::future<HTTPResult> send(
        const Endpoint &to, HTTPRequest request, std::chrono::milliseconds timeout) = 0;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_HTTPCLIENT_HPP_
