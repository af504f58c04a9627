#ifndef LANSHARE_NETWORK_HTTPMESSAGES_HPP_
#define LANSHARE_NETWORK_HTTPMESSAGES_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "address.hpp"

namespace lanshare::network
{
enum class HTTPMethod
{
    GET,
    POST,
    OTHER
};

struct HTTPRequest
{
    HTTPMethod method = HTTPMethod::GET;
    /// Path plus query string, as sent on the request line.
    std::string target;
    /// Header names are lower case.
    std::map<std::string, std::string> headers;
    std::vector<uint8_t>               body;
    /// Remote side of the connection. Not set on outgoing requests.
    Endpoint from;

    [[nodiscard]] std::string header(const std::string &name) const
    {
        auto it = headers.find(name);
        return it == headers.end() ? std::string {} : it->second;
    }
};

struct HTTPResponse
{
    unsigned                           status = 200;
    std::string                        content_type {"application/json"};
    std::map<std::string, std::string> headers;
    std::vector<uint8_t>               body;
};

/// Outcome of an outgoing request. transport_ok is false when no response was received at all
/// (connection refused, timeout, malformed reply).
struct HTTPResult
{
    bool                 transport_ok = false;
    unsigned             status       = 0;
    std::vector<uint8_t> body;

    [[nodiscard]] bool success() const
    {
        return transport_ok && status >= 200 && status < 300;
    }
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_HTTPMESSAGES_HPP_
