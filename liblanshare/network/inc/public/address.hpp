#ifndef LANSHARE_NETWORK_ADDRESS_HPP_
#define LANSHARE_NETWORK_ADDRESS_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace lanshare::network
{
using IPv4Address = uint32_t;

struct Endpoint
{
    IPv4Address    address = 0;
    unsigned short port    = 0;

    bool operator==(const Endpoint &other) const
    {
        return address == other.address && port == other.port;
    }

    bool operator!=(const Endpoint &other) const
    {
        return !(*this == other);
    }

    bool operator<(const Endpoint &other) const
    {
        return address < other.address || (address == other.address && port < other.port);
    }
};

namespace conversion
{
/// Parses dotted decimal notation. Returns std::nullopt on malformed input.
std::optional<IPv4Address> to_ipv4_address(const std::string &str);
std::string                to_string(IPv4Address address);

/// "a.b.c.d:port"
std::string to_string(const Endpoint &endpoint);

/// Accepts "a.b.c.d" (port taken from default_port) or "a.b.c.d:port".
std::optional<Endpoint> to_endpoint(const std::string &str, unsigned short default_port);
}  // namespace conversion

}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_ADDRESS_HPP_
