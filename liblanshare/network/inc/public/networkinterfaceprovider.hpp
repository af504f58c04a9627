#ifndef LANSHARE_NETWORK_NETWORKINTERFACEPROVIDER_HPP_
#define LANSHARE_NETWORK_NETWORKINTERFACEPROVIDER_HPP_

#include <string>
#include <vector>

#include "address.hpp"

namespace lanshare::network
{
struct InterfaceAddress
{
    std::string name;
    IPv4Address address = 0;
    IPv4Address netmask = 0;

    [[nodiscard]] IPv4Address broadcast() const
    {
        return address | ~netmask;
    }
};

class NetworkInterfaceProvider
{
public:
    virtual ~NetworkInterfaceProvider() = default;

    /// IPv4 addresses of the interfaces that are up, loopback excluded.
    [[nodiscard]] virtual std::vector<InterfaceAddress> active_ipv4_interfaces() const = 0;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_NETWORKINTERFACEPROVIDER_HPP_
