#ifndef LANSHARE_NETWORK_NETWORKINTERFACEPROVIDERIMPL_HPP_
#define LANSHARE_NETWORK_NETWORKINTERFACEPROVIDERIMPL_HPP_

#include "networkinterfaceprovider.hpp"

namespace lanshare::network
{
class NetworkInterfaceProviderImpl : public NetworkInterfaceProvider
{
public:
    [[nodiscard]] std::vector<InterfaceAddress> active_ipv4_interfaces() const override;
};
}  // namespace lanshare::network

#endif  // LANSHARE_NETWORK_NETWORKINTERFACEPROVIDERIMPL_HPP_
