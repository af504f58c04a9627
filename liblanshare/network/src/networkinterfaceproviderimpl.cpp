#include "networkinterfaceproviderimpl.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <glog/logging.h>

namespace lanshare::network
{
std::vector<InterfaceAddress> NetworkInterfaceProviderImpl::active_ipv4_interfaces() const
{
    std::vector<InterfaceAddress> result;

    ifaddrs *ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0)
    {
        LOG(ERROR) << "getifaddrs failed: " << std::strerror(errno);
        return result;
    }

    for (ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == nullptr || ifa->ifa_netmask == nullptr ||
            ifa->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0)
        {
            continue;
        }

        InterfaceAddress entry;
        entry.name = ifa->ifa_name;
        entry.address =
            ntohl(reinterpret_cast<const sockaddr_in *>(ifa->ifa_addr)->sin_addr.s_addr);
        entry.netmask =
            ntohl(reinterpret_cast<const sockaddr_in *>(ifa->ifa_netmask)->sin_addr.s_addr);
        result.push_back(std::move(entry));
    }

    freeifaddrs(ifaddr);
    return result;
}
}  // namespace lanshare::network
