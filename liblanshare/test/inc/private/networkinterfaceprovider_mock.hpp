#ifndef LANSHARE_TEST_NETWORKINTERFACEPROVIDER_MOCK_HPP_
#define LANSHARE_TEST_NETWORKINTERFACEPROVIDER_MOCK_HPP_

#include <gmock/gmock.h>

#include "networkinterfaceprovider.hpp"

using namespace ::lanshare::network;

class NetworkInterfaceProviderMock : public NetworkInterfaceProvider
{
public:
    MOCK_METHOD(std::vector<InterfaceAddress>, active_ipv4_interfaces, (), (const, override));
};

#endif  // LANSHARE_TEST_NETWORKINTERFACEPROVIDER_MOCK_HPP_
