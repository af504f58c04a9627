#ifndef LANSHARE_TEST_PEERREGISTRYLISTENER_MOCK_HPP_
#define LANSHARE_TEST_PEERREGISTRYLISTENER_MOCK_HPP_

#include <gmock/gmock.h>

#include "peerregistrylistener.hpp"

using namespace ::lanshare::flows;

class PeerRegistryListenerMock : public PeerRegistryListener
{
public:
    MOCK_METHOD(void, on_peer_offline, (const Peer &), (override));
};

#endif  // LANSHARE_TEST_PEERREGISTRYLISTENER_MOCK_HPP_
