#ifndef LANSHARE_TEST_PEERREGISTRY_MOCK_HPP_
#define LANSHARE_TEST_PEERREGISTRY_MOCK_HPP_

#include <gmock/gmock.h>

#include "peerregistry.hpp"

using namespace ::lanshare::flows;

class PeerRegistryMock : public PeerRegistry
{
public:
    MOCK_METHOD(UpsertResult, upsert, (const std::string &, const lanshare::network::Endpoint &),
        (override));
    MOCK_METHOD(std::vector<Peer>, list_online, (), (const, override));
    MOCK_METHOD(std::optional<lanshare::network::Endpoint>, resolve, (const std::string &),
        (const, override));
    MOCK_METHOD(std::optional<Peer>, find, (const lanshare::network::Endpoint &),
        (const, override));
    MOCK_METHOD(void, reap, (Clock::time_point), (override));
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(bool, register_listener, (std::shared_ptr<PeerRegistryListener>), (override));
    MOCK_METHOD(bool, unregister_listener, (std::shared_ptr<PeerRegistryListener>), (override));
};

#endif  // LANSHARE_TEST_PEERREGISTRY_MOCK_HPP_
