#ifndef LANSHARE_TEST_REMOTENODECLIENT_MOCK_HPP_
#define LANSHARE_TEST_REMOTENODECLIENT_MOCK_HPP_

#include <gmock/gmock.h>

#include "remotenodeclient.hpp"

using namespace ::lanshare::protocol;

class RemoteNodeClientMock : public RemoteNodeClient
{
public:
    MOCK_METHOD(std::future<std::optional<PeerIdentity>>, probe, (const lanshare::network::Endpoint &),
        (override));
    MOCK_METHOD(std::future<StatusCode>, notify_transfer,
        (const lanshare::network::Endpoint &, const TransferMetadata &), (override));
    MOCK_METHOD(std::future<StatusCode>, accept_remote,
        (const lanshare::network::Endpoint &, const TransferId &), (override));
    MOCK_METHOD(std::future<StatusCode>, reject_remote,
        (const lanshare::network::Endpoint &, const TransferId &), (override));
    MOCK_METHOD(std::future<StatusCode>, upload,
        (const lanshare::network::Endpoint &, const TransferId &, std::vector<uint8_t>),
        (override));
};

#endif  // LANSHARE_TEST_REMOTENODECLIENT_MOCK_HPP_
