#ifndef LANSHARE_PROTOCOL_REMOTENODECLIENT_HPP_
#define LANSHARE_PROTOCOL_REMOTENODECLIENT_HPP_

#include <cstdint>
#include <future>
#include <optional>
#include <vector>

#include "address.hpp"
#include "messages.hpp"

namespace lanshare::protocol
{
/// Typed calls to the node-to-node endpoints of another LanShare node. All calls are
/// asynchronous; every returned future eventually becomes ready.
class RemoteNodeClient
{
public:
    virtual ~RemoteNodeClient() = default;

    /// Empty result if the node did not answer, or did not answer like a LanShare node.
    virtual std::future<std::optional<PeerIdentity>> probe(const network::Endpoint &to) = 0;

    virtual std::future<StatusCode> notify_transfer(
        const network::Endpoint &to, const TransferMetadata &metadata) = 0;
    virtual std::future<StatusCode> accept_remote(
        const network::Endpoint &to, const TransferId &id) = 0;
    virtual std::future<StatusCode> reject_remote(
        const network::Endpoint &to, const TransferId &id) = 0;
    virtual std::future<StatusCode> upload(
        const network::Endpoint &to, const TransferId &id, std::vector<uint8_t> bytes) = 0;
};
}  // namespace lanshare::protocol

#endif  // LANSHARE_PROTOCOL_REMOTENODECLIENT_HPP_
