#ifndef LANSHARE_PROTOCOL_REMOTENODECLIENTIMPL_HPP_
#define LANSHARE_PROTOCOL_REMOTENODECLIENTIMPL_HPP_

#include <chrono>
#include <memory>
#include <string>

#include "remotenodeclient.hpp"

namespace lanshare::network
{
class HTTPClient;
}  // namespace lanshare::network

namespace lanshare::protocol
{
// Forward declarations
class MessageSerializer;

class RemoteNodeClientImpl : public RemoteNodeClient
{
public:
    struct Timeouts
    {
        std::chrono::milliseconds probe;
        std::chrono::milliseconds control;
        std::chrono::milliseconds data;
    };

    RemoteNodeClientImpl(std::shared_ptr<network::HTTPClient> http_client,
        std::shared_ptr<const MessageSerializer> message_serializer, const Timeouts &timeouts);

    std::future<std::optional<PeerIdentity>> probe(const network::Endpoint &to) override;

    std::future<StatusCode> notify_transfer(
        const network::Endpoint &to, const TransferMetadata &metadata) override;
    std::future<StatusCode> accept_remote(
        const network::Endpoint &to, const TransferId &id) override;
    std::future<StatusCode> reject_remote(
        const network::Endpoint &to, const TransferId &id) override;
    std::future<StatusCode> upload(
        const network::Endpoint &to, const TransferId &id, std::vector<uint8_t> bytes) override;

private:
    std::future<StatusCode> post(const network::Endpoint &to, std::string target,
        std::vector<uint8_t> body, std::string content_type, std::chrono::milliseconds timeout);

    const std::shared_ptr<network::HTTPClient>     http_client_;
    const std::shared_ptr<const MessageSerializer> message_serializer_;
    const Timeouts                                 timeouts_;
};
}  // namespace lanshare::protocol

#endif  // LANSHARE_PROTOCOL_REMOTENODECLIENTIMPL_HPP_
