#ifndef LANSHARE_API_REQUESTROUTER_HPP_
#define LANSHARE_API_REQUESTROUTER_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "httpmessages.hpp"

namespace lanshare::flows
{
class DiscoveryFlow;
class PeerRegistry;
class TransferFlow;
}  // namespace lanshare::flows

namespace lanshare::protocol
{
class MessageSerializer;
}  // namespace lanshare::protocol

namespace lanshare
{
/// Maps the HTTP routes, node-to-node and local, onto flow operations.
class RequestRouter
{
public:
    RequestRouter(std::shared_ptr<flows::PeerRegistry>     peer_registry,
        std::shared_ptr<flows::DiscoveryFlow>              discovery_flow,
        std::shared_ptr<flows::TransferFlow>               transfer_flow,
        std::shared_ptr<const protocol::MessageSerializer> message_serializer);

    [[nodiscard]] network::HTTPResponse handle(const network::HTTPRequest &request) const;

private:
    using Query   = std::map<std::string, std::string>;
    using Handler = network::HTTPResponse (RequestRouter::*)(
        const network::HTTPRequest &, const std::string &, const Query &) const;

    struct Route
    {
        network::HTTPMethod method;
        std::string         path;
        /// The route is path + "/{id}"
        bool    takes_id;
        Handler handler;
    };

    network::HTTPResponse discover(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse notify_transfer(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse accept_remote(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse reject_remote(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse upload(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse device_name(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse peers(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse transfers(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse transfer(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse send(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse accept(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse reject(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse download(
        const network::HTTPRequest &request, const std::string &id, const Query &query) const;
    network::HTTPResponse transfer_response(const std::string &id) const;

    const std::shared_ptr<flows::PeerRegistry>               peer_registry_;
    const std::shared_ptr<flows::DiscoveryFlow>              discovery_flow_;
    const std::shared_ptr<flows::TransferFlow>               transfer_flow_;
    const std::shared_ptr<const protocol::MessageSerializer> message_serializer_;
    const std::vector<Route>                                 routes_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_REQUESTROUTER_HPP_
