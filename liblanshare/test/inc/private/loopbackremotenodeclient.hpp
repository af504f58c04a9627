#ifndef LANSHARE_TEST_LOOPBACKREMOTENODECLIENT_HPP_
#define LANSHARE_TEST_LOOPBACKREMOTENODECLIENT_HPP_

#include <map>
#include <memory>
#include <mutex>

#include "remotenodeclient.hpp"
#include "testutils.hpp"
#include "transferflow.hpp"

/// Delivers node-to-node calls straight to the TransferFlow registered for the target endpoint,
/// as if the call had gone through the request router of that node.
class LoopbackNetwork
{
public:
    void attach(const lanshare::network::Endpoint &endpoint,
        std::shared_ptr<lanshare::flows::TransferFlow> flow)
    {
        std::lock_guard lock {mutex_};
        nodes_[endpoint] = std::move(flow);
    }

    void detach(const lanshare::network::Endpoint &endpoint)
    {
        std::lock_guard lock {mutex_};
        nodes_.erase(endpoint);
    }

    std::shared_ptr<lanshare::flows::TransferFlow> node(
        const lanshare::network::Endpoint &endpoint) const
    {
        std::lock_guard lock {mutex_};
        auto            it = nodes_.find(endpoint);
        return it == nodes_.end() ? nullptr : it->second.lock();
    }

private:
    std::map<lanshare::network::Endpoint, std::weak_ptr<lanshare::flows::TransferFlow>> nodes_;
    mutable std::mutex                                                                   mutex_;
};

class LoopbackRemoteNodeClient : public lanshare::protocol::RemoteNodeClient
{
public:
    LoopbackRemoteNodeClient(
        std::shared_ptr<LoopbackNetwork> network, const lanshare::network::Endpoint &self)
        : network_ {std::move(network)}
        , self_ {self}
    {}

    std::future<std::optional<lanshare::protocol::PeerIdentity>> probe(
        const lanshare::network::Endpoint & /*to*/) override
    {
        return testutils::make_ready_future(std::optional<lanshare::protocol::PeerIdentity> {});
    }

    std::future<lanshare::protocol::StatusCode> notify_transfer(
        const lanshare::network::Endpoint &       to,
        const lanshare::protocol::TransferMetadata &metadata) override
    {
        auto flow = network_->node(to);
        return testutils::make_status_future(
            flow ? flow->handle_notify(metadata, self_) :
                   lanshare::protocol::StatusCode::UNREACHABLE);
    }

    std::future<lanshare::protocol::StatusCode> accept_remote(
        const lanshare::network::Endpoint &to, const lanshare::protocol::TransferId &id) override
    {
        auto flow = network_->node(to);
        return testutils::make_status_future(
            flow ? flow->handle_accept_remote(id) : lanshare::protocol::StatusCode::UNREACHABLE);
    }

    std::future<lanshare::protocol::StatusCode> reject_remote(
        const lanshare::network::Endpoint &to, const lanshare::protocol::TransferId &id) override
    {
        auto flow = network_->node(to);
        return testutils::make_status_future(
            flow ? flow->handle_reject_remote(id) : lanshare::protocol::StatusCode::UNREACHABLE);
    }

    std::future<lanshare::protocol::StatusCode> upload(const lanshare::network::Endpoint &to,
        const lanshare::protocol::TransferId &id, std::vector<uint8_t> bytes) override
    {
        auto flow = network_->node(to);
        return testutils::make_status_future(flow ? flow->handle_upload(id, bytes) :
                                                    lanshare::protocol::StatusCode::UNREACHABLE);
    }

private:
    const std::shared_ptr<LoopbackNetwork> network_;
    const lanshare::network::Endpoint      self_;
};

#endif  // LANSHARE_TEST_LOOPBACKREMOTENODECLIENT_HPP_
