#ifndef LANSHARE_FLOWS_TRANSFERFLOWIMPL_HPP_
#define LANSHARE_FLOWS_TRANSFERFLOWIMPL_HPP_

#include <atomic>
#include <map>
#include <mutex>
#include <set>

#include "completiontoken.hpp"
#include "executer.hpp"
#include "listenergroup.hpp"
#include "transferflow.hpp"
#include "transferflowlistener.hpp"

namespace lanshare::network
{
class NetworkInterfaceProvider;
}  // namespace lanshare::network

namespace lanshare::protocol
{
class RemoteNodeClient;
}  // namespace lanshare::protocol

namespace lanshare::storage
{
class StagingStore;
}  // namespace lanshare::storage

namespace lanshare::flows
{
// Forward declarations
class PeerRegistry;

class TransferFlowImpl : public TransferFlow
{
public:
    /// staging keeps outgoing bytes until they are pushed, inbox keeps received bytes until they
    /// are fetched. port is the one this node listens on.
    TransferFlowImpl(std::shared_ptr<PeerRegistry> peer_registry,
        std::shared_ptr<protocol::RemoteNodeClient>        remote_node_client,
        std::shared_ptr<storage::StagingStore>             staging,
        std::shared_ptr<storage::StagingStore>             inbox,
        std::shared_ptr<network::NetworkInterfaceProvider> network_interface_provider,
        std::shared_ptr<utils::Executer> io_executer, std::string device_name,
        unsigned short port);
    ~TransferFlowImpl() override;

    bool  register_listener(std::shared_ptr<TransferFlowListener> listener) override;
    bool  unregister_listener(std::shared_ptr<TransferFlowListener> listener) override;
    State state() const override;
    void  start() override;
    void  stop() override;

    protocol::StatusCode initiate(const std::string &target, const std::string &file_name,
        const std::vector<uint8_t> &bytes, Transfer &transfer) override;
    protocol::StatusCode handle_notify(
        const protocol::TransferMetadata &metadata, const network::Endpoint &from) override;
    protocol::StatusCode accept(const protocol::TransferId &id) override;
    protocol::StatusCode reject(const protocol::TransferId &id) override;
    protocol::StatusCode handle_accept_remote(const protocol::TransferId &id) override;
    protocol::StatusCode handle_reject_remote(const protocol::TransferId &id) override;
    protocol::StatusCode handle_upload(
        const protocol::TransferId &id, const std::vector<uint8_t> &bytes) override;
    protocol::StatusCode fetch(const protocol::TransferId &id, std::vector<uint8_t> &bytes,
        std::string &file_name) override;

    [[nodiscard]] std::vector<Transfer>   list() const override;
    [[nodiscard]] std::optional<Transfer> get(const protocol::TransferId &id) const override;

private:
    /// Moves a transfer of the given direction from one status to another, atomically. The
    /// updated copy is written to out on success.
    protocol::StatusCode transition(const protocol::TransferId &id, TransferDirection direction,
        TransferStatus from, TransferStatus to, Transfer &out);

    [[nodiscard]] std::optional<network::Endpoint> resolve_target(const std::string &target) const;
    [[nodiscard]] network::Endpoint local_endpoint_towards(network::IPv4Address remote) const;
    protocol::TransferId            next_transfer_id();

    void push_bytes(const Transfer &transfer, const utils::CompletionToken &completion_token);
    void set_state(State new_state);
    void stop_impl();
    void add_job(utils::Executer::Job &&job);

    const std::shared_ptr<PeerRegistry>                      peer_registry_;
    const std::shared_ptr<protocol::RemoteNodeClient>        remote_node_client_;
    const std::shared_ptr<storage::StagingStore>             staging_;
    const std::shared_ptr<storage::StagingStore>             inbox_;
    const std::shared_ptr<network::NetworkInterfaceProvider> network_interface_provider_;
    const std::shared_ptr<utils::Executer>                   io_executer_;
    const std::string                                        device_name_;
    const unsigned short                                     port_;
    std::map<protocol::TransferId, Transfer>                 transfers_;
    long long                                                last_id_;
    std::set<utils::CompletionToken>                         running_jobs_;
    std::atomic<State>                                       state_;
    utils::ListenerGroup<TransferFlowListener>               listener_group_;
    mutable std::mutex                                       mutex_;
    std::mutex                                               jobs_mutex_;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_TRANSFERFLOWIMPL_HPP_
