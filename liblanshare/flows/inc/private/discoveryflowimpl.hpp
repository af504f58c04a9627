#ifndef LANSHARE_FLOWS_DISCOVERYFLOWIMPL_HPP_
#define LANSHARE_FLOWS_DISCOVERYFLOWIMPL_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "completiontoken.hpp"
#include "discoveryflow.hpp"
#include "discoveryflowlistener.hpp"
#include "executer.hpp"
#include "listenergroup.hpp"
#include "timer.hpp"

namespace lanshare::network
{
class NetworkInterfaceProvider;
}  // namespace lanshare::network

namespace lanshare::protocol
{
class RemoteNodeClient;
}  // namespace lanshare::protocol

namespace lanshare::flows
{
// Forward declarations
class PeerRegistry;

class DiscoveryFlowImpl : public DiscoveryFlow
{
public:
    DiscoveryFlowImpl(std::shared_ptr<PeerRegistry> peer_registry,
        std::shared_ptr<protocol::RemoteNodeClient>          remote_node_client,
        std::shared_ptr<network::NetworkInterfaceProvider>   network_interface_provider,
        std::shared_ptr<utils::Executer> executer, std::shared_ptr<utils::Executer> io_executer,
        std::string device_name, unsigned short port, std::chrono::milliseconds sweep_period);
    ~DiscoveryFlowImpl() override;

    void                                 start() override;
    void                                 stop() override;
    [[nodiscard]] State                  state() const override;
    bool                                 sweep() override;
    [[nodiscard]] protocol::PeerIdentity identity() const override;
    bool register_listener(std::shared_ptr<DiscoveryFlowListener> listener) override;
    bool unregister_listener(std::shared_ptr<DiscoveryFlowListener> listener) override;

private:
    void                                         set_state(State new_state);
    [[nodiscard]] std::vector<network::Endpoint> sweep_candidates() const;
    void                                         stop_impl();
    void add_job(const std::shared_ptr<utils::Executer> &executer, utils::Executer::Job &&job);

    const std::shared_ptr<PeerRegistry>                      peer_registry_;
    const std::shared_ptr<protocol::RemoteNodeClient>        remote_node_client_;
    const std::shared_ptr<network::NetworkInterfaceProvider> network_interface_provider_;
    const std::shared_ptr<utils::Executer>                   executer_;
    const std::shared_ptr<utils::Executer>                   io_executer_;
    const std::string                                        device_name_;
    const unsigned short                                     port_;
    const std::chrono::milliseconds                          sweep_period_;
    utils::Timer                                             sweep_timer_;
    std::atomic_bool                                         sweep_in_progress_;
    std::set<utils::CompletionToken>                         running_jobs_;
    std::atomic<State>                                       state_;
    utils::ListenerGroup<DiscoveryFlowListener>              listener_group_;
    mutable std::mutex                                       mutex_;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_DISCOVERYFLOWIMPL_HPP_
