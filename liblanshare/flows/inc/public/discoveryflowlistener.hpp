#ifndef LANSHARE_FLOWS_DISCOVERYFLOWLISTENER_HPP_
#define LANSHARE_FLOWS_DISCOVERYFLOWLISTENER_HPP_

#include "discoveryflow.hpp"
#include "peer.hpp"

namespace lanshare::flows
{
class DiscoveryFlowListener
{
public:
    virtual ~DiscoveryFlowListener() = default;

    virtual void on_state_changed(DiscoveryFlow::State new_state) = 0;
    /// Fired for every answered probe, not only for peers seen for the first time.
    virtual void on_peer_discovered(const Peer &peer) = 0;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_DISCOVERYFLOWLISTENER_HPP_
