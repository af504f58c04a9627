#include "discoveryflowlistenerdelegate.hpp"

namespace lanshare
{
void DiscoveryFlowListenerDelegate::register_as_listener(flows::DiscoveryFlow &flow)
{
    flow.register_listener(shared_from_this());
}

void DiscoveryFlowListenerDelegate::unregister_as_listener(flows::DiscoveryFlow &flow)
{
    flow.unregister_listener(shared_from_this());
}

void DiscoveryFlowListenerDelegate::set_on_state_changed_cb(OnStateChangedCb &&cb)
{
    on_state_changed_cb_ = std::move(cb);
}

void DiscoveryFlowListenerDelegate::set_on_peer_discovered_cb(OnPeerDiscoveredCb &&cb)
{
    on_peer_discovered_cb_ = std::move(cb);
}

void DiscoveryFlowListenerDelegate::on_state_changed(flows::DiscoveryFlow::State new_state)
{
    if (on_state_changed_cb_)
    {
        on_state_changed_cb_(new_state);
    }
}

void DiscoveryFlowListenerDelegate::on_peer_discovered(const flows::Peer &peer)
{
    if (on_peer_discovered_cb_)
    {
        on_peer_discovered_cb_(peer);
    }
}
}  // namespace lanshare
