#include "peerregistrylistenerdelegate.hpp"

namespace lanshare
{
void PeerRegistryListenerDelegate::register_as_listener(flows::PeerRegistry &registry)
{
    registry.register_listener(shared_from_this());
}

void PeerRegistryListenerDelegate::unregister_as_listener(flows::PeerRegistry &registry)
{
    registry.unregister_listener(shared_from_this());
}

void PeerRegistryListenerDelegate::set_on_peer_offline_cb(OnPeerOfflineCb &&cb)
{
    on_peer_offline_cb_ = std::move(cb);
}

void PeerRegistryListenerDelegate::on_peer_offline(const flows::Peer &peer)
{
    if (on_peer_offline_cb_)
    {
        on_peer_offline_cb_(peer);
    }
}
}  // namespace lanshare
