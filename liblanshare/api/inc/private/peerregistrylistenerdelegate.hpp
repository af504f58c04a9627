#ifndef LANSHARE_API_PEERREGISTRYLISTENERDELEGATE_HPP_
#define LANSHARE_API_PEERREGISTRYLISTENERDELEGATE_HPP_

#include <functional>
#include <memory>

#include "peerregistry.hpp"
#include "peerregistrylistener.hpp"

namespace lanshare
{
class PeerRegistryListenerDelegate
    : public flows::PeerRegistryListener
    , public std::enable_shared_from_this<PeerRegistryListenerDelegate>
{
public:
    using OnPeerOfflineCb = std::function<void(const flows::Peer &)>;

    void register_as_listener(flows::PeerRegistry &registry);
    void unregister_as_listener(flows::PeerRegistry &registry);
    void set_on_peer_offline_cb(OnPeerOfflineCb &&cb);

public:  // from flows::PeerRegistryListener
    void on_peer_offline(const flows::Peer &peer) override;

private:
    OnPeerOfflineCb on_peer_offline_cb_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_PEERREGISTRYLISTENERDELEGATE_HPP_
