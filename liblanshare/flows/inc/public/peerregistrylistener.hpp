#ifndef LANSHARE_FLOWS_PEERREGISTRYLISTENER_HPP_
#define LANSHARE_FLOWS_PEERREGISTRYLISTENER_HPP_

#include "peer.hpp"

namespace lanshare::flows
{
class PeerRegistryListener
{
public:
    virtual ~PeerRegistryListener() = default;

    virtual void on_peer_offline(const Peer &peer) = 0;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_PEERREGISTRYLISTENER_HPP_
