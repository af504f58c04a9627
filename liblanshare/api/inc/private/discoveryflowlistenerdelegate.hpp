#ifndef LANSHARE_API_DISCOVERYFLOWLISTENERDELEGATE_HPP_
#define LANSHARE_API_DISCOVERYFLOWLISTENERDELEGATE_HPP_

#include <functional>
#include <memory>

#include "discoveryflow.hpp"
#include "discoveryflowlistener.hpp"

namespace lanshare
{
class DiscoveryFlowListenerDelegate
    : public flows::DiscoveryFlowListener
    , public std::enable_shared_from_this<DiscoveryFlowListenerDelegate>
{
public:
    using OnStateChangedCb   = std::function<void(flows::DiscoveryFlow::State)>;
    using OnPeerDiscoveredCb = std::function<void(const flows::Peer &)>;

    void register_as_listener(flows::DiscoveryFlow &flow);
    void unregister_as_listener(flows::DiscoveryFlow &flow);
    void set_on_state_changed_cb(OnStateChangedCb &&cb);
    void set_on_peer_discovered_cb(OnPeerDiscoveredCb &&cb);

public:  // from flows::DiscoveryFlowListener
    void on_state_changed(flows::DiscoveryFlow::State new_state) override;
    void on_peer_discovered(const flows::Peer &peer) override;

private:
    OnStateChangedCb   on_state_changed_cb_;
    OnPeerDiscoveredCb on_peer_discovered_cb_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_DISCOVERYFLOWLISTENERDELEGATE_HPP_
