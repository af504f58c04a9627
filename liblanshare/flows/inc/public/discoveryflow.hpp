#ifndef LANSHARE_FLOWS_DISCOVERYFLOW_HPP_
#define LANSHARE_FLOWS_DISCOVERYFLOW_HPP_

#include <memory>

#include "messages.hpp"

namespace lanshare::flows
{
// Forward declarations
class DiscoveryFlowListener;

class DiscoveryFlow
{
public:
    enum class State
    {
        IDLE,
        RUNNING,
        STOPPING
    };

    virtual ~DiscoveryFlow() = default;

    virtual void                start()       = 0;
    virtual void                stop()        = 0;
    [[nodiscard]] virtual State state() const = 0;

    /// Starts one sweep of the local subnets right away. Returns false if the previous sweep is
    /// still in progress or the flow is not running.
    virtual bool sweep() = 0;

    /// What this node answers to probes.
    [[nodiscard]] virtual protocol::PeerIdentity identity() const = 0;

    virtual bool register_listener(std::shared_ptr<DiscoveryFlowListener> listener)   = 0;
    virtual bool unregister_listener(std::shared_ptr<DiscoveryFlowListener> listener) = 0;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_DISCOVERYFLOW_HPP_
