#include "discoveryflowimpl.hpp"

#include <future>
#include <optional>

#include <glog/logging.h>

#include "networkinterfaceprovider.hpp"
#include "peerregistry.hpp"
#include "remotenodeclient.hpp"

namespace lanshare::flows
{
namespace
{
const char *to_string(DiscoveryFlow::State state)
{
    switch (state)
    {
        case DiscoveryFlow::State::IDLE: return "IDLE";
        case DiscoveryFlow::State::RUNNING: return "RUNNING";
        case DiscoveryFlow::State::STOPPING: return "STOPPING";
        default: return "INVALID";
    }
}

constexpr network::IPv4Address subnet24_mask = 0xffffff00;
}  // namespace

DiscoveryFlowImpl::DiscoveryFlowImpl(std::shared_ptr<PeerRegistry> peer_registry,
    std::shared_ptr<protocol::RemoteNodeClient>                    remote_node_client,
    std::shared_ptr<network::NetworkInterfaceProvider>             network_interface_provider,
    std::shared_ptr<utils::Executer> executer, std::shared_ptr<utils::Executer> io_executer,
    std::string device_name, unsigned short port, std::chrono::milliseconds sweep_period)
    : peer_registry_ {std::move(peer_registry)}
    , remote_node_client_ {std::move(remote_node_client)}
    , network_interface_provider_ {std::move(network_interface_provider)}
    , executer_ {std::move(executer)}
    , io_executer_ {std::move(io_executer)}
    , device_name_ {std::move(device_name)}
    , port_ {port}
    , sweep_period_ {sweep_period}
    , sweep_timer_ {io_executer_}
    , sweep_in_progress_ {false}
    , state_ {State::IDLE}
{}

DiscoveryFlowImpl::~DiscoveryFlowImpl()
{
    stop_impl();
}

void DiscoveryFlowImpl::start()
{
    State state = state_;
    if (state != State::IDLE)
    {
        LOG(WARNING) << "Cannot start DiscoveryFlow from state " << to_string(state);
        return;
    }

    set_state(State::RUNNING);

    // First sweep right away, then periodically
    sweep();
    sweep_timer_.start(sweep_period_, [this] {
        if (!sweep())
        {
            LOG(INFO) << "Previous sweep still running, skipping this one";
        }
    });
}

void DiscoveryFlowImpl::stop()
{
    stop_impl();
}

DiscoveryFlow::State DiscoveryFlowImpl::state() const
{
    return state_;
}

bool DiscoveryFlowImpl::sweep()
{
    if (state_ != State::RUNNING || sweep_in_progress_.exchange(true))
    {
        return false;
    }

    add_job(executer_, [this](const utils::CompletionToken & /*completion_token*/) {
        auto candidates = sweep_candidates();
        if (candidates.empty())
        {
            LOG(WARNING) << "No usable network interface, nothing to sweep";
            sweep_in_progress_ = false;
            return;
        }

        // All probes go out at once, the transport bounds each of them by the probe timeout
        using ProbeFuture = std::future<std::optional<protocol::PeerIdentity>>;
        auto probes       = std::make_shared<std::vector<ProbeFuture>>();
        probes->reserve(candidates.size());
        for (const auto &candidate : candidates)
        {
            probes->push_back(remote_node_client_->probe(candidate));
        }

        add_job(io_executer_, [this, probes](const utils::CompletionToken &completion_token) {
            size_t responders = 0;
            for (auto &probe : *probes)
            {
                auto identity = probe.get();
                if (completion_token.is_cancelled())
                {
                    break;
                }
                if (!identity)
                {
                    continue;
                }

                ++responders;
                peer_registry_->upsert(identity->name, identity->endpoint);
                if (auto peer = peer_registry_->find(identity->endpoint); peer)
                {
                    listener_group_.notify(&DiscoveryFlowListener::on_peer_discovered, *peer);
                }
            }

            LOG(INFO) << "Sweep of " << probes->size() << " addresses done, " << responders
                      << " responders";
            sweep_in_progress_ = false;
        });
    });

    return true;
}

protocol::PeerIdentity DiscoveryFlowImpl::identity() const
{
    protocol::PeerIdentity identity;
    identity.name          = device_name_;
    identity.endpoint.port = port_;

    auto interfaces = network_interface_provider_->active_ipv4_interfaces();
    if (!interfaces.empty())
    {
        identity.endpoint.address = interfaces.front().address;
    }
    return identity;
}

bool DiscoveryFlowImpl::register_listener(std::shared_ptr<DiscoveryFlowListener> listener)
{
    return listener_group_.add(listener);
}

bool DiscoveryFlowImpl::unregister_listener(std::shared_ptr<DiscoveryFlowListener> listener)
{
    return listener_group_.remove(listener);
}

void DiscoveryFlowImpl::set_state(State new_state)
{
    if (state_ == new_state)
    {
        return;
    }
    state_ = new_state;
    listener_group_.notify(&DiscoveryFlowListener::on_state_changed, new_state);
}

std::vector<network::Endpoint> DiscoveryFlowImpl::sweep_candidates() const
{
    auto interfaces = network_interface_provider_->active_ipv4_interfaces();

    std::set<network::IPv4Address> own_addresses;
    for (const auto &iface : interfaces)
    {
        own_addresses.insert(iface.address);
    }

    // Sorted and free of duplicates when two interfaces share a /24
    std::set<network::IPv4Address> hosts;
    for (const auto &iface : interfaces)
    {
        auto base = iface.broadcast() & subnet24_mask;
        for (network::IPv4Address host = 1; host != 255; ++host)
        {
            auto address = base | host;
            if (own_addresses.count(address) == 0)
            {
                hosts.insert(address);
            }
        }
    }

    std::vector<network::Endpoint> candidates;
    candidates.reserve(hosts.size());
    for (auto address : hosts)
    {
        candidates.push_back({address, port_});
    }
    return candidates;
}

void DiscoveryFlowImpl::stop_impl()
{
    State state = state_;
    if (state != State::RUNNING)
    {
        return;
    }

    set_state(State::STOPPING);

    if (sweep_timer_.is_running())
    {
        sweep_timer_.stop();
    }

    decltype(running_jobs_) running_jobs_copy;
    {
        std::lock_guard lock {mutex_};
        running_jobs_copy = running_jobs_;
    }

    for (const auto &completion_token : running_jobs_copy)
    {
        completion_token.cancel();
        completion_token.wait_for_completion();
    }

    {
        // Jobs cancelled before they ran never removed themselves
        std::lock_guard lock {mutex_};
        running_jobs_.clear();
    }

    sweep_in_progress_ = false;
    set_state(State::IDLE);
}

void DiscoveryFlowImpl::add_job(
    const std::shared_ptr<utils::Executer> &executer, utils::Executer::Job &&job)
{
    if (state_ != State::RUNNING)
    {
        return;
    }

    std::lock_guard lock {mutex_};
    running_jobs_.insert(executer->add_job(
        [this, job = std::move(job)](const utils::CompletionToken &completion_token) {
            job(completion_token);
            std::lock_guard lock {mutex_};
            running_jobs_.erase(completion_token);
        }));
}
}  // namespace lanshare::flows
