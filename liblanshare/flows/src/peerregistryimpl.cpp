#include "peerregistryimpl.hpp"

#include <glog/logging.h>

#include "executer.hpp"

namespace lanshare::flows
{
PeerRegistryImpl::PeerRegistryImpl(std::shared_ptr<utils::Executer> io_executer,
    std::chrono::milliseconds reaper_period, std::chrono::milliseconds liveness_threshold,
    std::chrono::milliseconds retention_threshold)
    : reaper_period_ {reaper_period}
    , liveness_threshold_ {liveness_threshold}
    , retention_threshold_ {retention_threshold}
    , reaper_timer_ {std::move(io_executer)}
{}

PeerRegistryImpl::~PeerRegistryImpl()
{
    if (reaper_timer_.is_running())
    {
        reaper_timer_.stop();
    }
}

PeerRegistry::UpsertResult PeerRegistryImpl::upsert(
    const std::string &display_name, const network::Endpoint &address)
{
    std::lock_guard lock {mutex_};

    auto [it, inserted] = peers_.try_emplace(address);
    auto &peer          = it->second;

    UpsertResult result = inserted      ? UpsertResult::NEW
                          : peer.online ? UpsertResult::REFRESHED
                                        : UpsertResult::BACK_ONLINE;

    peer.display_name   = display_name;
    peer.address        = address;
    peer.last_seen      = Clock::now();
    peer.last_seen_wall = std::chrono::system_clock::now();
    peer.online         = true;

    if (result != UpsertResult::REFRESHED)
    {
        LOG(INFO) << "Peer " << display_name << " at " << network::conversion::to_string(address)
                  << (result == UpsertResult::NEW ? " discovered" : " back online");
    }

    return result;
}

std::vector<Peer> PeerRegistryImpl::list_online() const
{
    std::vector<Peer> result;

    std::lock_guard lock {mutex_};
    for (const auto &[address, peer] : peers_)
    {
        if (peer.online)
        {
            result.push_back(peer);
        }
    }
    return result;
}

std::optional<network::Endpoint> PeerRegistryImpl::resolve(const std::string &display_name) const
{
    std::lock_guard lock {mutex_};
    for (const auto &[address, peer] : peers_)
    {
        if (peer.online && peer.display_name == display_name)
        {
            return address;
        }
    }
    return std::nullopt;
}

std::optional<Peer> PeerRegistryImpl::find(const network::Endpoint &address) const
{
    std::lock_guard lock {mutex_};
    auto            it = peers_.find(address);
    if (it == peers_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void PeerRegistryImpl::reap(Clock::time_point now)
{
    std::vector<Peer> went_offline;

    {
        std::lock_guard lock {mutex_};
        for (auto it = peers_.begin(); it != peers_.end();)
        {
            auto &peer = it->second;
            auto  age  = now - peer.last_seen;

            if (peer.online && age > liveness_threshold_)
            {
                peer.online = false;
                went_offline.push_back(peer);
            }

            if (age > retention_threshold_)
            {
                LOG(INFO) << "Forgetting peer " << peer.display_name << " at "
                          << network::conversion::to_string(peer.address);
                it = peers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (const auto &peer : went_offline)
    {
        LOG(INFO) << "Peer " << peer.display_name << " at "
                  << network::conversion::to_string(peer.address) << " went offline";
        listener_group_.notify(&PeerRegistryListener::on_peer_offline, peer);
    }
}

void PeerRegistryImpl::start()
{
    reaper_timer_.start(reaper_period_, [this] { reap(Clock::now()); });
}

void PeerRegistryImpl::stop()
{
    reaper_timer_.stop();
}

bool PeerRegistryImpl::register_listener(std::shared_ptr<PeerRegistryListener> listener)
{
    return listener_group_.add(listener);
}

bool PeerRegistryImpl::unregister_listener(std::shared_ptr<PeerRegistryListener> listener)
{
    return listener_group_.remove(listener);
}
}  // namespace lanshare::flows
