#ifndef LANSHARE_FLOWS_PEERREGISTRYIMPL_HPP_
#define LANSHARE_FLOWS_PEERREGISTRYIMPL_HPP_

#include <map>
#include <mutex>

#include "listenergroup.hpp"
#include "peerregistry.hpp"
#include "peerregistrylistener.hpp"
#include "timer.hpp"

namespace lanshare::utils
{
class Executer;
}  // namespace lanshare::utils

namespace lanshare::flows
{
class PeerRegistryImpl : public PeerRegistry
{
public:
    /// io_executer hosts the reaper timer.
    PeerRegistryImpl(std::shared_ptr<utils::Executer> io_executer,
        std::chrono::milliseconds reaper_period, std::chrono::milliseconds liveness_threshold,
        std::chrono::milliseconds retention_threshold);
    ~PeerRegistryImpl() override;

    UpsertResult upsert(const std::string &display_name, const network::Endpoint &address) override;
    [[nodiscard]] std::vector<Peer>                list_online() const override;
    [[nodiscard]] std::optional<network::Endpoint> resolve(
        const std::string &display_name) const override;
    [[nodiscard]] std::optional<Peer> find(const network::Endpoint &address) const override;
    void                              reap(Clock::time_point now) override;
    void                              start() override;
    void                              stop() override;
    bool register_listener(std::shared_ptr<PeerRegistryListener> listener) override;
    bool unregister_listener(std::shared_ptr<PeerRegistryListener> listener) override;

private:
    const std::chrono::milliseconds            reaper_period_;
    const std::chrono::milliseconds            liveness_threshold_;
    const std::chrono::milliseconds            retention_threshold_;
    utils::Timer                               reaper_timer_;
    std::map<network::Endpoint, Peer>          peers_;
    utils::ListenerGroup<PeerRegistryListener> listener_group_;
    mutable std::mutex                         mutex_;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_PEERREGISTRYIMPL_HPP_
