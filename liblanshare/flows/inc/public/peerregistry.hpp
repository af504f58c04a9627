#ifndef LANSHARE_FLOWS_PEERREGISTRY_HPP_
#define LANSHARE_FLOWS_PEERREGISTRY_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "peer.hpp"

namespace lanshare::flows
{
// Forward declarations
class PeerRegistryListener;

/// Sole owner of the known peers. Everything handed out is a copy.
class PeerRegistry
{
public:
    using Clock = std::chrono::steady_clock;

    enum class UpsertResult
    {
        NEW,
        BACK_ONLINE,
        REFRESHED
    };

    virtual ~PeerRegistry() = default;

    /// Inserts or refreshes the peer at address, marking it online as of now.
    virtual UpsertResult upsert(
        const std::string &display_name, const network::Endpoint &address) = 0;
    [[nodiscard]] virtual std::vector<Peer> list_online() const            = 0;
    /// First online peer carrying that name. Names are not unique.
    [[nodiscard]] virtual std::optional<network::Endpoint> resolve(
        const std::string &display_name) const = 0;
    [[nodiscard]] virtual std::optional<Peer> find(const network::Endpoint &address) const = 0;

    /// Flips stale peers offline and evicts the ones past retention, as of now.
    virtual void reap(Clock::time_point now) = 0;

    /// Starts or stops the periodic reaper.
    virtual void start() = 0;
    virtual void stop()  = 0;

    virtual bool register_listener(std::shared_ptr<PeerRegistryListener> listener)   = 0;
    virtual bool unregister_listener(std::shared_ptr<PeerRegistryListener> listener) = 0;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_PEERREGISTRY_HPP_
