#ifndef LANSHARE_FLOWS_PEER_HPP_
#define LANSHARE_FLOWS_PEER_HPP_

#include <chrono>
#include <string>

#include "address.hpp"

namespace lanshare::flows
{
struct Peer
{
    std::string       display_name;
    network::Endpoint address;
    /// Drives liveness
    std::chrono::steady_clock::time_point last_seen;
    /// Same moment, for display only
    std::chrono::system_clock::time_point last_seen_wall;
    bool                                  online = false;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_PEER_HPP_
