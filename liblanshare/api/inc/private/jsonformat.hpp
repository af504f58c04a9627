#ifndef LANSHARE_API_JSONFORMAT_HPP_
#define LANSHARE_API_JSONFORMAT_HPP_

#include <nlohmann/json.hpp>

#include "peer.hpp"
#include "transfer.hpp"

namespace lanshare
{
/// {name, ip, port, address, lastSeen, online}
nlohmann::json to_json(const flows::Peer &peer);

/// {id, filename, size, from, fromIP, fromPort, to, toAddress, status, direction}
nlohmann::json to_json(const flows::Transfer &transfer);
}  // namespace lanshare

#endif  // LANSHARE_API_JSONFORMAT_HPP_
