#include "jsonformat.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

namespace lanshare
{
namespace
{
std::string to_iso_string(std::chrono::system_clock::time_point time_point)
{
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        time_point.time_since_epoch())
                      .count();
    auto time = boost::posix_time::from_time_t(0) + boost::posix_time::microseconds {micros};
    return boost::posix_time::to_iso_extended_string(time) + 'Z';
}

std::string endpoint_or_empty(const network::Endpoint &endpoint)
{
    return endpoint.address == 0 ? std::string {} : network::conversion::to_string(endpoint);
}
}  // namespace

nlohmann::json to_json(const flows::Peer &peer)
{
    return {{"name", peer.display_name},
        {"ip", network::conversion::to_string(peer.address.address)},
        {"port", peer.address.port}, {"address", network::conversion::to_string(peer.address)},
        {"lastSeen", to_iso_string(peer.last_seen_wall)}, {"online", peer.online}};
}

nlohmann::json to_json(const flows::Transfer &transfer)
{
    return {{"id", transfer.id}, {"filename", transfer.file_name}, {"size", transfer.size},
        {"from", transfer.sender_name},
        {"fromIP", network::conversion::to_string(transfer.sender_address.address)},
        {"fromPort", transfer.sender_address.port}, {"to", transfer.receiver},
        {"toAddress", endpoint_or_empty(transfer.receiver_address)},
        {"status", flows::to_string(transfer.status)},
        {"direction", flows::to_string(transfer.direction)}};
}
}  // namespace lanshare
