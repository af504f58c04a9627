#ifndef LANSHARE_EVENTS_EVENT_HPP_
#define LANSHARE_EVENTS_EVENT_HPP_

#include <string>

#include <nlohmann/json.hpp>

namespace lanshare::events
{
namespace event_type
{
constexpr char const *peer_discovered    = "peer_discovered";
constexpr char const *peer_offline       = "peer_offline";
constexpr char const *transfer_request   = "transfer_request";
constexpr char const *transfer_accepted  = "transfer_accepted";
constexpr char const *transfer_rejected  = "transfer_rejected";
constexpr char const *transfer_completed = "transfer_completed";
constexpr char const *transfer_failed    = "transfer_failed";
}  // namespace event_type

struct Event
{
    std::string    type;
    nlohmann::json data;

    /// {"type": ..., "data": ...}
    [[nodiscard]] std::string to_wire_format() const
    {
        return nlohmann::json {{"type", type}, {"data", data}}.dump();
    }
};
}  // namespace lanshare::events

#endif  // LANSHARE_EVENTS_EVENT_HPP_
