#ifndef LANSHARE_PROTOCOL_MESSAGES_HPP_
#define LANSHARE_PROTOCOL_MESSAGES_HPP_

#include <cstdint>
#include <string>

#include "address.hpp"

namespace lanshare::protocol
{
using TransferId = std::string;
using FileSize   = uint64_t;

enum class StatusCode : uint8_t
{
    OK            = 0,
    NOT_FOUND     = 1,
    INVALID_STATE = 2,
    UNREACHABLE   = 3,
    IO_FAILURE    = 4,
    BAD_REQUEST   = 5
};

/// Reply to a discovery probe.
struct PeerIdentity
{
    std::string       name;
    network::Endpoint endpoint;
};

/// What the sender tells the receiver about a transfer it initiated.
struct TransferMetadata
{
    TransferId        id;
    std::string       file_name;
    FileSize          size = 0;
    std::string       sender_name;
    /// address == 0 when the sender did not announce it
    network::Endpoint sender_address;
    /// Name or address of the receiver, as the initiator typed it
    std::string receiver;
};

const char *to_string(StatusCode status);

unsigned   to_http_status(StatusCode status);
StatusCode from_http_status(unsigned http_status);
}  // namespace lanshare::protocol

#endif  // LANSHARE_PROTOCOL_MESSAGES_HPP_
