#ifndef LANSHARE_FLOWS_TRANSFER_HPP_
#define LANSHARE_FLOWS_TRANSFER_HPP_

#include <string>

#include "address.hpp"
#include "messages.hpp"

namespace lanshare::flows
{
enum class TransferStatus
{
    PENDING,
    ACCEPTED,
    REJECTED,
    COMPLETED
};

enum class TransferDirection
{
    OUTBOUND,
    INBOUND
};

/// One node's copy of a transfer. Sender and receiver each keep their own.
struct Transfer
{
    protocol::TransferId id;
    std::string          file_name;
    protocol::FileSize   size = 0;
    std::string          sender_name;
    network::Endpoint    sender_address;
    /// Name or address as typed by the initiator
    std::string       receiver;
    network::Endpoint receiver_address;
    TransferDirection direction = TransferDirection::OUTBOUND;
    TransferStatus    status    = TransferStatus::PENDING;
};

const char *to_string(TransferStatus status);
const char *to_string(TransferDirection direction);
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_TRANSFER_HPP_
