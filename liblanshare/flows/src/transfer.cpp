#include "transfer.hpp"

namespace lanshare::flows
{
const char *to_string(TransferStatus status)
{
    switch (status)
    {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::ACCEPTED: return "accepted";
        case TransferStatus::REJECTED: return "rejected";
        case TransferStatus::COMPLETED: return "completed";
        default: return "unknown";
    }
}

const char *to_string(TransferDirection direction)
{
    switch (direction)
    {
        case TransferDirection::OUTBOUND: return "outbound";
        case TransferDirection::INBOUND: return "inbound";
        default: return "unknown";
    }
}
}  // namespace lanshare::flows
