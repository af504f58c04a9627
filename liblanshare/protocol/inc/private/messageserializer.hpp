#ifndef LANSHARE_PROTOCOL_MESSAGESERIALIZER_HPP_
#define LANSHARE_PROTOCOL_MESSAGESERIALIZER_HPP_

#include <cstdint>
#include <vector>

#include "messages.hpp"

namespace lanshare::protocol
{
class MessageSerializer
{
public:
    virtual ~MessageSerializer() = default;

    [[nodiscard]] virtual std::vector<uint8_t> serialize(const PeerIdentity &identity) const = 0;
    [[nodiscard]] virtual std::vector<uint8_t> serialize(
        const TransferMetadata &metadata) const = 0;

    virtual bool deserialize(const std::vector<uint8_t> &bytes, PeerIdentity &identity) const = 0;
    virtual bool deserialize(
        const std::vector<uint8_t> &bytes, TransferMetadata &metadata) const = 0;
};
}  // namespace lanshare::protocol

#endif  // LANSHARE_PROTOCOL_MESSAGESERIALIZER_HPP_
