#ifndef LANSHARE_PROTOCOL_MESSAGESERIALIZERIMPL_HPP_
#define LANSHARE_PROTOCOL_MESSAGESERIALIZERIMPL_HPP_

#include "messageserializer.hpp"

namespace lanshare::protocol
{
/// JSON encoding of the node-to-node messages.
class MessageSerializerImpl : public MessageSerializer
{
public:
    [[nodiscard]] std::vector<uint8_t> serialize(const PeerIdentity &identity) const override;
    [[nodiscard]] std::vector<uint8_t> serialize(const TransferMetadata &metadata) const override;

    bool deserialize(const std::vector<uint8_t> &bytes, PeerIdentity &identity) const override;
    bool deserialize(const std::vector<uint8_t> &bytes, TransferMetadata &metadata) const override;
};
}  // namespace lanshare::protocol

#endif  // LANSHARE_PROTOCOL_MESSAGESERIALIZERIMPL_HPP_
