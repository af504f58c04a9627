#include "messageserializerimpl.hpp"

#include <limits>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace lanshare::protocol
{
namespace
{
std::vector<uint8_t> to_bytes(const nlohmann::json &json)
{
    auto str = json.dump();
    return {str.cbegin(), str.cend()};
}

bool parse_object(const std::vector<uint8_t> &bytes, nlohmann::json &json)
{
    json = nlohmann::json::parse(bytes.cbegin(), bytes.cend(), nullptr, false);
    if (json.is_discarded() || !json.is_object())
    {
        LOG(WARNING) << "Malformed message: not a JSON object";
        return false;
    }
    return true;
}

bool read_port(const nlohmann::json &json, const char *key, unsigned short &port)
{
    auto it = json.find(key);
    if (it == json.end() || !it->is_number_unsigned())
    {
        return false;
    }
    auto value = it->get<unsigned long long>();
    if (value == 0 || value > std::numeric_limits<unsigned short>::max())
    {
        return false;
    }
    port = static_cast<unsigned short>(value);
    return true;
}

std::string read_string(const nlohmann::json &json, const char *key)
{
    auto it = json.find(key);
    return (it != json.end() && it->is_string()) ? it->get<std::string>() : std::string {};
}
}  // namespace

std::vector<uint8_t> MessageSerializerImpl::serialize(const PeerIdentity &identity) const
{
    return to_bytes({{"name", identity.name},
        {"ip", network::conversion::to_string(identity.endpoint.address)},
        {"port", identity.endpoint.port}});
}

std::vector<uint8_t> MessageSerializerImpl::serialize(const TransferMetadata &metadata) const
{
    nlohmann::json json {{"id", metadata.id}, {"filename", metadata.file_name},
        {"size", metadata.size}, {"from", metadata.sender_name}, {"to", metadata.receiver},
        {"status", "pending"}};
    if (metadata.sender_address.address != 0)
    {
        json["fromIP"]   = network::conversion::to_string(metadata.sender_address.address);
        json["fromPort"] = metadata.sender_address.port;
    }
    return to_bytes(json);
}

bool MessageSerializerImpl::deserialize(
    const std::vector<uint8_t> &bytes, PeerIdentity &identity) const
{
    nlohmann::json json;
    if (!parse_object(bytes, json))
    {
        return false;
    }

    identity.name = read_string(json, "name");
    if (identity.name.empty())
    {
        LOG(WARNING) << "Probe reply without a name";
        return false;
    }

    if (auto addr = network::conversion::to_ipv4_address(read_string(json, "ip")); addr)
    {
        identity.endpoint.address = *addr;
    }
    read_port(json, "port", identity.endpoint.port);

    return true;
}

bool MessageSerializerImpl::deserialize(
    const std::vector<uint8_t> &bytes, TransferMetadata &metadata) const
{
    nlohmann::json json;
    if (!parse_object(bytes, json))
    {
        return false;
    }

    metadata.id        = read_string(json, "id");
    metadata.file_name = read_string(json, "filename");
    if (metadata.id.empty() || metadata.file_name.empty())
    {
        LOG(WARNING) << "Transfer metadata without id or file name";
        return false;
    }

    auto size = json.find("size");
    if (size == json.end() || !size->is_number_unsigned())
    {
        LOG(WARNING) << "Transfer metadata " << metadata.id << " has no valid size";
        return false;
    }
    metadata.size        = size->get<FileSize>();
    metadata.sender_name = read_string(json, "from");
    metadata.receiver    = read_string(json, "to");

    metadata.sender_address = {};
    if (auto addr = network::conversion::to_ipv4_address(read_string(json, "fromIP")); addr)
    {
        metadata.sender_address.address = *addr;
        read_port(json, "fromPort", metadata.sender_address.port);
    }

    return true;
}
}  // namespace lanshare::protocol
