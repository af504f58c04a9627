#include "remotenodeclientimpl.hpp"

#include <cctype>

#include <glog/logging.h>

#include "httpclient.hpp"
#include "messageserializer.hpp"

namespace lanshare::protocol
{
namespace
{
/// Waits for a transport result. A broken promise means the transport was torn down before
/// the exchange finished.
network::HTTPResult get_result(std::future<network::HTTPResult> &future)
{
    try
    {
        return future.get();
    }
    catch (const std::future_error &e)
    {
        LOG(WARNING) << "Request abandoned: " << e.what();
        return {};
    }
}

/// Percent-encodes everything but unreserved characters, so the id survives the URL decoding
/// done by the receiving router.
std::string path_segment(const TransferId &id)
{
    constexpr char const *hex_digits = "0123456789ABCDEF";

    std::string result;
    result.reserve(id.size());
    for (unsigned char c : id)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            result.push_back(char(c));
        }
        else
        {
            result.push_back('%');
            result.push_back(hex_digits[c >> 4]);
            result.push_back(hex_digits[c & 0x0f]);
        }
    }
    return result;
}
}  // namespace

RemoteNodeClientImpl::RemoteNodeClientImpl(std::shared_ptr<network::HTTPClient> http_client,
    std::shared_ptr<const MessageSerializer> message_serializer, const Timeouts &timeouts)
    : http_client_ {std::move(http_client)}
    , message_serializer_ {std::move(message_serializer)}
    , timeouts_ {timeouts}
{}

std::future<std::optional<PeerIdentity>> RemoteNodeClientImpl::probe(const network::Endpoint &to)
{
    network::HTTPRequest request;
    request.method = network::HTTPMethod::GET;
    request.target = "/discover";

    auto result = http_client_->send(to, std::move(request), timeouts_.probe);

    // Resolved by whoever waits on it; only the parsing is deferred
    return std::async(std::launch::deferred,
        [result = std::move(result), serializer = message_serializer_, to]() mutable
        -> std::optional<PeerIdentity> {
            auto reply = get_result(result);
            if (!reply.success())
            {
                return std::nullopt;
            }

            PeerIdentity identity;
            if (!serializer->deserialize(reply.body, identity))
            {
                LOG(INFO) << network::conversion::to_string(to)
                          << " answered the probe with an unexpected body";
                return std::nullopt;
            }

            // The address we reached is more reliable than the one announced
            identity.endpoint.address = to.address;
            if (identity.endpoint.port == 0)
            {
                identity.endpoint.port = to.port;
            }
            return identity;
        });
}

std::future<StatusCode> RemoteNodeClientImpl::notify_transfer(
    const network::Endpoint &to, const TransferMetadata &metadata)
{
    return post(to, "/api/notify-transfer", message_serializer_->serialize(metadata),
        "application/json", timeouts_.control);
}

std::future<StatusCode> RemoteNodeClientImpl::accept_remote(
    const network::Endpoint &to, const TransferId &id)
{
    return post(to, "/api/accept-remote/" + path_segment(id), {}, "application/json",
        timeouts_.control);
}

std::future<StatusCode> RemoteNodeClientImpl::reject_remote(
    const network::Endpoint &to, const TransferId &id)
{
    return post(to, "/api/reject-remote/" + path_segment(id), {}, "application/json",
        timeouts_.control);
}

std::future<StatusCode> RemoteNodeClientImpl::upload(
    const network::Endpoint &to, const TransferId &id, std::vector<uint8_t> bytes)
{
    return post(to, "/api/upload/" + path_segment(id), std::move(bytes),
        "application/octet-stream", timeouts_.data);
}

std::future<StatusCode> RemoteNodeClientImpl::post(const network::Endpoint &to,
    std::string target, std::vector<uint8_t> body, std::string content_type,
    std::chrono::milliseconds timeout)
{
    network::HTTPRequest request;
    request.method                  = network::HTTPMethod::POST;
    request.target                  = std::move(target);
    request.headers["content-type"] = std::move(content_type);
    request.body                    = std::move(body);

    std::string description = request.target + " on " + network::conversion::to_string(to);
    auto        result      = http_client_->send(to, std::move(request), timeout);

    return std::async(std::launch::deferred,
        [result = std::move(result), description = std::move(description)]() mutable {
            auto reply = get_result(result);
            if (!reply.transport_ok)
            {
                LOG(WARNING) << description << " unreachable";
                return StatusCode::UNREACHABLE;
            }

            auto status = from_http_status(reply.status);
            if (status != StatusCode::OK)
            {
                LOG(WARNING) << description << " answered " << reply.status;
            }
            return status;
        });
}
}  // namespace lanshare::protocol
