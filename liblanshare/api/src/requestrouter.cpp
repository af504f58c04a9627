#include "requestrouter.hpp"

#include <algorithm>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "discoveryflow.hpp"
#include "formparsing.hpp"
#include "jsonformat.hpp"
#include "messages.hpp"
#include "messageserializer.hpp"
#include "peerregistry.hpp"
#include "transferflow.hpp"

namespace lanshare
{
namespace
{
network::HTTPResponse json_response(const nlohmann::json &json, unsigned status = 200)
{
    network::HTTPResponse response;
    response.status = status;
    auto str        = json.dump();
    response.body.assign(str.cbegin(), str.cend());
    return response;
}

network::HTTPResponse error_response(unsigned status, const std::string &message)
{
    return json_response({{"error", message}}, status);
}

network::HTTPResponse error_response(protocol::StatusCode status)
{
    return error_response(protocol::to_http_status(status), protocol::to_string(status));
}

std::string quote_safe(std::string str)
{
    std::replace_if(
        str.begin(), str.end(),
        [](char c) { return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20; },
        '_');
    return str;
}
}  // namespace

RequestRouter::RequestRouter(std::shared_ptr<flows::PeerRegistry> peer_registry,
    std::shared_ptr<flows::DiscoveryFlow>                        discovery_flow,
    std::shared_ptr<flows::TransferFlow>                         transfer_flow,
    std::shared_ptr<const protocol::MessageSerializer>           message_serializer)
    : peer_registry_ {std::move(peer_registry)}
    , discovery_flow_ {std::move(discovery_flow)}
    , transfer_flow_ {std::move(transfer_flow)}
    , message_serializer_ {std::move(message_serializer)}
    , routes_ {
          // Node to node
          {network::HTTPMethod::GET, "/discover", false, &RequestRouter::discover},
          {network::HTTPMethod::POST, "/api/notify-transfer", false,
              &RequestRouter::notify_transfer},
          {network::HTTPMethod::POST, "/api/accept-remote", true, &RequestRouter::accept_remote},
          {network::HTTPMethod::POST, "/api/reject-remote", true, &RequestRouter::reject_remote},
          {network::HTTPMethod::POST, "/api/upload", true, &RequestRouter::upload},
          // Local observer
          {network::HTTPMethod::GET, "/api/device-name", false, &RequestRouter::device_name},
          {network::HTTPMethod::GET, "/api/peers", false, &RequestRouter::peers},
          {network::HTTPMethod::GET, "/api/transfers", false, &RequestRouter::transfers},
          {network::HTTPMethod::GET, "/api/transfers", true, &RequestRouter::transfer},
          {network::HTTPMethod::POST, "/api/send", false, &RequestRouter::send},
          {network::HTTPMethod::POST, "/api/accept", true, &RequestRouter::accept},
          {network::HTTPMethod::POST, "/api/reject", true, &RequestRouter::reject},
          {network::HTTPMethod::GET, "/api/download", true, &RequestRouter::download},
          {network::HTTPMethod::GET, "/api/receive", true, &RequestRouter::download}}
{}

network::HTTPResponse RequestRouter::handle(const network::HTTPRequest &request) const
{
    std::string path;
    Query       query;
    split_target(request.target, path, query);

    bool path_matched = false;
    for (const auto &route : routes_)
    {
        std::string id;
        if (route.takes_id)
        {
            auto prefix = route.path + '/';
            if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0)
            {
                continue;
            }
            auto segment = path.substr(prefix.size());
            if (segment.find('/') != std::string::npos)
            {
                continue;
            }
            id = url_decode(segment);
        }
        else if (path != route.path)
        {
            continue;
        }

        path_matched = true;
        if (route.method == request.method)
        {
            return (this->*route.handler)(request, id, query);
        }
    }

    if (path_matched)
    {
        return error_response(405, "method not allowed");
    }
    return error_response(404, "no such route");
}

network::HTTPResponse RequestRouter::discover(const network::HTTPRequest & /*request*/,
    const std::string & /*id*/, const Query & /*query*/) const
{
    network::HTTPResponse response;
    response.body = message_serializer_->serialize(discovery_flow_->identity());
    return response;
}

network::HTTPResponse RequestRouter::notify_transfer(const network::HTTPRequest &request,
    const std::string & /*id*/, const Query & /*query*/) const
{
    protocol::TransferMetadata metadata;
    if (!message_serializer_->deserialize(request.body, metadata))
    {
        return error_response(400, "invalid transfer");
    }

    auto status = transfer_flow_->handle_notify(metadata, request.from);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return json_response({{"status", "notified"}});
}

network::HTTPResponse RequestRouter::accept_remote(const network::HTTPRequest & /*request*/,
    const std::string &id, const Query & /*query*/) const
{
    auto status = transfer_flow_->handle_accept_remote(id);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return json_response({{"status", "accepted"}});
}

network::HTTPResponse RequestRouter::reject_remote(const network::HTTPRequest & /*request*/,
    const std::string &id, const Query & /*query*/) const
{
    auto status = transfer_flow_->handle_reject_remote(id);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return json_response({{"status", "rejected"}});
}

network::HTTPResponse RequestRouter::upload(
    const network::HTTPRequest &request, const std::string &id, const Query & /*query*/) const
{
    protocol::StatusCode status;

    std::vector<FormPart> parts;
    if (parse_multipart_form(request.header("content-type"), request.body, parts))
    {
        auto file = std::find_if(
            parts.cbegin(), parts.cend(), [](const FormPart &part) { return part.name == "file"; });
        if (file == parts.cend())
        {
            return error_response(400, "file field missing");
        }
        status = transfer_flow_->handle_upload(id, file->data);
    }
    else
    {
        status = transfer_flow_->handle_upload(id, request.body);
    }

    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return json_response({{"status", "received"}});
}

network::HTTPResponse RequestRouter::device_name(const network::HTTPRequest & /*request*/,
    const std::string & /*id*/, const Query & /*query*/) const
{
    return json_response({{"name", discovery_flow_->identity().name}});
}

network::HTTPResponse RequestRouter::peers(const network::HTTPRequest & /*request*/,
    const std::string & /*id*/, const Query & /*query*/) const
{
    auto json = nlohmann::json::array();
    for (const auto &peer : peer_registry_->list_online())
    {
        json.push_back(to_json(peer));
    }
    return json_response(json);
}

network::HTTPResponse RequestRouter::transfers(const network::HTTPRequest & /*request*/,
    const std::string & /*id*/, const Query & /*query*/) const
{
    auto json = nlohmann::json::array();
    for (const auto &transfer : transfer_flow_->list())
    {
        json.push_back(to_json(transfer));
    }
    return json_response(json);
}

network::HTTPResponse RequestRouter::transfer(const network::HTTPRequest & /*request*/,
    const std::string &id, const Query & /*query*/) const
{
    return transfer_response(id);
}

network::HTTPResponse RequestRouter::transfer_response(const std::string &id) const
{
    auto transfer = transfer_flow_->get(id);
    if (!transfer)
    {
        return error_response(protocol::StatusCode::NOT_FOUND);
    }
    return json_response(to_json(*transfer));
}

network::HTTPResponse RequestRouter::send(
    const network::HTTPRequest &request, const std::string & /*id*/, const Query &query) const
{
    std::string          target;
    std::string          file_name;
    std::vector<uint8_t> form_file;
    bool                 from_form = false;

    std::vector<FormPart> parts;
    if (parse_multipart_form(request.header("content-type"), request.body, parts))
    {
        from_form = true;
        for (auto &part : parts)
        {
            if (part.name == "file")
            {
                file_name = part.file_name;
                form_file = std::move(part.data);
            }
            else if (part.name == "targetIP" || part.name == "target")
            {
                target.assign(part.data.cbegin(), part.data.cend());
            }
        }
    }
    else
    {
        auto it = query.find("target");
        if (it != query.end())
        {
            target = it->second;
        }
        it = query.find("filename");
        if (it != query.end())
        {
            file_name = it->second;
        }
    }

    if (target.empty())
    {
        return error_response(400, "target required");
    }
    if (file_name.empty())
    {
        return error_response(400, "file required");
    }

    flows::Transfer transfer;
    auto            status =
        transfer_flow_->initiate(target, file_name, from_form ? form_file : request.body, transfer);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return json_response(to_json(transfer));
}

network::HTTPResponse RequestRouter::accept(const network::HTTPRequest & /*request*/,
    const std::string &id, const Query & /*query*/) const
{
    auto status = transfer_flow_->accept(id);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return transfer_response(id);
}

network::HTTPResponse RequestRouter::reject(const network::HTTPRequest & /*request*/,
    const std::string &id, const Query & /*query*/) const
{
    auto status = transfer_flow_->reject(id);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }
    return transfer_response(id);
}

network::HTTPResponse RequestRouter::download(const network::HTTPRequest & /*request*/,
    const std::string &id, const Query & /*query*/) const
{
    network::HTTPResponse response;
    std::string           file_name;

    auto status = transfer_flow_->fetch(id, response.body, file_name);
    if (status != protocol::StatusCode::OK)
    {
        return error_response(status);
    }

    response.content_type = "application/octet-stream";
    response.headers["Content-Disposition"] =
        "attachment; filename=\"" + quote_safe(file_name) + "\"";
    return response;
}
}  // namespace lanshare
