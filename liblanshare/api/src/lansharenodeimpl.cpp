#include "lansharenodeimpl.hpp"

#include <cstdlib>
#include <filesystem>
#include <utility>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "address.hpp"
#include "defaultconfigvalues.hpp"
#include "discoveryflowimpl.hpp"
#include "event.hpp"
#include "eventhubimpl.hpp"
#include "httpclientimpl.hpp"
#include "httpserverimpl.hpp"
#include "iothreadpool.hpp"
#include "jsonconfigloader.hpp"
#include "jsonformat.hpp"
#include "messageserializerimpl.hpp"
#include "networkinterfaceproviderimpl.hpp"
#include "peerregistryimpl.hpp"
#include "remotenodeclientimpl.hpp"
#include "requestrouter.hpp"
#include "stagingstoreimpl.hpp"
#include "threadpool.hpp"
#include "transferflowimpl.hpp"
#include "websocketeventsink.hpp"
#include "websocketsession.hpp"

namespace
{
constexpr char const *events_path = "/ws";

std::string path_join(const std::string &directory, const std::string &file_name)
{
    return (std::filesystem::path {directory} / file_name).string();
}

std::string resolve_device_name(const std::string &configured)
{
    if (!configured.empty())
    {
        return configured;
    }

    const char *user = std::getenv("USER");
    boost::system::error_code ec;
    auto                      host = boost::asio::ip::host_name(ec);
    if (ec)
    {
        LOG(WARNING) << "Cannot read host name: " << ec.message();
        host = "localhost";
    }
    return std::string {user ? user : "lanshare"} + "@" + host;
}
}  // namespace

namespace lanshare
{
LanShareNodeImpl::LanShareNodeImpl(
    std::string app_data_dir_path, const std::string &config_file_name)
    : state_ {State::IDLE}
    , app_data_dir_path_ {std::move(app_data_dir_path)}
    , cfg_ {config::JSONConfigLoader {path_join(app_data_dir_path_, config_file_name)},
          std::make_unique<DefaultConfigValues>(app_data_dir_path_)}
    , device_name_ {resolve_device_name(cfg_.get_string(config::ConfigKey::DEVICE_NAME))}
    , port_ {static_cast<unsigned short>(cfg_.get_integer(config::ConfigKey::PORT))}
    , peer_registry_listener_ {std::make_shared<PeerRegistryListenerDelegate>()}
    , discovery_flow_listener_ {std::make_shared<DiscoveryFlowListenerDelegate>()}
    , transfer_flow_listener_ {std::make_shared<TransferFlowListenerDelegate>()}
{
    peer_registry_listener_->set_on_peer_offline_cb([this](const flows::Peer &peer) {
        publish({events::event_type::peer_offline, to_json(peer)});
    });
    discovery_flow_listener_->set_on_peer_discovered_cb([this](const flows::Peer &peer) {
        publish({events::event_type::peer_discovered, to_json(peer)});
    });
    transfer_flow_listener_->set_on_transfer_request_cb([this](const flows::Transfer &transfer) {
        publish({events::event_type::transfer_request, to_json(transfer)});
    });
    transfer_flow_listener_->set_on_transfer_accepted_cb([this](const flows::Transfer &transfer) {
        publish({events::event_type::transfer_accepted, to_json(transfer)});
    });
    transfer_flow_listener_->set_on_transfer_rejected_cb([this](const flows::Transfer &transfer) {
        publish({events::event_type::transfer_rejected, to_json(transfer)});
    });
    transfer_flow_listener_->set_on_transfer_completed_cb(
        [this](const flows::Transfer &transfer) {
            publish({events::event_type::transfer_completed, to_json(transfer)});
        });
    transfer_flow_listener_->set_on_transfer_failed_cb(
        [this](const flows::Transfer &transfer, const std::string &error) {
            auto data     = to_json(transfer);
            data["error"] = error;
            publish({events::event_type::transfer_failed, std::move(data)});
        });
}

LanShareNodeImpl::~LanShareNodeImpl()
{
    if (state() == State::RUNNING)
    {
        stop();
    }
}

bool LanShareNodeImpl::start()
{
    {
        std::lock_guard lock {mutex_};
        if (state_ != State::IDLE)
        {
            LOG(WARNING) << "Cannot start node from state " << to_string(state_);
            return false;
        }
        state_ = State::STARTING;
    }

    thread_pool_    = std::make_shared<utils::ThreadPool>();
    io_thread_pool_ = std::make_shared<utils::IOThreadPool>();
    client_io_ctx_  = std::make_unique<boost::asio::io_context>();
    server_io_ctx_  = std::make_unique<boost::asio::io_context>();
    client_work_guard_.emplace(client_io_ctx_->get_executor());
    server_work_guard_.emplace(server_io_ctx_->get_executor());

    io_thread_pool_->add_job([this](const utils::CompletionToken &) { client_io_ctx_->run(); });
    io_thread_pool_->add_job([this](const utils::CompletionToken &) { server_io_ctx_->run(); });

    const auto max_body_size =
        static_cast<size_t>(cfg_.get_integer(config::ConfigKey::MAX_BODY_SIZE));

    auto http_client = std::make_shared<network::HTTPClientImpl>(*client_io_ctx_, max_body_size);
    auto message_serializer  = std::make_shared<protocol::MessageSerializerImpl>();
    auto remote_node_client  = std::make_shared<protocol::RemoteNodeClientImpl>(http_client,
        message_serializer,
        protocol::RemoteNodeClientImpl::Timeouts {
            cfg_.get_duration(config::ConfigKey::PROBE_TIMEOUT),
            cfg_.get_duration(config::ConfigKey::CONTROL_TIMEOUT),
            cfg_.get_duration(config::ConfigKey::DATA_TIMEOUT)});
    auto network_interfaces = std::make_shared<network::NetworkInterfaceProviderImpl>();

    staging_ = std::make_shared<storage::StagingStoreImpl>(
        path_join(app_data_dir_path_, cfg_.get_string(config::ConfigKey::STAGING_DIR)), "staged");
    inbox_ = std::make_shared<storage::StagingStoreImpl>(
        path_join(app_data_dir_path_, cfg_.get_string(config::ConfigKey::INBOX_DIR)), "received");

    auto event_hub = std::make_shared<events::EventHubImpl>(io_thread_pool_,
        static_cast<size_t>(cfg_.get_integer(config::ConfigKey::SUBSCRIBER_QUEUE_SIZE)));
    {
        // Listener callbacks read it from worker threads
        std::lock_guard lock {mutex_};
        event_hub_ = event_hub;
    }
    peer_registry_ = std::make_shared<flows::PeerRegistryImpl>(io_thread_pool_,
        cfg_.get_duration(config::ConfigKey::REAPER_PERIOD),
        cfg_.get_duration(config::ConfigKey::LIVENESS_THRESHOLD),
        cfg_.get_duration(config::ConfigKey::RETENTION_THRESHOLD));
    discovery_flow_ = std::make_shared<flows::DiscoveryFlowImpl>(peer_registry_,
        remote_node_client, network_interfaces, thread_pool_, io_thread_pool_, device_name_, port_,
        cfg_.get_duration(config::ConfigKey::SWEEP_PERIOD));
    transfer_flow_ = std::make_shared<flows::TransferFlowImpl>(peer_registry_,
        remote_node_client, staging_, inbox_, network_interfaces, io_thread_pool_, device_name_,
        port_);
    request_router_ = std::make_shared<RequestRouter>(
        peer_registry_, discovery_flow_, transfer_flow_, message_serializer);

    http_server_ = std::make_shared<network::HTTPServerImpl>(*server_io_ctx_, thread_pool_, port_,
        max_body_size, cfg_.get_duration(config::ConfigKey::DATA_TIMEOUT));
    http_server_->set_request_handler(
        [router = request_router_](const network::HTTPRequest &request) {
            return router->handle(request);
        });
    http_server_->set_websocket_handler(
        events_path, [this](std::shared_ptr<network::WebSocketSession> session) {
            on_websocket_connected(session);
        });

    peer_registry_listener_->register_as_listener(*peer_registry_);
    discovery_flow_listener_->register_as_listener(*discovery_flow_);
    transfer_flow_listener_->register_as_listener(*transfer_flow_);

    event_hub->start();
    peer_registry_->start();
    transfer_flow_->start();
    discovery_flow_->start();

    if (!http_server_->start())
    {
        LOG(ERROR) << "Cannot listen on port " << port_;
        release_resources();
        set_state(State::IDLE);
        return false;
    }

    LOG(INFO) << "Node " << device_name_ << " listening on port " << port_;
    set_state(State::RUNNING);
    return true;
}

bool LanShareNodeImpl::stop()
{
    {
        std::lock_guard lock {mutex_};
        if (state_ != State::RUNNING)
        {
            LOG(WARNING) << "Cannot stop node from state " << to_string(state_);
            return false;
        }
        state_ = State::STOPPING;
    }

    http_server_->stop();
    release_resources();

    set_state(State::IDLE);
    return true;
}

std::string LanShareNodeImpl::device_name() const
{
    return device_name_;
}

unsigned short LanShareNodeImpl::port() const
{
    return port_;
}

LanShareNodeImpl::State LanShareNodeImpl::state() const
{
    std::lock_guard lock {mutex_};
    return state_;
}

void LanShareNodeImpl::set_state(State new_state)
{
    std::lock_guard lock {mutex_};
    state_ = new_state;
}

std::shared_ptr<events::EventHub> LanShareNodeImpl::event_hub() const
{
    std::lock_guard lock {mutex_};
    return event_hub_;
}

void LanShareNodeImpl::publish(const events::Event &event)
{
    auto hub = event_hub();
    if (hub)
    {
        hub->publish(event);
    }
}

void LanShareNodeImpl::on_websocket_connected(
    const std::shared_ptr<network::WebSocketSession> &session)
{
    auto hub = event_hub();
    if (!hub)
    {
        session->close();
        return;
    }

    auto handle = hub->subscribe(std::make_shared<WebSocketEventSink>(
        session, cfg_.get_duration(config::ConfigKey::CONTROL_TIMEOUT)));
    if (handle == events::EventHub::invalid_handle)
    {
        session->close();
        return;
    }

    LOG(INFO) << "Event observer " << network::conversion::to_string(session->remote_endpoint())
              << " connected";
    std::weak_ptr<events::EventHub> weak_hub = hub;
    session->set_close_callback([weak_hub, handle] {
        if (auto hub = weak_hub.lock())
        {
            hub->unsubscribe(handle);
        }
    });
}

void LanShareNodeImpl::release_resources()
{
    discovery_flow_->stop();
    discovery_flow_listener_->unregister_as_listener(*discovery_flow_);
    transfer_flow_->stop();
    transfer_flow_listener_->unregister_as_listener(*transfer_flow_);
    peer_registry_->stop();
    peer_registry_listener_->unregister_as_listener(*peer_registry_);

    std::shared_ptr<events::EventHub> event_hub;
    {
        std::lock_guard lock {mutex_};
        event_hub.swap(event_hub_);
    }
    event_hub->stop();

    client_work_guard_.reset();
    server_work_guard_.reset();
    client_io_ctx_->stop();
    server_io_ctx_->stop();

    staging_->clear();

    http_server_.reset();
    request_router_.reset();
    discovery_flow_.reset();
    transfer_flow_.reset();
    peer_registry_.reset();
    staging_.reset();
    inbox_.reset();
    thread_pool_.reset();
    io_thread_pool_.reset();
    server_io_ctx_.reset();
    client_io_ctx_.reset();
}
}  // namespace lanshare
