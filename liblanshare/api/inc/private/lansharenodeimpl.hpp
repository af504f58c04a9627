#ifndef LANSHARE_API_LANSHARENODEIMPL_HPP_
#define LANSHARE_API_LANSHARENODEIMPL_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio.hpp>

#include "config.hpp"
#include "discoveryflowlistenerdelegate.hpp"
#include "peerregistrylistenerdelegate.hpp"
#include "transferflowlistenerdelegate.hpp"

namespace lanshare
{
namespace utils
{
// Forward declarations
class ThreadPool;
class IOThreadPool;
}  // namespace utils

namespace network
{
class HTTPServer;
class WebSocketSession;
}  // namespace network

namespace storage
{
class StagingStore;
}  // namespace storage

namespace flows
{
class PeerRegistry;
class DiscoveryFlow;
class TransferFlow;
}  // namespace flows

namespace events
{
class EventHub;
struct Event;
}  // namespace events

class RequestRouter;

class LanShareNodeImpl
{
public:
    LanShareNodeImpl(std::string app_data_dir_path, const std::string &config_file_name);
    ~LanShareNodeImpl();

    bool start();
    bool stop();

    [[nodiscard]] std::string    device_name() const;
    [[nodiscard]] unsigned short port() const;

private:
    enum class State
    {
        IDLE,
        STARTING,
        RUNNING,
        STOPPING
    };

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

private:
    State state() const;
    void  set_state(State new_state);
    std::shared_ptr<events::EventHub> event_hub() const;
    void  publish(const events::Event &event);
    void  on_websocket_connected(const std::shared_ptr<network::WebSocketSession> &session);
    void  release_resources();

    constexpr static const char *to_string(State state)
    {
        switch (state)
        {
            case State::IDLE: return "IDLE";
            case State::STARTING: return "STARTING";
            case State::RUNNING: return "RUNNING";
            case State::STOPPING: return "STOPPING";
            default: return "INVALID_STATE";
        }
    }

private:
    State                                          state_;
    const std::string                              app_data_dir_path_;
    config::Config                                 cfg_;
    const std::string                              device_name_;
    unsigned short                                 port_;
    std::unique_ptr<boost::asio::io_context>       client_io_ctx_;
    std::unique_ptr<boost::asio::io_context>       server_io_ctx_;
    std::optional<WorkGuard>                       client_work_guard_;
    std::optional<WorkGuard>                       server_work_guard_;
    std::shared_ptr<utils::ThreadPool>             thread_pool_;
    std::shared_ptr<utils::IOThreadPool>           io_thread_pool_;
    std::shared_ptr<storage::StagingStore>         staging_;
    std::shared_ptr<storage::StagingStore>         inbox_;
    std::shared_ptr<events::EventHub>              event_hub_;
    std::shared_ptr<flows::PeerRegistry>           peer_registry_;
    std::shared_ptr<PeerRegistryListenerDelegate>  peer_registry_listener_;
    std::shared_ptr<flows::DiscoveryFlow>          discovery_flow_;
    std::shared_ptr<DiscoveryFlowListenerDelegate> discovery_flow_listener_;
    std::shared_ptr<flows::TransferFlow>           transfer_flow_;
    std::shared_ptr<TransferFlowListenerDelegate>  transfer_flow_listener_;
    std::shared_ptr<RequestRouter>                 request_router_;
    std::shared_ptr<network::HTTPServer>           http_server_;
    mutable std::mutex                             mutex_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_LANSHARENODEIMPL_HPP_
