#include "transferflowimpl.hpp"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>

#include "networkinterfaceprovider.hpp"
#include "peerregistry.hpp"
#include "remotenodeclient.hpp"
#include "stagingstore.hpp"

namespace lanshare::flows
{
namespace
{
const char *to_string(TransferFlow::State state)
{
    switch (state)
    {
        case TransferFlow::State::IDLE: return "IDLE";
        case TransferFlow::State::RUNNING: return "RUNNING";
        case TransferFlow::State::STOPPING: return "STOPPING";
        default: return "INVALID";
    }
}

protocol::TransferMetadata to_metadata(const Transfer &transfer)
{
    protocol::TransferMetadata metadata;
    metadata.id             = transfer.id;
    metadata.file_name      = transfer.file_name;
    metadata.size           = transfer.size;
    metadata.sender_name    = transfer.sender_name;
    metadata.sender_address = transfer.sender_address;
    metadata.receiver       = transfer.receiver;
    return metadata;
}
}  // namespace

TransferFlowImpl::TransferFlowImpl(std::shared_ptr<PeerRegistry> peer_registry,
    std::shared_ptr<protocol::RemoteNodeClient>                  remote_node_client,
    std::shared_ptr<storage::StagingStore>                       staging,
    std::shared_ptr<storage::StagingStore>                       inbox,
    std::shared_ptr<network::NetworkInterfaceProvider>           network_interface_provider,
    std::shared_ptr<utils::Executer> io_executer, std::string device_name, unsigned short port)
    : peer_registry_ {std::move(peer_registry)}
    , remote_node_client_ {std::move(remote_node_client)}
    , staging_ {std::move(staging)}
    , inbox_ {std::move(inbox)}
    , network_interface_provider_ {std::move(network_interface_provider)}
    , io_executer_ {std::move(io_executer)}
    , device_name_ {std::move(device_name)}
    , port_ {port}
    , last_id_ {0}
    , state_ {State::IDLE}
{}

TransferFlowImpl::~TransferFlowImpl()
{
    stop_impl();
}

bool TransferFlowImpl::register_listener(std::shared_ptr<TransferFlowListener> listener)
{
    return listener_group_.add(listener);
}

bool TransferFlowImpl::unregister_listener(std::shared_ptr<TransferFlowListener> listener)
{
    return listener_group_.remove(listener);
}

TransferFlow::State TransferFlowImpl::state() const
{
    return state_;
}

void TransferFlowImpl::start()
{
    State state = state_;
    if (state != State::IDLE)
    {
        LOG(WARNING) << "Cannot start TransferFlow from state " << to_string(state);
        return;
    }

    set_state(State::RUNNING);
}

void TransferFlowImpl::stop()
{
    stop_impl();
}

protocol::StatusCode TransferFlowImpl::initiate(const std::string &target,
    const std::string &file_name, const std::vector<uint8_t> &bytes, Transfer &transfer)
{
    if (state_ != State::RUNNING)
    {
        LOG(WARNING) << "Cannot initiate a transfer from state " << to_string(state_);
        return protocol::StatusCode::INVALID_STATE;
    }

    if (file_name.empty())
    {
        LOG(WARNING) << "Refusing to send a file without a name";
        return protocol::StatusCode::BAD_REQUEST;
    }

    auto receiver_address = resolve_target(target);
    if (!receiver_address)
    {
        LOG(WARNING) << "Cannot resolve transfer target " << target;
        return protocol::StatusCode::NOT_FOUND;
    }

    Transfer t;
    t.id               = next_transfer_id();
    t.file_name        = file_name;
    t.size             = bytes.size();
    t.sender_name      = device_name_;
    t.sender_address   = local_endpoint_towards(receiver_address->address);
    t.receiver         = target;
    t.receiver_address = *receiver_address;
    t.direction        = TransferDirection::OUTBOUND;
    t.status           = TransferStatus::PENDING;

    if (!staging_->put(t.id, bytes))
    {
        LOG(ERROR) << "Cannot stage " << file_name << " for transfer " << t.id;
        return protocol::StatusCode::IO_FAILURE;
    }

    {
        std::lock_guard lock {mutex_};
        transfers_.emplace(t.id, t);
    }

    LOG(INFO) << "Transfer " << t.id << ": offering " << file_name << " (" << t.size
              << " bytes) to " << network::conversion::to_string(t.receiver_address);

    auto notify_future = remote_node_client_->notify_transfer(t.receiver_address, to_metadata(t));
    add_job([this, t, future = std::make_shared<std::future<protocol::StatusCode>>(
                          std::move(notify_future))](const utils::CompletionToken &) {
        auto status = future->get();
        if (status != protocol::StatusCode::OK)
        {
            LOG(WARNING) << "Transfer " << t.id << ": notifying "
                         << network::conversion::to_string(t.receiver_address)
                         << " failed: " << protocol::to_string(status);
            listener_group_.notify(&TransferFlowListener::on_transfer_failed, t,
                std::string {"cannot notify receiver: "} + protocol::to_string(status));
        }
    });

    transfer = t;
    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::handle_notify(
    const protocol::TransferMetadata &metadata, const network::Endpoint &from)
{
    if (state_ != State::RUNNING)
    {
        return protocol::StatusCode::INVALID_STATE;
    }

    Transfer t;
    t.id             = metadata.id;
    t.file_name      = metadata.file_name;
    t.size           = metadata.size;
    t.sender_name    = metadata.sender_name;
    t.sender_address = metadata.sender_address;
    if (t.sender_address.address == 0)
    {
        t.sender_address = {from.address, port_};
    }
    else if (t.sender_address.port == 0)
    {
        t.sender_address.port = port_;
    }
    t.receiver  = metadata.receiver.empty() ? device_name_ : metadata.receiver;
    t.direction = TransferDirection::INBOUND;
    t.status    = TransferStatus::PENDING;

    {
        std::lock_guard lock {mutex_};
        auto            it = transfers_.find(t.id);
        if (it != transfers_.end())
        {
            if (it->second.direction != TransferDirection::INBOUND)
            {
                LOG(WARNING) << "Transfer " << t.id << " announced by "
                             << network::conversion::to_string(from)
                             << " clashes with an outbound transfer";
                return protocol::StatusCode::INVALID_STATE;
            }
            // Repeated announcement
            return protocol::StatusCode::OK;
        }
        transfers_.emplace(t.id, t);
    }

    LOG(INFO) << "Transfer " << t.id << ": " << t.sender_name << " at "
              << network::conversion::to_string(t.sender_address) << " offers " << t.file_name
              << " (" << t.size << " bytes)";
    listener_group_.notify(&TransferFlowListener::on_transfer_request, t);
    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::accept(const protocol::TransferId &id)
{
    Transfer t;
    auto     status = transition(
        id, TransferDirection::INBOUND, TransferStatus::PENDING, TransferStatus::ACCEPTED, t);
    if (status != protocol::StatusCode::OK)
    {
        return status;
    }

    LOG(INFO) << "Transfer " << id << " accepted";
    listener_group_.notify(&TransferFlowListener::on_transfer_accepted, t);

    auto accept_future = remote_node_client_->accept_remote(t.sender_address, t.id);
    add_job([this, t, future = std::make_shared<std::future<protocol::StatusCode>>(
                          std::move(accept_future))](const utils::CompletionToken &) {
        auto status = future->get();
        if (status != protocol::StatusCode::OK)
        {
            LOG(WARNING) << "Transfer " << t.id << ": sender "
                         << network::conversion::to_string(t.sender_address)
                         << " did not take the acceptance: " << protocol::to_string(status);
            listener_group_.notify(&TransferFlowListener::on_transfer_failed, t,
                std::string {"cannot reach sender: "} + protocol::to_string(status));
        }
    });

    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::reject(const protocol::TransferId &id)
{
    Transfer t;
    auto     status = transition(
        id, TransferDirection::INBOUND, TransferStatus::PENDING, TransferStatus::REJECTED, t);
    if (status != protocol::StatusCode::OK)
    {
        return status;
    }

    LOG(INFO) << "Transfer " << id << " rejected";
    inbox_->remove(id);
    listener_group_.notify(&TransferFlowListener::on_transfer_rejected, t);

    auto reject_future = remote_node_client_->reject_remote(t.sender_address, t.id);
    add_job([t, future = std::make_shared<std::future<protocol::StatusCode>>(
                    std::move(reject_future))](const utils::CompletionToken &) {
        auto status = future->get();
        if (status != protocol::StatusCode::OK)
        {
            LOG(WARNING) << "Transfer " << t.id << ": sender "
                         << network::conversion::to_string(t.sender_address)
                         << " was not told about the rejection: " << protocol::to_string(status);
        }
    });

    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::handle_accept_remote(const protocol::TransferId &id)
{
    Transfer t;
    auto     status = transition(
        id, TransferDirection::OUTBOUND, TransferStatus::PENDING, TransferStatus::ACCEPTED, t);
    if (status != protocol::StatusCode::OK)
    {
        return status;
    }

    LOG(INFO) << "Transfer " << id << " accepted by "
              << network::conversion::to_string(t.receiver_address);
    listener_group_.notify(&TransferFlowListener::on_transfer_accepted, t);

    add_job([this, t](const utils::CompletionToken &completion_token) {
        push_bytes(t, completion_token);
    });

    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::handle_reject_remote(const protocol::TransferId &id)
{
    Transfer t;
    auto     status = transition(
        id, TransferDirection::OUTBOUND, TransferStatus::PENDING, TransferStatus::REJECTED, t);
    if (status != protocol::StatusCode::OK)
    {
        return status;
    }

    LOG(INFO) << "Transfer " << id << " rejected by "
              << network::conversion::to_string(t.receiver_address);
    staging_->remove(id);
    listener_group_.notify(&TransferFlowListener::on_transfer_rejected, t);
    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::handle_upload(
    const protocol::TransferId &id, const std::vector<uint8_t> &bytes)
{
    {
        std::lock_guard lock {mutex_};
        auto            it = transfers_.find(id);
        if (it == transfers_.end() || it->second.direction != TransferDirection::INBOUND)
        {
            LOG(WARNING) << "Upload for unknown transfer " << id;
            return protocol::StatusCode::NOT_FOUND;
        }
        if (it->second.status != TransferStatus::ACCEPTED)
        {
            LOG(WARNING) << "Upload for transfer " << id << " in status "
                         << to_string(it->second.status);
            return protocol::StatusCode::INVALID_STATE;
        }
        if (it->second.size != bytes.size())
        {
            LOG(WARNING) << "Transfer " << id << ": announced " << it->second.size
                         << " bytes, received " << bytes.size();
        }
    }

    if (!inbox_->put(id, bytes))
    {
        LOG(ERROR) << "Transfer " << id << ": cannot store the received bytes";
        return protocol::StatusCode::IO_FAILURE;
    }

    Transfer t;
    auto     status = transition(
        id, TransferDirection::INBOUND, TransferStatus::ACCEPTED, TransferStatus::COMPLETED, t);
    if (status != protocol::StatusCode::OK)
    {
        // Lost a race with another upload of the same transfer
        return status;
    }

    LOG(INFO) << "Transfer " << id << " completed, received " << bytes.size() << " bytes";
    listener_group_.notify(&TransferFlowListener::on_transfer_completed, t);
    return protocol::StatusCode::OK;
}

protocol::StatusCode TransferFlowImpl::fetch(
    const protocol::TransferId &id, std::vector<uint8_t> &bytes, std::string &file_name)
{
    {
        std::lock_guard lock {mutex_};
        auto            it = transfers_.find(id);
        if (it == transfers_.end() || it->second.direction != TransferDirection::INBOUND)
        {
            return protocol::StatusCode::NOT_FOUND;
        }
        if (it->second.status != TransferStatus::COMPLETED)
        {
            return protocol::StatusCode::INVALID_STATE;
        }
        file_name = it->second.file_name;
    }

    auto stored = inbox_->get(id);
    if (!stored || !inbox_->remove(id))
    {
        LOG(INFO) << "Transfer " << id << ": received bytes already fetched";
        return protocol::StatusCode::NOT_FOUND;
    }

    bytes = std::move(*stored);
    return protocol::StatusCode::OK;
}

std::vector<Transfer> TransferFlowImpl::list() const
{
    std::vector<Transfer> result;

    std::lock_guard lock {mutex_};
    result.reserve(transfers_.size());
    for (const auto &[id, transfer] : transfers_)
    {
        result.push_back(transfer);
    }
    return result;
}

std::optional<Transfer> TransferFlowImpl::get(const protocol::TransferId &id) const
{
    std::lock_guard lock {mutex_};
    auto            it = transfers_.find(id);
    if (it == transfers_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

protocol::StatusCode TransferFlowImpl::transition(const protocol::TransferId &id,
    TransferDirection direction, TransferStatus from, TransferStatus to, Transfer &out)
{
    if (state_ != State::RUNNING)
    {
        return protocol::StatusCode::INVALID_STATE;
    }

    std::lock_guard lock {mutex_};

    auto it = transfers_.find(id);
    if (it == transfers_.end() || it->second.direction != direction)
    {
        LOG(WARNING) << "No " << to_string(direction) << " transfer " << id;
        return protocol::StatusCode::NOT_FOUND;
    }

    if (it->second.status != from)
    {
        LOG(WARNING) << "Transfer " << id << " cannot go from " << to_string(it->second.status)
                     << " to " << to_string(to);
        return protocol::StatusCode::INVALID_STATE;
    }

    it->second.status = to;
    out               = it->second;
    return protocol::StatusCode::OK;
}

std::optional<network::Endpoint> TransferFlowImpl::resolve_target(const std::string &target) const
{
    if (auto endpoint = network::conversion::to_endpoint(target, port_); endpoint)
    {
        return endpoint;
    }
    return peer_registry_->resolve(target);
}

network::Endpoint TransferFlowImpl::local_endpoint_towards(network::IPv4Address remote) const
{
    network::Endpoint endpoint {0, port_};

    auto interfaces = network_interface_provider_->active_ipv4_interfaces();
    for (const auto &iface : interfaces)
    {
        if ((iface.address & iface.netmask) == (remote & iface.netmask))
        {
            endpoint.address = iface.address;
            return endpoint;
        }
    }

    // No interface on the receiver's subnet, announce the first one
    if (!interfaces.empty())
    {
        endpoint.address = interfaces.front().address;
    }
    return endpoint;
}

protocol::TransferId TransferFlowImpl::next_transfer_id()
{
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch())
                   .count();

    std::lock_guard lock {mutex_};
    last_id_ = std::max<long long>(now, last_id_ + 1);
    return std::to_string(last_id_);
}

void TransferFlowImpl::push_bytes(
    const Transfer &transfer, const utils::CompletionToken &completion_token)
{
    auto fail = [this, &transfer](const std::string &error) {
        LOG(ERROR) << "Transfer " << transfer.id << ": " << error;
        listener_group_.notify(&TransferFlowListener::on_transfer_failed, transfer, error);
    };

    auto bytes = staging_->get(transfer.id);
    if (!bytes)
    {
        fail("staged bytes are gone");
        return;
    }

    auto status =
        remote_node_client_->upload(transfer.receiver_address, transfer.id, std::move(*bytes))
            .get();
    if (completion_token.is_cancelled())
    {
        return;
    }
    if (status != protocol::StatusCode::OK)
    {
        fail(std::string {"upload failed: "} + protocol::to_string(status));
        return;
    }

    Transfer t;
    if (transition(transfer.id, TransferDirection::OUTBOUND, TransferStatus::ACCEPTED,
            TransferStatus::COMPLETED, t) != protocol::StatusCode::OK)
    {
        return;
    }

    staging_->remove(transfer.id);
    LOG(INFO) << "Transfer " << transfer.id << " completed, sent " << transfer.size << " bytes";
    listener_group_.notify(&TransferFlowListener::on_transfer_completed, t);
}

void TransferFlowImpl::set_state(State new_state)
{
    if (state_ == new_state)
    {
        return;
    }
    state_ = new_state;
    listener_group_.notify(&TransferFlowListener::on_state_changed, new_state);
}

void TransferFlowImpl::stop_impl()
{
    State state = state_;
    if (state != State::RUNNING)
    {
        return;
    }

    set_state(State::STOPPING);

    decltype(running_jobs_) running_jobs_copy;
    {
        std::lock_guard lock {jobs_mutex_};
        running_jobs_copy = running_jobs_;
    }

    for (const auto &completion_token : running_jobs_copy)
    {
        completion_token.cancel();
        completion_token.wait_for_completion();
    }

    {
        std::lock_guard lock {jobs_mutex_};
        running_jobs_.clear();
    }

    set_state(State::IDLE);
}

void TransferFlowImpl::add_job(utils::Executer::Job &&job)
{
    if (state_ != State::RUNNING)
    {
        return;
    }

    std::lock_guard lock {jobs_mutex_};
    running_jobs_.insert(io_executer_->add_job(
        [this, job = std::move(job)](const utils::CompletionToken &completion_token) {
            job(completion_token);
            std::lock_guard lock {jobs_mutex_};
            running_jobs_.erase(completion_token);
        }));
}
}  // namespace lanshare::flows
