#ifndef LANSHARE_FLOWS_TRANSFERFLOW_HPP_
#define LANSHARE_FLOWS_TRANSFERFLOW_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "messages.hpp"
#include "transfer.hpp"

namespace lanshare::flows
{
// Forward declarations
class TransferFlowListener;

/// Per-transfer state machine of the push data path:
/// pending -> accepted -> completed, pending -> rejected.
class TransferFlow
{
public:
    enum class State
    {
        IDLE,
        RUNNING,
        STOPPING
    };

    virtual ~TransferFlow() = default;

    virtual bool  register_listener(std::shared_ptr<TransferFlowListener> listener)   = 0;
    virtual bool  unregister_listener(std::shared_ptr<TransferFlowListener> listener) = 0;
    virtual State state() const                                                       = 0;
    virtual void  start()                                                             = 0;
    virtual void  stop()                                                              = 0;

    /// Sender side. target is "ip", "ip:port" or the display name of an online peer.
    virtual protocol::StatusCode initiate(const std::string &target, const std::string &file_name,
        const std::vector<uint8_t> &bytes, Transfer &transfer) = 0;
    /// Receiver side, the sender announces a transfer. from is the connection's remote end.
    virtual protocol::StatusCode handle_notify(
        const protocol::TransferMetadata &metadata, const network::Endpoint &from) = 0;
    /// Receiver side, local decision.
    virtual protocol::StatusCode accept(const protocol::TransferId &id) = 0;
    virtual protocol::StatusCode reject(const protocol::TransferId &id) = 0;
    /// Sender side, the receiver's decision.
    virtual protocol::StatusCode handle_accept_remote(const protocol::TransferId &id) = 0;
    virtual protocol::StatusCode handle_reject_remote(const protocol::TransferId &id) = 0;
    /// Receiver side, the pushed bytes.
    virtual protocol::StatusCode handle_upload(
        const protocol::TransferId &id, const std::vector<uint8_t> &bytes) = 0;
    /// Receiver side, hands out the received bytes once.
    virtual protocol::StatusCode fetch(
        const protocol::TransferId &id, std::vector<uint8_t> &bytes, std::string &file_name) = 0;

    [[nodiscard]] virtual std::vector<Transfer>   list() const                             = 0;
    [[nodiscard]] virtual std::optional<Transfer> get(const protocol::TransferId &id) const = 0;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_TRANSFERFLOW_HPP_
