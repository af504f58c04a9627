#ifndef LANSHARE_API_TRANSFERFLOWLISTENERDELEGATE_HPP_
#define LANSHARE_API_TRANSFERFLOWLISTENERDELEGATE_HPP_

#include <functional>
#include <memory>
#include <string>

#include "transferflow.hpp"
#include "transferflowlistener.hpp"

namespace lanshare
{
class TransferFlowListenerDelegate
    : public flows::TransferFlowListener
    , public std::enable_shared_from_this<TransferFlowListenerDelegate>
{
public:
    using OnStateChangedCb  = std::function<void(flows::TransferFlow::State)>;
    using OnTransferCb      = std::function<void(const flows::Transfer &)>;
    using OnTransferErrorCb = std::function<void(const flows::Transfer &, const std::string &)>;

    void register_as_listener(flows::TransferFlow &flow);
    void unregister_as_listener(flows::TransferFlow &flow);
    void set_on_state_changed_cb(OnStateChangedCb &&cb);
    void set_on_transfer_request_cb(OnTransferCb &&cb);
    void set_on_transfer_accepted_cb(OnTransferCb &&cb);
    void set_on_transfer_rejected_cb(OnTransferCb &&cb);
    void set_on_transfer_completed_cb(OnTransferCb &&cb);
    void set_on_transfer_failed_cb(OnTransferErrorCb &&cb);

public:  // from flows::TransferFlowListener
    void on_state_changed(flows::TransferFlow::State new_state) override;
    void on_transfer_request(const flows::Transfer &transfer) override;
    void on_transfer_accepted(const flows::Transfer &transfer) override;
    void on_transfer_rejected(const flows::Transfer &transfer) override;
    void on_transfer_completed(const flows::Transfer &transfer) override;
    void on_transfer_failed(const flows::Transfer &transfer, const std::string &error) override;

private:
    OnStateChangedCb  on_state_changed_cb_;
    OnTransferCb      on_transfer_request_cb_;
    OnTransferCb      on_transfer_accepted_cb_;
    OnTransferCb      on_transfer_rejected_cb_;
    OnTransferCb      on_transfer_completed_cb_;
    OnTransferErrorCb on_transfer_failed_cb_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_TRANSFERFLOWLISTENERDELEGATE_HPP_
