#include "transferflowlistenerdelegate.hpp"

namespace lanshare
{
void TransferFlowListenerDelegate::register_as_listener(flows::TransferFlow &flow)
{
    flow.register_listener(shared_from_this());
}

void TransferFlowListenerDelegate::unregister_as_listener(flows::TransferFlow &flow)
{
    flow.unregister_listener(shared_from_this());
}

void TransferFlowListenerDelegate::set_on_state_changed_cb(OnStateChangedCb &&cb)
{
    on_state_changed_cb_ = std::move(cb);
}

void TransferFlowListenerDelegate::set_on_transfer_request_cb(OnTransferCb &&cb)
{
    on_transfer_request_cb_ = std::move(cb);
}

void TransferFlowListenerDelegate::set_on_transfer_accepted_cb(OnTransferCb &&cb)
{
    on_transfer_accepted_cb_ = std::move(cb);
}

void TransferFlowListenerDelegate::set_on_transfer_rejected_cb(OnTransferCb &&cb)
{
    on_transfer_rejected_cb_ = std::move(cb);
}

void TransferFlowListenerDelegate::set_on_transfer_completed_cb(OnTransferCb &&cb)
{
    on_transfer_completed_cb_ = std::move(cb);
}

void TransferFlowListenerDelegate::set_on_transfer_failed_cb(OnTransferErrorCb &&cb)
{
    on_transfer_failed_cb_ = std::move(cb);
}

void TransferFlowListenerDelegate::on_state_changed(flows::TransferFlow::State new_state)
{
    if (on_state_changed_cb_)
    {
        on_state_changed_cb_(new_state);
    }
}

void TransferFlowListenerDelegate::on_transfer_request(const flows::Transfer &transfer)
{
    if (on_transfer_request_cb_)
    {
        on_transfer_request_cb_(transfer);
    }
}

void TransferFlowListenerDelegate::on_transfer_accepted(const flows::Transfer &transfer)
{
    if (on_transfer_accepted_cb_)
    {
        on_transfer_accepted_cb_(transfer);
    }
}

void TransferFlowListenerDelegate::on_transfer_rejected(const flows::Transfer &transfer)
{
    if (on_transfer_rejected_cb_)
    {
        on_transfer_rejected_cb_(transfer);
    }
}

void TransferFlowListenerDelegate::on_transfer_completed(const flows::Transfer &transfer)
{
    if (on_transfer_completed_cb_)
    {
        on_transfer_completed_cb_(transfer);
    }
}

void TransferFlowListenerDelegate::on_transfer_failed(
    const flows::Transfer &transfer, const std::string &error)
{
    if (on_transfer_failed_cb_)
    {
        on_transfer_failed_cb_(transfer, error);
    }
}
}  // namespace lanshare
