#ifndef LANSHARE_FLOWS_TRANSFERFLOWLISTENER_HPP_
#define LANSHARE_FLOWS_TRANSFERFLOWLISTENER_HPP_

#include <string>

#include "transfer.hpp"
#include "transferflow.hpp"

namespace lanshare::flows
{
class TransferFlowListener
{
public:
    virtual ~TransferFlowListener() = default;

    virtual void on_state_changed(TransferFlow::State new_state)                        = 0;
    virtual void on_transfer_request(const Transfer &transfer)                          = 0;
    virtual void on_transfer_accepted(const Transfer &transfer)                         = 0;
    virtual void on_transfer_rejected(const Transfer &transfer)                         = 0;
    virtual void on_transfer_completed(const Transfer &transfer)                        = 0;
    virtual void on_transfer_failed(const Transfer &transfer, const std::string &error) = 0;
};
}  // namespace lanshare::flows

#endif  // LANSHARE_FLOWS_TRANSFERFLOWLISTENER_HPP_
