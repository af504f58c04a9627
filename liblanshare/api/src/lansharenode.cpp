#include "lansharenode.hpp"

#include "defaultconfigvalues.hpp"
#include "lansharenodeimpl.hpp"

namespace lanshare
{
LanShareNode::LanShareNode(
    const std::string &app_data_dir_path, const std::string &config_file_name)
    : impl_ {std::make_unique<LanShareNodeImpl>(app_data_dir_path, config_file_name)}
{}

LanShareNode::LanShareNode(LanShareNode &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

LanShareNode &LanShareNode::operator=(LanShareNode &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

LanShareNode::~LanShareNode() = default;

bool LanShareNode::start()
{
    return impl_->start();
}

bool LanShareNode::stop()
{
    return impl_->stop();
}

std::string LanShareNode::device_name() const
{
    return impl_->device_name();
}

unsigned short LanShareNode::port() const
{
    return impl_->port();
}

std::string LanShareNode::default_configuration(const std::string &app_data_dir_path)
{
    return DefaultConfigValues {app_data_dir_path}.to_json().dump(4);
}
}  // namespace lanshare
