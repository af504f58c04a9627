#ifndef LANSHARE_API_LANSHARENODE_HPP_
#define LANSHARE_API_LANSHARENODE_HPP_

#include <memory>
#include <string>

#include "lanshareapidefs.h"

namespace lanshare
{
// Forward declarations
class LanShareNodeImpl;

/// A LanShare node: discovers peers on the local network, exchanges files with them and serves
/// the local observer interface over HTTP.
class LANSHARE_API LanShareNode
{
public:
    /// config_file_name is looked up inside app_data_dir_path.
    LanShareNode(const std::string &app_data_dir_path, const std::string &config_file_name);
    LanShareNode(LanShareNode &&other) noexcept;
    LanShareNode &operator=(LanShareNode &&rhs) noexcept;
    ~LanShareNode();

    bool start();
    bool stop();

    [[nodiscard]] std::string    device_name() const;
    [[nodiscard]] unsigned short port() const;

    /// Contents of a config file holding every default, as JSON text.
    static std::string default_configuration(const std::string &app_data_dir_path);

private:
    std::unique_ptr<LanShareNodeImpl> impl_;
};
}  // namespace lanshare

#endif  // LANSHARE_API_LANSHARENODE_HPP_
