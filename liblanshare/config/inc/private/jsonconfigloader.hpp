#ifndef LANSHARE_CONFIG_JSONCONFIGLOADER_HPP_
#define LANSHARE_CONFIG_JSONCONFIGLOADER_HPP_

#include "configloader.hpp"

namespace lanshare::config
{
/// Reads config.json. Objects only group settings: {"discovery": {"sweep_period": 1000}} yields
/// the key "sweep_period". Values of any other JSON type than string, integer or boolean are
/// skipped with a warning.
class JSONConfigLoader : public ConfigLoader
{
public:
    explicit JSONConfigLoader(std::string config_file_path);

    [[nodiscard]] Values load() const override;

private:
    const std::string config_file_path_;
};
}  // namespace lanshare::config

#endif  // LANSHARE_CONFIG_JSONCONFIGLOADER_HPP_
