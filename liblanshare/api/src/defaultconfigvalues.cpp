#include "defaultconfigvalues.hpp"

#include <filesystem>
#include <typeinfo>

#include <glog/logging.h>

namespace
{
std::string path_join(const std::string &directory, const std::string &file_name)
{
    return (std::filesystem::path {directory} / file_name).string();
}
}  // namespace

namespace lanshare
{
DefaultConfigValues::DefaultConfigValues(const std::string &app_data_dir_path)
    : default_values_ {/* PORT */ 8080LL,
          /* DEVICE_NAME */ std::string {} /* = user@hostname */,
          /* SWEEP_PERIOD */ 5000LL /* = 5 seconds */,
          /* PROBE_TIMEOUT */ 2000LL /* = 2 seconds */,
          /* REAPER_PERIOD */ 30000LL /* = 30 seconds */,
          /* LIVENESS_THRESHOLD */ 60000LL /* = 1 minute */,
          /* RETENTION_THRESHOLD */ 300000LL /* = 5 minutes */,
          /* CONTROL_TIMEOUT */ 10000LL /* = 10 seconds */,
          /* DATA_TIMEOUT */ 30000LL /* = 30 seconds */,
          /* STAGING_DIR */ path_join(app_data_dir_path, "staging"),
          /* INBOX_DIR */ path_join(app_data_dir_path, "inbox"),
          /* MAX_BODY_SIZE */ 1LL * 1024 * 1024 * 1024 /* = 1 GiB */,
          /* SUBSCRIBER_QUEUE_SIZE */ 256LL}
{}

std::any DefaultConfigValues::get(const config::ConfigKey &key) const
{
    if (key < config::ConfigKey::FIRST_KEY || key >= config::ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid config key " << int(key);
        return {};
    }
    return default_values_[key];
}

nlohmann::json DefaultConfigValues::to_json() const
{
    nlohmann::json result = nlohmann::json::object();
    for (int i = config::ConfigKey::FIRST_KEY; i != config::ConfigKey::KEY_COUNT; ++i)
    {
        config::ConfigKey key {static_cast<config::ConfigKey::EnumType>(i)};
        const auto &      value = default_values_[key];
        if (value.type() == typeid(long long))
        {
            result[key.to_string()] = std::any_cast<long long>(value);
        }
        else if (value.type() == typeid(std::string))
        {
            result[key.to_string()] = std::any_cast<std::string>(value);
        }
        else
        {
            LOG(ERROR) << "Default of " << key.to_string() << " has unsupported type "
                       << value.type().name();
        }
    }
    return result;
}
}  // namespace lanshare
