#include "config.hpp"

#include "configloader.hpp"

namespace lanshare::config
{
Config::Config(const ConfigLoader &              config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    for (auto &[name, value] : config_loader.load())
    {
        ConfigKey key {name};
        if (key == ConfigKey::KEY_COUNT)
        {
            LOG(WARNING) << "Ignoring unknown config key " << name;
            continue;
        }
        values_[key] = std::move(value);
    }
}
}  // namespace lanshare::config
