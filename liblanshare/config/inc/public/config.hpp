#ifndef LANSHARE_CONFIG_CONFIG_HPP_
#define LANSHARE_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <typeinfo>

#include <glog/logging.h>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace lanshare::config
{
// Forward declarations
class ConfigLoader;

/// Snapshot of the node settings. Values missing from the loaded configuration, or stored with
/// the wrong type, are taken from the fallback provider.
class Config
{
public:
    explicit Config(const ConfigLoader &             config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] std::string get_string(ConfigKey key) const
    {
        return get<std::string>(key);
    }

    [[nodiscard]] long long get_integer(ConfigKey key) const
    {
        return get<long long>(key);
    }

    /// Integer value interpreted as a number of milliseconds.
    [[nodiscard]] std::chrono::milliseconds get_duration(ConfigKey key) const
    {
        return std::chrono::milliseconds {get_integer(key)};
    }

private:
    template<typename T>
    [[nodiscard]] T get(ConfigKey key) const
    {
        if (key < ConfigKey::FIRST_KEY || key >= ConfigKey::KEY_COUNT)
        {
            LOG(FATAL) << "Invalid config key " << int(key);
        }

        const auto &val = values_[key];
        if (!val.has_value())
        {
            return get_fallback_value<T>(key);
        }

        if (val.type() != typeid(T))
        {
            LOG(ERROR) << "Config value " << key.to_string() << " has type " << val.type().name()
                       << ", expected " << typeid(T).name();
            return get_fallback_value<T>(key);
        }

        return std::any_cast<T>(val);
    }

    template<typename T>
    [[nodiscard]] T get_fallback_value(ConfigKey key) const
    {
        if (!fallback_value_provider_)
        {
            LOG(FATAL) << "No value for " << key.to_string() << " and no fallback provider";
        }

        std::any val = fallback_value_provider_->get(key);
        if (!val.has_value() || val.type() != typeid(T))
        {
            LOG(FATAL) << "No usable fallback value for " << key.to_string();
        }

        return std::any_cast<T>(val);
    }

    std::array<std::any, ConfigKey::KEY_COUNT> values_;
    // shared so that Config stays copyable
    const std::shared_ptr<FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace lanshare::config

#endif  // LANSHARE_CONFIG_CONFIG_HPP_
