#ifndef LANSHARE_API_DEFAULTCONFIGVALUES_HPP_
#define LANSHARE_API_DEFAULTCONFIGVALUES_HPP_

#include <string>

#include <nlohmann/json.hpp>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace lanshare
{
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    explicit DefaultConfigValues(const std::string &app_data_dir_path);
    [[nodiscard]] std::any get(const config::ConfigKey &key) const override;

    /// Every default under its config file name, as written to a fresh config file.
    [[nodiscard]] nlohmann::json to_json() const;

private:
    const std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace lanshare

#endif  // LANSHARE_API_DEFAULTCONFIGVALUES_HPP_
