#ifndef LANSHARE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define LANSHARE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

#include "configkeys.hpp"

namespace lanshare::config
{
/// Answers for keys the configuration file leaves out or gets wrong.
class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    /// Empty std::any when there is no default for key.
    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace lanshare::config

#endif  // LANSHARE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
