#ifndef LANSHARE_CONFIG_CONFIGLOADER_HPP_
#define LANSHARE_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace lanshare::config
{
/// Source of raw settings. Values are std::string, long long or bool; the key names are checked
/// later by Config.
class ConfigLoader
{
public:
    using Values = std::map<std::string, std::any>;

    virtual ~ConfigLoader() = default;

    /// An unreadable source yields no values, never an error.
    [[nodiscard]] virtual Values load() const = 0;
};
}  // namespace lanshare::config

#endif  // LANSHARE_CONFIG_CONFIGLOADER_HPP_
