#include "configkeys.hpp"

namespace lanshare::config
{
ConfigKey::ConfigKey(const std::string &str_key)
    : key_ {KEY_COUNT}
{
    for (int k = FIRST_KEY; k != KEY_COUNT; ++k)
    {
        if (str_key == string_vals[k])
        {
            key_ = EnumType(k);
            break;
        }
    }
}
}  // namespace lanshare::config
